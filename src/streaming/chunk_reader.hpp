#pragma once

#include "transcription/provider.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <fstream>
#include <string>
#include <vector>

// Reads a file lazily as fixed-size blocks. The file is opened on the first
// next() call; rewind() restarts the sequence from the beginning.
class ChunkReader {
public:
    ChunkReader(std::string path, size_t chunk_size);

    // Up to chunk_size bytes; an empty vector marks end of input.
    std::expected<std::vector<uint8_t>, TranscriptionError> next();
    void rewind();

    size_t chunk_size() const { return chunk_size_; }

private:
    std::string path_;
    size_t chunk_size_;
    std::ifstream in_;
};
