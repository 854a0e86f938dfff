#include "chunk_reader.hpp"

#include <cerrno>
#include <cstring>

ChunkReader::ChunkReader(std::string path, size_t chunk_size)
    : path_(std::move(path)), chunk_size_(chunk_size == 0 ? 1 : chunk_size) {}

std::expected<std::vector<uint8_t>, TranscriptionError> ChunkReader::next() {
    if (!in_.is_open()) {
        in_.open(path_, std::ios::binary);
        if (!in_.is_open()) {
            return fail(ErrorKind::Io, "open " + path_ + ": " + std::strerror(errno));
        }
    }

    std::vector<uint8_t> chunk(chunk_size_);
    in_.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (in_.bad()) {
        return fail(ErrorKind::Io, "read " + path_ + " failed");
    }
    chunk.resize(static_cast<size_t>(in_.gcount()));
    return chunk;
}

void ChunkReader::rewind() {
    if (in_.is_open()) {
        in_.clear();
        in_.seekg(0);
    }
}
