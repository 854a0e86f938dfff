#pragma once

#include "transcription/provider.hpp"

#include <expected>
#include <string>

// Converts the caller's compressed clip into the waveform the speech
// endpoint accepts. CPU-bound, run on the worker pool.
class AudioTranscoder {
public:
    virtual ~AudioTranscoder() = default;
    virtual std::expected<void, TranscriptionError>
        to_wav(const std::string& input_path, const std::string& output_path) = 0;
};
