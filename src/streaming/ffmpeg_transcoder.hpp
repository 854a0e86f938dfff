#pragma once

#include "transcoder.hpp"

#include <string>

// Runs `ffmpeg` to produce 16 kHz mono 16-bit PCM WAV.
class FfmpegTranscoder : public AudioTranscoder {
public:
    explicit FfmpegTranscoder(std::string ffmpeg_path = "ffmpeg");

    std::expected<void, TranscriptionError>
        to_wav(const std::string& input_path, const std::string& output_path) override;

private:
    std::string ffmpeg_path_;
};
