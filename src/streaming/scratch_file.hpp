#pragma once

#include "transcription/provider.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <print>
#include <span>
#include <string>
#include <system_error>

// Local file owned by one attempt, removed when the attempt leaves scope.
class ScratchFile {
public:
    explicit ScratchFile(std::string path) : path_(std::move(path)) {}

    ~ScratchFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            std::println(stderr, "scratch: failed to remove {}: {}", path_, ec.message());
        }
    }

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    const std::string& path() const { return path_; }

    std::expected<void, TranscriptionError> write(std::span<const uint8_t> data) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path_).parent_path(), ec);

        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return fail(ErrorKind::Io, "cannot create " + path_);
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out) {
            return fail(ErrorKind::Io, "write " + path_ + " failed");
        }
        return {};
    }

private:
    std::string path_;
};
