#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

enum class ErrorKind {
    Transport, // network or connection failure, unexpected HTTP status
    Auth,      // credentials rejected by the remote service
    Timeout,   // bounded wait exceeded without a terminal result
    Protocol,  // response does not match the expected schema
    Io,        // local failure: empty payload, scratch file, codec
};

struct TranscriptionError {
    ErrorKind kind;
    std::string message;
};

inline std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Io: return "io";
    }
    return "unknown";
}

inline std::unexpected<TranscriptionError> fail(ErrorKind kind, std::string message) {
    return std::unexpected(TranscriptionError{kind, std::move(message)});
}

// std::nullopt means the attempt finished normally but nothing was recognized.
using Transcript = std::optional<std::string>;
using TranscribeResult = std::expected<Transcript, TranscriptionError>;

class TranscriptionProvider {
public:
    virtual ~TranscriptionProvider() = default;
    virtual TranscribeResult transcribe(std::span<const uint8_t> audio) = 0;
    virtual std::string_view name() const = 0;
};
