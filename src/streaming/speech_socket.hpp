#pragma once

#include "transcription/provider.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>

// One persistent bidirectional session with the speech endpoint.
// A socket serves a single attempt and is never reopened.
class SpeechSocket {
public:
    virtual ~SpeechSocket() = default;

    virtual std::expected<void, TranscriptionError>
        open(const std::string& host, const std::string& target) = 0;
    virtual std::expected<void, TranscriptionError> send_binary(std::span<const uint8_t> message) = 0;
    // Next message as text. Fails with ErrorKind::Timeout when none arrives within `timeout`.
    virtual std::expected<std::string, TranscriptionError>
        receive(std::chrono::milliseconds timeout) = 0;
    // Idempotent.
    virtual void close() = 0;
};

using SpeechSocketFactory = std::function<std::unique_ptr<SpeechSocket>()>;
