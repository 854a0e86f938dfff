#pragma once

#include "transcription/provider.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>

class ObjectStore {
public:
    virtual ~ObjectStore() = default;
    virtual std::expected<void, TranscriptionError>
        put(const std::string& key, std::span<const uint8_t> data) = 0;
    virtual std::expected<void, TranscriptionError> remove(const std::string& key) = 0;
    // URI the transcription service reads the object from.
    virtual std::string object_uri(const std::string& key) const = 0;
};
