#pragma once

#include "config.hpp"
#include "net/http_client.hpp"
#include "object_store.hpp"

#include <string>

// S3 REST (path-style addressing) over an HttpClient, SigV4-signed.
class S3ObjectStore : public ObjectStore {
public:
    S3ObjectStore(HttpClient& http, Config::Aws aws);

    std::expected<void, TranscriptionError>
        put(const std::string& key, std::span<const uint8_t> data) override;
    std::expected<void, TranscriptionError> remove(const std::string& key) override;
    std::string object_uri(const std::string& key) const override;

    // MIME type sent with an upload of the given Transcribe media format.
    static std::string content_type(const std::string& media_format);

    // Pulls <Code> out of an S3 XML error document.
    static std::string error_code(const std::string& body);

private:
    std::expected<void, TranscriptionError> check(const HttpResponse& resp,
                                                  const std::string& what) const;

    HttpClient& http_;
    Config::Aws aws_;
};
