#pragma once

#include "transcription/provider.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    std::string_view body;            // not owned, must outlive perform()

    // SigV4 signing, e.g. "aws:amz:us-east-1:s3". Empty sends the request unsigned.
    std::string aws_sigv4;
    std::string access_key_id;
    std::string secret_access_key;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// 401/403 mean the credentials were rejected, everything else is a transport failure.
inline ErrorKind classify_http_status(long status) {
    if (status == 401 || status == 403) return ErrorKind::Auth;
    return ErrorKind::Transport;
}

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Fails only when no HTTP response was received; non-2xx statuses are returned.
    virtual std::expected<HttpResponse, TranscriptionError> perform(const HttpRequest& req) = 0;

    std::expected<HttpResponse, TranscriptionError> get(const std::string& url) {
        HttpRequest req;
        req.url = url;
        return perform(req);
    }
};
