#pragma once

#include "http_client.hpp"

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long timeout_s = 30);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    std::expected<HttpResponse, TranscriptionError> perform(const HttpRequest& req) override;

private:
    long timeout_s_;
};
