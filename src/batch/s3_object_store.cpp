#include "s3_object_store.hpp"
#include "aws_credentials.hpp"

#include <format>

S3ObjectStore::S3ObjectStore(HttpClient& http, Config::Aws aws)
    : http_(http), aws_(std::move(aws)) {}

std::string S3ObjectStore::object_uri(const std::string& key) const {
    return std::format("https://s3.{}.amazonaws.com/{}/{}", aws_.region, aws_.bucket, key);
}

std::expected<void, TranscriptionError>
S3ObjectStore::put(const std::string& key, std::span<const uint8_t> data) {
    HttpRequest req;
    req.method = "PUT";
    req.url = object_uri(key);
    req.body = std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
    req.headers.push_back("Content-Type: " + content_type(aws_.media_format));
    sign_aws_request(req, aws_, "s3");

    auto resp = http_.perform(req);
    if (!resp) return std::unexpected(resp.error());
    return check(*resp, "put " + key);
}

std::expected<void, TranscriptionError> S3ObjectStore::remove(const std::string& key) {
    HttpRequest req;
    req.method = "DELETE";
    req.url = object_uri(key);
    sign_aws_request(req, aws_, "s3");

    auto resp = http_.perform(req);
    if (!resp) return std::unexpected(resp.error());
    return check(*resp, "delete " + key);
}

std::string S3ObjectStore::content_type(const std::string& media_format) {
    if (media_format == "mp3") return "audio/mpeg";
    if (media_format == "mp4" || media_format == "m4a") return "audio/mp4";
    if (media_format == "wav") return "audio/wav";
    if (media_format == "flac") return "audio/flac";
    if (media_format == "ogg") return "audio/ogg";
    if (media_format == "amr") return "audio/amr";
    if (media_format == "webm") return "audio/webm";
    return "application/octet-stream";
}

std::string S3ObjectStore::error_code(const std::string& body) {
    auto start = body.find("<Code>");
    if (start == std::string::npos) return {};
    start += 6;
    auto end = body.find("</Code>", start);
    if (end == std::string::npos) return {};
    return body.substr(start, end - start);
}

std::expected<void, TranscriptionError>
S3ObjectStore::check(const HttpResponse& resp, const std::string& what) const {
    if (resp.ok()) return {};

    auto code = error_code(resp.body);
    auto kind = is_aws_auth_error(code) ? ErrorKind::Auth : classify_http_status(resp.status);
    return fail(kind, std::format("s3 {}: HTTP {}{}", what, resp.status,
                                  code.empty() ? "" : " " + code));
}
