#include <catch2/catch_test_macros.hpp>

#include "batch/s3_object_store.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

class MockHttpClient : public HttpClient {
public:
    std::expected<HttpResponse, TranscriptionError> perform(const HttpRequest& req) override {
        requests.push_back(req);
        bodies.emplace_back(req.body);
        return next;
    }

    bool has_header(size_t i, const std::string& header) const {
        auto& h = requests.at(i).headers;
        return std::find(h.begin(), h.end(), header) != h.end();
    }

    std::vector<HttpRequest> requests;
    std::vector<std::string> bodies;
    std::expected<HttpResponse, TranscriptionError> next = HttpResponse{200, ""};
};

} // namespace

TEST_CASE("S3ObjectStore", "[s3]") {
    MockHttpClient http;
    Config::Aws aws;
    aws.access_key_id = "AKIDEXAMPLE";
    aws.secret_access_key = "secret";
    aws.region = "eu-west-1";
    aws.bucket = "clips";
    S3ObjectStore store(http, aws);

    std::vector<uint8_t> audio = {'I', 'D', '3', 0x04};

    SECTION("ObjectUriIsPathStyle") {
        REQUIRE(store.object_uri("abc.mp3") == "https://s3.eu-west-1.amazonaws.com/clips/abc.mp3");
    }

    SECTION("PutSignsAndSendsBody") {
        auto res = store.put("abc.mp3", audio);
        REQUIRE(res);
        REQUIRE(http.requests.size() == 1);
        auto& req = http.requests[0];
        REQUIRE(req.method == "PUT");
        REQUIRE(req.url == "https://s3.eu-west-1.amazonaws.com/clips/abc.mp3");
        REQUIRE(req.aws_sigv4 == "aws:amz:eu-west-1:s3");
        REQUIRE(req.access_key_id == "AKIDEXAMPLE");
        REQUIRE(http.bodies[0] == std::string("ID3\x04", 4));
        REQUIRE(http.has_header(0, "Content-Type: audio/mpeg"));
    }

    SECTION("ContentTypeFollowsMediaFormat") {
        Config::Aws flac = aws;
        flac.media_format = "flac";
        S3ObjectStore flac_store(http, flac);
        REQUIRE(flac_store.put("abc.flac", audio));
        REQUIRE(http.has_header(0, "Content-Type: audio/flac"));
        REQUIRE_FALSE(http.has_header(0, "Content-Type: audio/mpeg"));
    }

    SECTION("SessionTokenHeader") {
        aws.session_token = "tok";
        S3ObjectStore with_token(http, aws);
        REQUIRE(with_token.remove("abc.mp3"));
        REQUIRE(http.requests[0].method == "DELETE");
        REQUIRE(http.has_header(0, "x-amz-security-token: tok"));
    }

    SECTION("AccessDeniedIsAuth") {
        http.next = HttpResponse{403, "<Error><Code>AccessDenied</Code><Message>no</Message></Error>"};
        auto res = store.put("abc.mp3", audio);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ErrorKind::Auth);
    }

    SECTION("SignatureMismatchIsAuthEvenWithout403") {
        http.next = HttpResponse{400, "<Error><Code>SignatureDoesNotMatch</Code></Error>"};
        auto res = store.put("abc.mp3", audio);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ErrorKind::Auth);
    }

    SECTION("ServerErrorIsTransport") {
        http.next = HttpResponse{503, "<Error><Code>SlowDown</Code></Error>"};
        auto res = store.remove("abc.mp3");
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ErrorKind::Transport);
        REQUIRE(res.error().message.find("SlowDown") != std::string::npos);
    }

    SECTION("ConnectionFailurePassesThrough") {
        http.next = std::unexpected(TranscriptionError{ErrorKind::Transport, "connection refused"});
        auto res = store.put("abc.mp3", audio);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ErrorKind::Transport);
    }
}

TEST_CASE("S3ObjectStore::content_type", "[s3]") {
    REQUIRE(S3ObjectStore::content_type("mp3") == "audio/mpeg");
    REQUIRE(S3ObjectStore::content_type("wav") == "audio/wav");
    REQUIRE(S3ObjectStore::content_type("m4a") == "audio/mp4");
    REQUIRE(S3ObjectStore::content_type("xyz") == "application/octet-stream");
}

TEST_CASE("S3ObjectStore::error_code", "[s3]") {
    REQUIRE(S3ObjectStore::error_code("<Error><Code>NoSuchBucket</Code></Error>") == "NoSuchBucket");
    REQUIRE(S3ObjectStore::error_code("").empty());
    REQUIRE(S3ObjectStore::error_code("<Error><Code>Truncated").empty());
}
