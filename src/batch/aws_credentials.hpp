#pragma once

#include "config.hpp"
#include "net/http_client.hpp"

#include <string>
#include <string_view>

// Signs `req` for `service` in the configured region and attaches the
// session token when temporary credentials are in use.
inline void sign_aws_request(HttpRequest& req, const Config::Aws& aws, std::string_view service) {
    req.aws_sigv4 = "aws:amz:" + aws.region + ":" + std::string(service);
    req.access_key_id = aws.access_key_id;
    req.secret_access_key = aws.secret_access_key;
    if (!aws.session_token.empty()) {
        req.headers.push_back("x-amz-security-token: " + aws.session_token);
    }
}

// AWS error codes that mean the caller's credentials were refused.
inline bool is_aws_auth_error(std::string_view code) {
    return code.find("UnrecognizedClient") != std::string_view::npos ||
           code.find("InvalidSignature") != std::string_view::npos ||
           code.find("AccessDenied") != std::string_view::npos ||
           code.find("SignatureDoesNotMatch") != std::string_view::npos ||
           code.find("InvalidAccessKeyId") != std::string_view::npos ||
           code.find("ExpiredToken") != std::string_view::npos ||
           code.find("InvalidClientTokenId") != std::string_view::npos;
}
