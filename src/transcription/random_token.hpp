#pragma once

#include "provider.hpp"

#include <expected>
#include <string>

// 128 random bits from OpenSSL's CSPRNG, as 32 lower-case hex characters.
// Used for job names, object keys, connection and request ids. Fails with
// ErrorKind::Io when the CSPRNG cannot produce output.
std::expected<std::string, TranscriptionError> random_hex_token();
