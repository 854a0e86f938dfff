#include "random_token.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <openssl/err.h>
#include <openssl/rand.h>

std::expected<std::string, TranscriptionError> random_hex_token() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        return fail(ErrorKind::Io, std::string("RAND_bytes failed: ") + reason);
    }

    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out += std::format("{:02x}", static_cast<unsigned>(b));
    }
    return out;
}
