#pragma once

#include "transcription/provider.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Binary audio message of the dictation WebSocket protocol:
//
//   [u16 big-endian header length][header text][audio bytes]
//
// The header text is CRLF-separated "Name: value" lines ending in an empty line.
struct FrameHeader {
    uint16_t length = 0; // byte length of the header text
    std::string request_id;
    std::string timestamp;
    std::string path;
    std::string content_type;
};

struct DecodedFrame {
    FrameHeader header;
    std::vector<uint8_t> payload;
};

struct RecognitionSuccess {
    std::string text; // normalized NBest[0].Display
};
struct RecognitionEndOfInput {};
struct RecognitionInProgress {
    std::string status; // RecognitionStatus, empty for hypothesis frames
};
struct RecognitionMalformed {
    std::string reason;
};

using RecognitionResult = std::variant<RecognitionSuccess, RecognitionEndOfInput,
                                       RecognitionInProgress, RecognitionMalformed>;

namespace frame {

inline constexpr std::string_view kAudioPath = "audio";
inline constexpr std::string_view kWaveContentType = "audio/x-wav";

// ISO-8601 UTC with microseconds, e.g. 2024-05-01T09:30:00.123456Z
std::string utc_timestamp();

std::string header_text(std::string_view request_id, std::string_view timestamp);

std::expected<std::vector<uint8_t>, TranscriptionError>
encode(std::string_view request_id, std::string_view timestamp, std::span<const uint8_t> payload);

std::expected<DecodedFrame, TranscriptionError> decode(std::span<const uint8_t> message);

// Text responses carry a header block, an empty line, then a JSON body.
std::expected<nlohmann::json, TranscriptionError> extract_json_body(std::string_view message);

RecognitionResult classify(const nlohmann::json& body);

} // namespace frame
