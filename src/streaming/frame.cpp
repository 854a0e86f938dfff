#include "frame.hpp"

#include "transcription/transcript_text.hpp"

#include <chrono>
#include <format>
#include <limits>

using json = nlohmann::json;

namespace frame {

std::string utc_timestamp() {
    auto now = std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%T}Z", now);
}

std::string header_text(std::string_view request_id, std::string_view timestamp) {
    return std::format("X-RequestId: {}\r\nX-Timestamp: {}\r\nPath: {}\r\nContent-Type: {}\r\n\r\n",
                       request_id, timestamp, kAudioPath, kWaveContentType);
}

std::expected<std::vector<uint8_t>, TranscriptionError>
encode(std::string_view request_id, std::string_view timestamp, std::span<const uint8_t> payload) {
    auto header = header_text(request_id, timestamp);
    if (header.size() > std::numeric_limits<uint16_t>::max()) {
        return fail(ErrorKind::Protocol, "frame header too long");
    }
    auto len = static_cast<uint16_t>(header.size());

    std::vector<uint8_t> out;
    out.reserve(2 + header.size() + payload.size());
    out.push_back(static_cast<uint8_t>(len >> 8));
    out.push_back(static_cast<uint8_t>(len & 0xff));
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::expected<DecodedFrame, TranscriptionError> decode(std::span<const uint8_t> message) {
    if (message.size() < 2) {
        return fail(ErrorKind::Protocol, "frame shorter than its length prefix");
    }

    DecodedFrame out;
    out.header.length = static_cast<uint16_t>((message[0] << 8) | message[1]);
    if (message.size() - 2 < out.header.length) {
        return fail(ErrorKind::Protocol,
                    std::format("frame declares a {} byte header but carries {}",
                                out.header.length, message.size() - 2));
    }

    std::string_view text(reinterpret_cast<const char*>(message.data() + 2), out.header.length);
    while (!text.empty()) {
        auto eol = text.find("\r\n");
        auto line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 2);
        if (line.empty()) break;

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return fail(ErrorKind::Protocol, "frame header line without ':'");
        }
        auto name = line.substr(0, colon);
        auto value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') value.remove_prefix(1);

        if (name == "X-RequestId") out.header.request_id = value;
        else if (name == "X-Timestamp") out.header.timestamp = value;
        else if (name == "Path") out.header.path = value;
        else if (name == "Content-Type") out.header.content_type = value;
    }

    auto body = message.subspan(2 + out.header.length);
    out.payload.assign(body.begin(), body.end());
    return out;
}

std::expected<json, TranscriptionError> extract_json_body(std::string_view message) {
    size_t body_start;
    if (message.starts_with("\r\n")) {
        body_start = 2;
    } else {
        auto sep = message.find("\r\n\r\n");
        if (sep == std::string_view::npos) {
            return fail(ErrorKind::Protocol, "response has no header/body separator");
        }
        body_start = sep + 4;
    }

    auto body = json::parse(message.substr(body_start), nullptr, false);
    if (body.is_discarded()) {
        return fail(ErrorKind::Protocol, "response body is not JSON");
    }
    return body;
}

RecognitionResult classify(const json& body) {
    if (!body.is_object()) {
        return RecognitionMalformed{"body is not an object"};
    }

    auto it = body.find("RecognitionStatus");
    if (it == body.end()) {
        return RecognitionInProgress{};
    }
    if (!it->is_string()) {
        return RecognitionMalformed{"RecognitionStatus is not a string"};
    }

    auto status = it->get<std::string>();
    if (status == "EndOfDictation") {
        return RecognitionEndOfInput{};
    }
    if (status != "Success") {
        return RecognitionInProgress{status};
    }

    auto nbest = body.find("NBest");
    if (nbest == body.end() || !nbest->is_array() || nbest->empty()) {
        return RecognitionMalformed{"Success without NBest candidates"};
    }
    auto& best = (*nbest)[0];
    if (!best.is_object() || !best.contains("Display") || !best["Display"].is_string()) {
        return RecognitionMalformed{"NBest[0].Display is missing"};
    }
    return RecognitionSuccess{normalize_transcript(best["Display"].get<std::string>())};
}

} // namespace frame
