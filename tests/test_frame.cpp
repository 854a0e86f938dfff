#include <catch2/catch_test_macros.hpp>

#include "streaming/frame.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using json = nlohmann::json;

TEST_CASE("frame::encode", "[frame]") {
    std::vector<uint8_t> audio = {0x52, 0x49, 0x46, 0x46, 0x00, 0xff};
    std::string ts = "2024-05-01T09:30:00.123456Z";

    SECTION("LengthPrefixIsBigEndianHeaderSize") {
        auto msg = frame::encode("abc123", ts, audio);
        REQUIRE(msg);
        auto header = frame::header_text("abc123", ts);
        uint16_t len = static_cast<uint16_t>(((*msg)[0] << 8) | (*msg)[1]);
        REQUIRE(len == header.size());
        REQUIRE(msg->size() == 2 + header.size() + audio.size());
    }

    SECTION("HeaderTextLayout") {
        auto header = frame::header_text("abc123", ts);
        REQUIRE(header ==
                "X-RequestId: abc123\r\n"
                "X-Timestamp: 2024-05-01T09:30:00.123456Z\r\n"
                "Path: audio\r\n"
                "Content-Type: audio/x-wav\r\n\r\n");
    }

    SECTION("DecodeRecoversHeaderAndPayload") {
        auto msg = frame::encode("abc123", ts, audio);
        REQUIRE(msg);
        auto decoded = frame::decode(*msg);
        REQUIRE(decoded);
        REQUIRE(decoded->header.request_id == "abc123");
        REQUIRE(decoded->header.timestamp == ts);
        REQUIRE(decoded->header.path == "audio");
        REQUIRE(decoded->header.content_type == "audio/x-wav");
        REQUIRE(decoded->payload == audio);
    }

    SECTION("EmptyPayloadAllowed") {
        auto msg = frame::encode("r", ts, {});
        REQUIRE(msg);
        auto decoded = frame::decode(*msg);
        REQUIRE(decoded);
        REQUIRE(decoded->payload.empty());
    }
}

TEST_CASE("frame::decode errors", "[frame]") {

    SECTION("TooShortForPrefix") {
        std::vector<uint8_t> msg = {0x00};
        auto decoded = frame::decode(msg);
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().kind == ErrorKind::Protocol);
    }

    SECTION("DeclaredHeaderLongerThanMessage") {
        std::vector<uint8_t> msg = {0x00, 0x40, 'P', 'a', 't', 'h'};
        auto decoded = frame::decode(msg);
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().kind == ErrorKind::Protocol);
    }

    SECTION("HeaderLineWithoutColon") {
        std::string header = "garbage\r\n\r\n";
        std::vector<uint8_t> msg = {0x00, static_cast<uint8_t>(header.size())};
        msg.insert(msg.end(), header.begin(), header.end());
        auto decoded = frame::decode(msg);
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().kind == ErrorKind::Protocol);
    }
}

TEST_CASE("frame::utc_timestamp", "[frame]") {
    auto ts = frame::utc_timestamp();
    // YYYY-MM-DDTHH:MM:SS.ffffffZ
    REQUIRE(ts.size() == 27);
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts[19] == '.');
    REQUIRE(ts.back() == 'Z');
}

TEST_CASE("frame::extract_json_body", "[frame]") {

    SECTION("HeadersThenBody") {
        auto body = frame::extract_json_body(
            "X-RequestId: abc\r\nPath: speech.phrase\r\n\r\n{\"RecognitionStatus\":\"Success\"}");
        REQUIRE(body);
        REQUIRE(body->at("RecognitionStatus").get<std::string>() == "Success");
    }

    SECTION("LeadingSeparatorWithoutHeaders") {
        auto body = frame::extract_json_body("\r\n{\"a\":1}");
        REQUIRE(body);
        REQUIRE(body->at("a").get<int>() == 1);
    }

    SECTION("NoSeparator") {
        auto body = frame::extract_json_body("{\"a\":1}");
        REQUIRE_FALSE(body);
        REQUIRE(body.error().kind == ErrorKind::Protocol);
    }

    SECTION("BodyNotJson") {
        auto body = frame::extract_json_body("Path: turn.end\r\n\r\nnot json");
        REQUIRE_FALSE(body);
        REQUIRE(body.error().kind == ErrorKind::Protocol);
    }
}

TEST_CASE("frame::classify", "[frame]") {

    SECTION("SuccessNormalizesFirstCandidate") {
        auto result = frame::classify(json::parse(
            R"({"RecognitionStatus":"Success","NBest":[{"Display":"Three one nine."},{"Display":"319"}]})"));
        auto* success = std::get_if<RecognitionSuccess>(&result);
        REQUIRE(success);
        REQUIRE(success->text == "three one nine");
    }

    SECTION("EndOfDictation") {
        auto result = frame::classify(json::parse(R"({"RecognitionStatus":"EndOfDictation"})"));
        REQUIRE(std::holds_alternative<RecognitionEndOfInput>(result));
    }

    SECTION("HypothesisWithoutStatusKeepsReading") {
        auto result = frame::classify(json::parse(R"({"Text":"three one"})"));
        REQUIRE(std::holds_alternative<RecognitionInProgress>(result));
    }

    SECTION("OtherStatusKeepsReading") {
        auto result = frame::classify(json::parse(R"({"RecognitionStatus":"InitialSilenceTimeout"})"));
        auto* progress = std::get_if<RecognitionInProgress>(&result);
        REQUIRE(progress);
        REQUIRE(progress->status == "InitialSilenceTimeout");
    }

    SECTION("SuccessWithoutNBestIsMalformed") {
        auto result = frame::classify(json::parse(R"({"RecognitionStatus":"Success"})"));
        REQUIRE(std::holds_alternative<RecognitionMalformed>(result));
    }

    SECTION("SuccessWithEmptyNBestIsMalformed") {
        auto result = frame::classify(json::parse(R"({"RecognitionStatus":"Success","NBest":[]})"));
        REQUIRE(std::holds_alternative<RecognitionMalformed>(result));
    }

    SECTION("NonObjectBody") {
        auto result = frame::classify(json::parse("[1,2,3]"));
        REQUIRE(std::holds_alternative<RecognitionMalformed>(result));
    }
}
