#include "streaming_provider.hpp"

#include "chunk_reader.hpp"
#include "frame.hpp"
#include "scratch_file.hpp"
#include "transcription/random_token.hpp"

#include <cctype>
#include <filesystem>
#include <format>
#include <print>
#include <variant>

namespace {

std::string percent_encode(std::string_view s) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += std::format("%{:02X}", static_cast<unsigned>(c));
        }
    }
    return out;
}

// Closes the session on every exit path of an attempt.
class SessionCloser {
public:
    explicit SessionCloser(SpeechSocket& socket) : socket_(socket) {}
    ~SessionCloser() { socket_.close(); }

    SessionCloser(const SessionCloser&) = delete;
    SessionCloser& operator=(const SessionCloser&) = delete;

private:
    SpeechSocket& socket_;
};

} // namespace

StreamingProvider::StreamingProvider(SpeechSocketFactory sockets,
                                     std::unique_ptr<AudioTranscoder> transcoder,
                                     WorkerPool& pool, StreamingSettings settings, bool verbose)
    : sockets_(std::move(sockets)), transcoder_(std::move(transcoder)), pool_(pool),
      settings_(std::move(settings)), verbose_(verbose) {}

std::string StreamingProvider::session_target(const StreamingSettings& settings,
                                              const std::string& connection_id) {
    return std::format("{}?language={}&Ocp-Apim-Subscription-Key={}&X-ConnectionId={}&format=detailed",
                       settings.path, percent_encode(settings.language),
                       percent_encode(settings.subscription_key), percent_encode(connection_id));
}

TranscribeResult StreamingProvider::transcribe(std::span<const uint8_t> audio) {
    if (audio.empty()) {
        return fail(ErrorKind::Io, "empty audio");
    }

    auto connection_id = random_hex_token();
    if (!connection_id) return std::unexpected(connection_id.error());
    auto request_id = random_hex_token();
    if (!request_id) return std::unexpected(request_id.error());

    StreamingSession session{
        .connection_id = std::move(*connection_id),
        .request_id = std::move(*request_id),
    };

    auto base = std::filesystem::path(settings_.scratch_dir) / session.connection_id;
    ScratchFile mp3(base.string() + ".mp3");
    ScratchFile wav(base.string() + ".wav");

    auto written = mp3.write(audio);
    if (!written) {
        return std::unexpected(written.error());
    }

    auto converted = pool_.submit([this, &mp3, &wav] {
        return transcoder_->to_wav(mp3.path(), wav.path());
    }).get();
    if (!converted) {
        return std::unexpected(converted.error());
    }

    auto socket = sockets_();
    if (!socket) {
        return fail(ErrorKind::Transport, "no speech socket available");
    }
    SessionCloser closer(*socket);

    auto opened = socket->open(settings_.host, session_target(settings_, session.connection_id));
    if (!opened) {
        return std::unexpected(opened.error());
    }
    log("connected, connection id " + session.connection_id);

    auto sent = send_audio(*socket, session, wav.path());
    if (!sent) {
        return std::unexpected(sent.error());
    }
    log(std::format("sent {} frames for request {}", *sent, session.request_id));

    return await_recognition(*socket);
}

std::expected<size_t, TranscriptionError>
StreamingProvider::send_audio(SpeechSocket& socket, const StreamingSession& session,
                              const std::string& wav_path) {
    ChunkReader reader(wav_path, settings_.chunk_bytes);
    size_t frames = 0;

    while (true) {
        auto chunk = reader.next();
        if (!chunk) {
            return std::unexpected(chunk.error());
        }
        if (chunk->empty()) break;

        auto message = frame::encode(session.request_id, frame::utc_timestamp(), *chunk);
        if (!message) {
            return std::unexpected(message.error());
        }
        auto sent = socket.send_binary(*message);
        if (!sent) {
            return std::unexpected(sent.error());
        }
        ++frames;
    }

    if (frames == 0) {
        return fail(ErrorKind::Io, "transcoder produced an empty file");
    }
    return frames;
}

TranscribeResult StreamingProvider::await_recognition(SpeechSocket& socket) {
    auto deadline = std::chrono::steady_clock::now() + settings_.timeout;
    int received = 0;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return fail(ErrorKind::Timeout,
                        std::format("no recognition result after {}ms ({} frames)",
                                    settings_.timeout.count(), received));
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto message = socket.receive(remaining);
        if (!message) {
            return std::unexpected(message.error());
        }
        ++received;

        auto body = frame::extract_json_body(*message);
        if (!body) {
            return std::unexpected(body.error());
        }

        auto result = frame::classify(*body);
        if (auto* success = std::get_if<RecognitionSuccess>(&result)) {
            log(std::format("recognized after {} frames", received));
            if (success->text.empty()) return std::nullopt;
            return success->text;
        }
        if (std::holds_alternative<RecognitionEndOfInput>(result)) {
            log("end of dictation without a recognition");
            return std::nullopt;
        }
        if (auto* bad = std::get_if<RecognitionMalformed>(&result)) {
            return fail(ErrorKind::Protocol, "recognition response: " + bad->reason);
        }
    }
}

void StreamingProvider::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[clipscribe] streaming: {}", msg);
    }
}
