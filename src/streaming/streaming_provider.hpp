#pragma once

#include "speech_socket.hpp"
#include "transcoder.hpp"
#include "transcription/provider.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

struct StreamingSettings {
    std::string host = "speech.platform.bing.com";
    std::string path = "/speech/recognition/dictation/cognitiveservices/v1";
    std::string language = "en-US";
    std::string subscription_key;
    size_t chunk_bytes = 8192;
    std::chrono::milliseconds timeout{15000};
    std::string scratch_dir = "/tmp/clipscribe";
};

// Identifiers correlating every frame of one attempt.
struct StreamingSession {
    std::string connection_id;
    std::string request_id;
};

// mp3 -> wav on the worker pool, then a dictation WebSocket session:
// all audio frames are sent first, then responses are read until a
// terminal recognition event or the timeout.
class StreamingProvider : public TranscriptionProvider {
public:
    StreamingProvider(SpeechSocketFactory sockets, std::unique_ptr<AudioTranscoder> transcoder,
                      WorkerPool& pool, StreamingSettings settings, bool verbose = false);

    TranscribeResult transcribe(std::span<const uint8_t> audio) override;
    std::string_view name() const override { return "streaming"; }

    // Request target (path and query) carrying language, key and connection id.
    static std::string session_target(const StreamingSettings& settings,
                                      const std::string& connection_id);

private:
    std::expected<size_t, TranscriptionError>
        send_audio(SpeechSocket& socket, const StreamingSession& session,
                   const std::string& wav_path);

    TranscribeResult await_recognition(SpeechSocket& socket);

    void log(const std::string& msg);

    SpeechSocketFactory sockets_;
    std::unique_ptr<AudioTranscoder> transcoder_;
    WorkerPool& pool_;
    StreamingSettings settings_;
    bool verbose_;
};
