#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    std::string provider = "batch"; // "batch" or "streaming"

    struct Aws {
        std::string access_key_id;
        std::string secret_access_key;
        std::string session_token;
        std::string region = "us-east-1";
        std::string bucket;
        std::string media_format = "mp3";
        std::string language_code = "en-US";
        uint32_t poll_interval_ms = 1000;
        uint32_t job_timeout_s = 60;

        std::chrono::milliseconds poll_interval() const {
            return std::chrono::milliseconds(poll_interval_ms);
        }
        std::chrono::milliseconds job_timeout() const {
            return std::chrono::seconds(job_timeout_s);
        }
    } aws;

    struct Speech {
        std::string subscription_key;
        std::string host = "speech.platform.bing.com";
        std::string path = "/speech/recognition/dictation/cognitiveservices/v1";
        std::string language = "en-US";
        uint32_t chunk_bytes = 8192;
        uint32_t timeout_s = 15;
        std::string ffmpeg = "ffmpeg";

        std::chrono::milliseconds timeout() const {
            return std::chrono::seconds(timeout_s);
        }
    } speech;

    struct Runner {
        uint32_t max_concurrent = 4;
        uint32_t transcode_workers = 2;
    } runner;

    static Config load(const std::string& path);
    static Config load_default();

    // Credentials from the environment win over the file.
    void apply_env();

    // Problems that would make every attempt fail, empty when usable.
    std::vector<std::string> validate() const;
};
