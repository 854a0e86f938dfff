#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("provider")) cfg.provider = j["provider"].get<std::string>();

        if (j.contains("aws")) {
            auto& a = j["aws"];
            if (a.contains("access_key_id")) cfg.aws.access_key_id = a["access_key_id"].get<std::string>();
            if (a.contains("secret_access_key")) cfg.aws.secret_access_key = a["secret_access_key"].get<std::string>();
            if (a.contains("session_token")) cfg.aws.session_token = a["session_token"].get<std::string>();
            if (a.contains("region")) cfg.aws.region = a["region"].get<std::string>();
            if (a.contains("bucket")) cfg.aws.bucket = a["bucket"].get<std::string>();
            if (a.contains("media_format")) cfg.aws.media_format = a["media_format"].get<std::string>();
            if (a.contains("language_code")) cfg.aws.language_code = a["language_code"].get<std::string>();
            if (a.contains("poll_interval_ms")) cfg.aws.poll_interval_ms = a["poll_interval_ms"].get<uint32_t>();
            if (a.contains("job_timeout_s")) cfg.aws.job_timeout_s = a["job_timeout_s"].get<uint32_t>();
        }

        if (j.contains("speech")) {
            auto& s = j["speech"];
            if (s.contains("subscription_key")) cfg.speech.subscription_key = s["subscription_key"].get<std::string>();
            if (s.contains("host")) cfg.speech.host = s["host"].get<std::string>();
            if (s.contains("path")) cfg.speech.path = s["path"].get<std::string>();
            if (s.contains("language")) cfg.speech.language = s["language"].get<std::string>();
            if (s.contains("chunk_bytes")) cfg.speech.chunk_bytes = s["chunk_bytes"].get<uint32_t>();
            if (s.contains("timeout_s")) cfg.speech.timeout_s = s["timeout_s"].get<uint32_t>();
            if (s.contains("ffmpeg")) cfg.speech.ffmpeg = s["ffmpeg"].get<std::string>();
        }

        if (j.contains("runner")) {
            auto& r = j["runner"];
            if (r.contains("max_concurrent")) cfg.runner.max_concurrent = r["max_concurrent"].get<uint32_t>();
            if (r.contains("transcode_workers")) cfg.runner.transcode_workers = r["transcode_workers"].get<uint32_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    auto take = [](const char* name, std::string& field) {
        const char* v = std::getenv(name);
        if (v && *v) field = v;
    };

    take("AWS_ACCESS_KEY_ID", aws.access_key_id);
    take("AWS_SECRET_ACCESS_KEY", aws.secret_access_key);
    take("AWS_SESSION_TOKEN", aws.session_token);
    take("AWS_REGION", aws.region);
    take("CLIPSCRIBE_SPEECH_KEY", speech.subscription_key);
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;

    if (provider == "batch") {
        if (aws.access_key_id.empty() || aws.secret_access_key.empty())
            problems.emplace_back("aws credentials are not set");
        if (aws.bucket.empty()) problems.emplace_back("aws.bucket is not set");
        if (aws.region.empty()) problems.emplace_back("aws.region is not set");
        if (aws.poll_interval_ms == 0) problems.emplace_back("aws.poll_interval_ms must be positive");
    } else if (provider == "streaming") {
        if (speech.subscription_key.empty()) problems.emplace_back("speech.subscription_key is not set");
        if (speech.chunk_bytes == 0) problems.emplace_back("speech.chunk_bytes must be positive");
        if (speech.host.empty()) problems.emplace_back("speech.host is not set");
    } else {
        problems.emplace_back("unknown provider: " + provider);
    }

    if (runner.max_concurrent == 0) problems.emplace_back("runner.max_concurrent must be positive");
    if (runner.transcode_workers == 0) problems.emplace_back("runner.transcode_workers must be positive");

    return problems;
}
