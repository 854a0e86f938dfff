#pragma once

#include "config.hpp"
#include "net/http_client.hpp"
#include "transcription_jobs.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Amazon Transcribe JSON 1.1 API over an HttpClient, SigV4-signed.
class AwsTranscribeJobs : public TranscriptionJobs {
public:
    AwsTranscribeJobs(HttpClient& http, Config::Aws aws);

    std::expected<void, TranscriptionError>
        start_job(const std::string& job_name, const std::string& media_uri,
                  const std::string& media_format, const std::string& language_code) override;

    std::expected<TranscriptionJob, TranscriptionError>
        get_job(const std::string& job_name) override;

    static nlohmann::json start_job_body(const std::string& job_name, const std::string& media_uri,
                                         const std::string& media_format,
                                         const std::string& language_code);

    // Parses a GetTranscriptionJob response document.
    static std::expected<TranscriptionJob, TranscriptionError>
        parse_job(const nlohmann::json& doc);

private:
    std::expected<nlohmann::json, TranscriptionError>
        call(const std::string& action, const nlohmann::json& body);

    HttpClient& http_;
    Config::Aws aws_;
};
