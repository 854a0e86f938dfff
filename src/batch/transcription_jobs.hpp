#pragma once

#include "transcription/provider.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>

enum class JobStatus { Running, Completed, Failed };

struct TranscriptionJob {
    std::string job_name;
    std::string resource_key;
    std::chrono::system_clock::time_point submitted_at;
    JobStatus status = JobStatus::Running;
    std::optional<std::string> transcript_uri;

    bool terminal() const { return status != JobStatus::Running; }
};

// Asynchronous batch transcription service. Only the remote side mutates a job.
class TranscriptionJobs {
public:
    virtual ~TranscriptionJobs() = default;

    virtual std::expected<void, TranscriptionError>
        start_job(const std::string& job_name, const std::string& media_uri,
                  const std::string& media_format, const std::string& language_code) = 0;

    // Fills status and transcript_uri; the caller keeps the other fields.
    virtual std::expected<TranscriptionJob, TranscriptionError>
        get_job(const std::string& job_name) = 0;
};
