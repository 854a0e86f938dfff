#pragma once

#include "net/http_client.hpp"
#include "object_store.hpp"
#include "transcription/provider.hpp"
#include "transcription_jobs.hpp"

#include <chrono>
#include <memory>
#include <string>

struct BatchSettings {
    std::string media_format = "mp3";
    std::string language_code = "en-US";
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds job_timeout{60000};
};

// Upload -> submit job -> poll -> fetch result document -> delete upload.
// The uploaded object is deleted on every path once the upload succeeded.
class BatchJobProvider : public TranscriptionProvider {
public:
    BatchJobProvider(std::unique_ptr<HttpClient> http, std::unique_ptr<ObjectStore> store,
                     std::unique_ptr<TranscriptionJobs> jobs, BatchSettings settings,
                     bool verbose = false);
    ~BatchJobProvider() override;

    BatchJobProvider(const BatchJobProvider&) = delete;
    BatchJobProvider& operator=(const BatchJobProvider&) = delete;

    TranscribeResult transcribe(std::span<const uint8_t> audio) override;
    std::string_view name() const override { return "batch"; }

    // {"results": {"transcripts": [{"transcript": "..."}]}} -> normalized first transcript
    static TranscribeResult parse_result_document(const std::string& body);

private:
    // Polls immediately, then every poll_interval, until a terminal status or job_timeout.
    std::expected<TranscriptionJob, TranscriptionError> wait_for_job(TranscriptionJob job);

    TranscribeResult fetch_transcript(const std::string& uri);

    void log(const std::string& msg);

    // http_ outlives store_ and jobs_, which may hold a reference to it
    std::unique_ptr<HttpClient> http_;
    std::unique_ptr<ObjectStore> store_;
    std::unique_ptr<TranscriptionJobs> jobs_;
    BatchSettings settings_;
    bool verbose_;
};
