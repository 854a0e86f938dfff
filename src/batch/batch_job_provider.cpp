#include "batch_job_provider.hpp"

#include "transcription/random_token.hpp"
#include "transcription/transcript_text.hpp"

#include <algorithm>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <thread>

using json = nlohmann::json;

namespace {

// Deletes the uploaded object when the attempt leaves scope, whatever the outcome.
class UploadedObject {
public:
    UploadedObject(ObjectStore& store, std::string key)
        : store_(store), key_(std::move(key)) {}

    ~UploadedObject() {
        auto res = store_.remove(key_);
        if (!res) {
            std::println(stderr, "batch: failed to delete {}: {}", key_, res.error().message);
        }
    }

    UploadedObject(const UploadedObject&) = delete;
    UploadedObject& operator=(const UploadedObject&) = delete;

private:
    ObjectStore& store_;
    std::string key_;
};

} // namespace

BatchJobProvider::BatchJobProvider(std::unique_ptr<HttpClient> http,
                                   std::unique_ptr<ObjectStore> store,
                                   std::unique_ptr<TranscriptionJobs> jobs,
                                   BatchSettings settings, bool verbose)
    : http_(std::move(http)), store_(std::move(store)), jobs_(std::move(jobs)),
      settings_(std::move(settings)), verbose_(verbose) {}

BatchJobProvider::~BatchJobProvider() = default;

TranscribeResult BatchJobProvider::transcribe(std::span<const uint8_t> audio) {
    if (audio.empty()) {
        return fail(ErrorKind::Io, "empty audio");
    }

    auto job_name = random_hex_token();
    if (!job_name) return std::unexpected(job_name.error());
    auto object_name = random_hex_token();
    if (!object_name) return std::unexpected(object_name.error());

    TranscriptionJob job;
    job.job_name = std::move(*job_name);
    job.resource_key = *object_name + "." + settings_.media_format;

    auto uploaded = store_->put(job.resource_key, audio);
    if (!uploaded) {
        return std::unexpected(uploaded.error());
    }
    UploadedObject object(*store_, job.resource_key);
    log(std::format("uploaded {} ({} bytes)", job.resource_key, audio.size()));

    auto started = jobs_->start_job(job.job_name, store_->object_uri(job.resource_key),
                                    settings_.media_format, settings_.language_code);
    if (!started) {
        return std::unexpected(started.error());
    }
    job.submitted_at = std::chrono::system_clock::now();
    log("submitted job " + job.job_name);

    auto finished = wait_for_job(std::move(job));
    if (!finished) {
        return std::unexpected(finished.error());
    }

    if (finished->status == JobStatus::Failed || !finished->transcript_uri) {
        log("job " + finished->job_name + " produced no transcript");
        return std::nullopt;
    }

    return fetch_transcript(*finished->transcript_uri);
}

std::expected<TranscriptionJob, TranscriptionError>
BatchJobProvider::wait_for_job(TranscriptionJob job) {
    auto start = std::chrono::steady_clock::now();
    auto deadline = start + settings_.job_timeout;
    int polls = 0;

    while (true) {
        auto current = jobs_->get_job(job.job_name);
        if (!current) {
            return std::unexpected(current.error());
        }
        ++polls;

        job.status = current->status;
        job.transcript_uri = current->transcript_uri;
        if (job.terminal()) {
            auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
            log(std::format("job {} {} after {:.1f}s ({} polls)", job.job_name,
                            job.status == JobStatus::Completed ? "completed" : "failed",
                            elapsed.count(), polls));
            return job;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return fail(ErrorKind::Timeout,
                        std::format("job {} still running after {}ms ({} polls)", job.job_name,
                                    settings_.job_timeout.count(), polls));
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(settings_.poll_interval, remaining));
    }
}

TranscribeResult BatchJobProvider::fetch_transcript(const std::string& uri) {
    auto resp = http_->get(uri);
    if (!resp) {
        return std::unexpected(resp.error());
    }
    if (!resp->ok()) {
        return fail(classify_http_status(resp->status),
                    std::format("transcript fetch: HTTP {}", resp->status));
    }
    return parse_result_document(resp->body);
}

TranscribeResult BatchJobProvider::parse_result_document(const std::string& body) {
    auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        return fail(ErrorKind::Protocol, "transcript document is not JSON");
    }

    if (!doc.is_object() || !doc.contains("results") || !doc["results"].is_object() ||
        !doc["results"].contains("transcripts") || !doc["results"]["transcripts"].is_array()) {
        return fail(ErrorKind::Protocol, "transcript document has no results.transcripts");
    }

    auto& transcripts = doc["results"]["transcripts"];
    if (transcripts.empty()) {
        return std::nullopt;
    }

    auto& first = transcripts[0];
    if (!first.is_object() || !first.contains("transcript") || !first["transcript"].is_string()) {
        return fail(ErrorKind::Protocol, "transcripts[0].transcript is missing");
    }

    auto text = normalize_transcript(first["transcript"].get<std::string>());
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

void BatchJobProvider::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[clipscribe] batch: {}", msg);
    }
}
