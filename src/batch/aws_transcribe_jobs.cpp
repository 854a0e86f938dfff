#include "aws_transcribe_jobs.hpp"
#include "aws_credentials.hpp"

#include <format>

using json = nlohmann::json;

AwsTranscribeJobs::AwsTranscribeJobs(HttpClient& http, Config::Aws aws)
    : http_(http), aws_(std::move(aws)) {}

json AwsTranscribeJobs::start_job_body(const std::string& job_name, const std::string& media_uri,
                                       const std::string& media_format,
                                       const std::string& language_code) {
    return {
        {"TranscriptionJobName", job_name},
        {"Media", {{"MediaFileUri", media_uri}}},
        {"MediaFormat", media_format},
        {"LanguageCode", language_code},
    };
}

std::expected<void, TranscriptionError>
AwsTranscribeJobs::start_job(const std::string& job_name, const std::string& media_uri,
                             const std::string& media_format, const std::string& language_code) {
    auto resp = call("StartTranscriptionJob",
                     start_job_body(job_name, media_uri, media_format, language_code));
    if (!resp) return std::unexpected(resp.error());
    return {};
}

std::expected<TranscriptionJob, TranscriptionError>
AwsTranscribeJobs::get_job(const std::string& job_name) {
    auto resp = call("GetTranscriptionJob", {{"TranscriptionJobName", job_name}});
    if (!resp) return std::unexpected(resp.error());
    return parse_job(*resp);
}

std::expected<TranscriptionJob, TranscriptionError>
AwsTranscribeJobs::parse_job(const json& doc) {
    if (!doc.is_object() || !doc.contains("TranscriptionJob") ||
        !doc["TranscriptionJob"].is_object()) {
        return fail(ErrorKind::Protocol, "transcribe: response has no TranscriptionJob");
    }

    auto& j = doc["TranscriptionJob"];
    TranscriptionJob job;

    try {
        job.job_name = j.value("TranscriptionJobName", "");
        auto status = j.value("TranscriptionJobStatus", "");
        if (status == "COMPLETED") {
            job.status = JobStatus::Completed;
        } else if (status == "FAILED") {
            job.status = JobStatus::Failed;
        } else if (status == "QUEUED" || status == "IN_PROGRESS") {
            job.status = JobStatus::Running;
        } else {
            return fail(ErrorKind::Protocol, "transcribe: unknown job status '" + status + "'");
        }

        if (j.contains("Transcript") && j["Transcript"].is_object()) {
            auto uri = j["Transcript"].value("TranscriptFileUri", "");
            if (!uri.empty()) job.transcript_uri = std::move(uri);
        }
    } catch (const json::exception& e) {
        return fail(ErrorKind::Protocol, std::string("transcribe: ") + e.what());
    }

    return job;
}

std::expected<json, TranscriptionError>
AwsTranscribeJobs::call(const std::string& action, const json& body) {
    auto payload = body.dump();

    HttpRequest req;
    req.method = "POST";
    req.url = std::format("https://transcribe.{}.amazonaws.com/", aws_.region);
    req.body = payload;
    req.headers.push_back("Content-Type: application/x-amz-json-1.1");
    req.headers.push_back("X-Amz-Target: Transcribe." + action);
    sign_aws_request(req, aws_, "transcribe");

    auto resp = http_.perform(req);
    if (!resp) return std::unexpected(resp.error());

    json doc = json::parse(resp->body, nullptr, false);

    if (!resp->ok()) {
        std::string code;
        std::string message;
        // Error bodies are read loosely: a field of the wrong type is left empty
        auto text_field = [&doc](const char* key) -> std::string {
            auto it = doc.find(key);
            return it != doc.end() && it->is_string() ? it->get<std::string>() : "";
        };
        if (doc.is_object()) {
            code = text_field("__type");
            message = text_field("message");
            if (message.empty()) message = text_field("Message");
        }
        auto kind = is_aws_auth_error(code) ? ErrorKind::Auth : classify_http_status(resp->status);
        return fail(kind, std::format("transcribe {}: HTTP {} {} {}", action, resp->status,
                                      code, message));
    }

    if (doc.is_discarded()) {
        return fail(ErrorKind::Protocol, "transcribe " + action + ": response is not JSON");
    }
    return doc;
}
