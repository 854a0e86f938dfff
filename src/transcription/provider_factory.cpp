#include "provider_factory.hpp"

#include "batch/aws_transcribe_jobs.hpp"
#include "batch/batch_job_provider.hpp"
#include "batch/s3_object_store.hpp"
#include "net/curl_http_client.hpp"
#include "platform/platform_paths.hpp"
#include "streaming/ffmpeg_transcoder.hpp"
#include "streaming/streaming_provider.hpp"
#include "streaming/websocket_session.hpp"

std::expected<std::unique_ptr<TranscriptionProvider>, std::string>
make_provider(const Config& config, WorkerPool& pool, bool verbose) {
    if (config.provider == "batch") {
        auto http = std::make_unique<CurlHttpClient>();
        auto store = std::make_unique<S3ObjectStore>(*http, config.aws);
        auto jobs = std::make_unique<AwsTranscribeJobs>(*http, config.aws);

        BatchSettings settings{
            .media_format = config.aws.media_format,
            .language_code = config.aws.language_code,
            .poll_interval = config.aws.poll_interval(),
            .job_timeout = config.aws.job_timeout(),
        };
        return std::make_unique<BatchJobProvider>(std::move(http), std::move(store),
                                                  std::move(jobs), std::move(settings), verbose);
    }

    if (config.provider == "streaming") {
        StreamingSettings settings{
            .host = config.speech.host,
            .path = config.speech.path,
            .language = config.speech.language,
            .subscription_key = config.speech.subscription_key,
            .chunk_bytes = config.speech.chunk_bytes,
            .timeout = config.speech.timeout(),
            .scratch_dir = platform::scratch_dir(),
        };
        return std::make_unique<StreamingProvider>(
            [] { return std::make_unique<WebSocketSession>(); },
            std::make_unique<FfmpegTranscoder>(config.speech.ffmpeg), pool,
            std::move(settings), verbose);
    }

    return std::unexpected("unknown provider: " + config.provider);
}
