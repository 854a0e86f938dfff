#include "config.hpp"
#include "runner.hpp"
#include "transcription/provider_factory.hpp"
#include "worker_pool.hpp"

#include <cstdlib>
#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println("Usage: {} [options] FILE...", prog);
    std::println("Transcribe short audio clips (mp3) to text.");
    std::println("Options:");
    std::println("  -c, --config PATH            Config file path");
    std::println("  -p, --provider NAME          batch | streaming (overrides config)");
    std::println("  -j, --jobs N                 Concurrent attempts (overrides config)");
    std::println("  -v, --verbose                Enable verbose logging");
    std::println("  -h, --help                   Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string provider_name;
    int jobs = 0;
    std::vector<std::string> files;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--provider" || arg == "-p") {
            if (i + 1 < argc) provider_name = argv[++i];
        } else if (arg == "--jobs" || arg == "-j") {
            if (i + 1 < argc) jobs = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 2;
        } else {
            files.push_back(std::move(arg));
        }
    }

    if (files.empty()) {
        usage(argv[0]);
        return 2;
    }

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }
    config.apply_env();
    if (!provider_name.empty()) config.provider = provider_name;
    if (jobs > 0) config.runner.max_concurrent = static_cast<uint32_t>(jobs);

    auto problems = config.validate();
    if (!problems.empty()) {
        for (auto& p : problems) {
            std::println(stderr, "config: {}", p);
        }
        return 2;
    }

    WorkerPool pool(config.runner.transcode_workers);
    auto provider = make_provider(config, pool, verbose);
    if (!provider) {
        std::println(stderr, "{}", provider.error());
        return 2;
    }

    if (verbose) {
        std::println(stderr, "[clipscribe] {} provider, {} files, {} at a time",
                     (*provider)->name(), files.size(), config.runner.max_concurrent);
    }

    Runner runner(**provider, config.runner.max_concurrent, verbose);
    if (!runner.init()) {
        std::println(stderr, "Failed to initialize runner");
        return 1;
    }

    bool all_ok = true;
    runner.run(files, [&all_ok, verbose](const AttemptOutcome& outcome) {
        if (!outcome.result) {
            all_ok = false;
            std::println(stderr, "{}: {} error: {}", outcome.path,
                         error_kind_name(outcome.result.error().kind),
                         outcome.result.error().message);
            return;
        }

        if (outcome.result->has_value()) {
            std::println("{}: {}", outcome.path, **outcome.result);
        } else {
            std::println("{}: (no speech recognized)", outcome.path);
        }
        if (verbose) {
            std::println(stderr, "[clipscribe] {} took {:.1f}s", outcome.path, outcome.seconds);
        }
    });

    if (runner.skipped() > 0) {
        std::println(stderr, "{} files skipped after interrupt", runner.skipped());
        all_ok = false;
    }

    return all_ok ? 0 : 1;
}
