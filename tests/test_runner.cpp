#include <catch2/catch_test_macros.hpp>

#include "runner.hpp"
#include "worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Echoes the clip back as its transcript; tracks how many attempts overlap.
class MockProvider : public TranscriptionProvider {
public:
    TranscribeResult transcribe(std::span<const uint8_t> audio) override {
        int now = ++running_;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}

        std::this_thread::sleep_for(delay);
        --running_;

        std::string text(audio.begin(), audio.end());
        if (text == "fail") return fail(ErrorKind::Auth, "rejected");
        if (text == "silence") return std::nullopt;
        return text;
    }

    std::string_view name() const override { return "mock"; }

    std::chrono::milliseconds delay{5ms};
    std::atomic<int> peak{0};

private:
    std::atomic<int> running_{0};
};

// Interrupts the whole process during its first attempt, then keeps working.
class InterruptingProvider : public TranscriptionProvider {
public:
    TranscribeResult transcribe(std::span<const uint8_t> audio) override {
        if (calls++ == 0) {
            kill(getpid(), SIGINT);
            std::this_thread::sleep_for(100ms);
        }
        return std::string(audio.begin(), audio.end());
    }

    std::string_view name() const override { return "interrupting"; }

    std::atomic<int> calls{0};
};

// RAII directory of small clip files.
struct TmpClips {
    std::filesystem::path dir;

    TmpClips() {
        dir = std::filesystem::temp_directory_path() / "clipscribe_test_runner";
        std::filesystem::create_directories(dir);
    }

    ~TmpClips() { std::filesystem::remove_all(dir); }

    std::string add(const std::string& name, const std::string& content) {
        auto p = dir / name;
        std::ofstream(p, std::ios::binary) << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("read_audio_file", "[runner]") {
    TmpClips clips;

    SECTION("ReadsWholeFile") {
        auto path = clips.add("a.mp3", std::string("ID3\0\x01", 5));
        auto data = read_audio_file(path);
        REQUIRE(data);
        REQUIRE(data->size() == 5);
        REQUIRE((*data)[3] == 0);
    }

    SECTION("MissingFileIsIo") {
        auto data = read_audio_file((clips.dir / "missing.mp3").string());
        REQUIRE_FALSE(data);
        REQUIRE(data.error().kind == ErrorKind::Io);
    }
}

TEST_CASE("Runner", "[runner]") {
    TmpClips clips;
    MockProvider provider;

    SECTION("EveryFileGetsOneOutcome") {
        std::vector<std::string> files = {
            clips.add("one.mp3", "one"),
            clips.add("two.mp3", "two"),
            clips.add("three.mp3", "three"),
        };

        Runner runner(provider, 2);
        REQUIRE(runner.init());

        std::vector<std::string> reported;
        auto outcomes = runner.run(files, [&](const AttemptOutcome& o) { reported.push_back(o.path); });

        REQUIRE(outcomes.size() == 3);
        REQUIRE(reported.size() == 3);
        REQUIRE(runner.skipped() == 0);

        std::set<std::string> texts;
        for (auto& o : outcomes) {
            REQUIRE(o.result);
            REQUIRE(o.result->has_value());
            texts.insert(**o.result);
            REQUIRE(o.seconds >= 0.0);
        }
        REQUIRE(texts == std::set<std::string>{"one", "two", "three"});
    }

    SECTION("ConcurrencyIsBounded") {
        provider.delay = 20ms;
        std::vector<std::string> files;
        for (int i = 0; i < 6; ++i) {
            files.push_back(clips.add("clip" + std::to_string(i) + ".mp3", "clip" + std::to_string(i)));
        }

        Runner runner(provider, 2);
        REQUIRE(runner.init());
        auto outcomes = runner.run(files);

        REQUIRE(outcomes.size() == 6);
        REQUIRE(provider.peak.load() <= 2);
        REQUIRE(provider.peak.load() >= 1);
    }

    SECTION("FailuresStayPerFile") {
        std::vector<std::string> files = {
            clips.add("ok.mp3", "fine"),
            clips.add("bad.mp3", "fail"),
            clips.add("quiet.mp3", "silence"),
            (clips.dir / "missing.mp3").string(),
        };

        Runner runner(provider, 4);
        REQUIRE(runner.init());
        auto outcomes = runner.run(files);
        REQUIRE(outcomes.size() == 4);

        auto find = [&](const std::string& suffix) {
            return *std::find_if(outcomes.begin(), outcomes.end(),
                                 [&](const AttemptOutcome& o) { return o.path.ends_with(suffix); });
        };

        REQUIRE(**find("ok.mp3").result == "fine");
        REQUIRE(find("bad.mp3").result.error().kind == ErrorKind::Auth);
        REQUIRE_FALSE(find("quiet.mp3").result->has_value());
        REQUIRE(find("missing.mp3").result.error().kind == ErrorKind::Io);
    }

    SECTION("StopBeforeRunLaunchesNothing") {
        std::vector<std::string> files = {clips.add("one.mp3", "one"), clips.add("two.mp3", "two")};

        Runner runner(provider, 1);
        REQUIRE(runner.init());
        runner.request_stop();
        auto outcomes = runner.run(files);

        REQUIRE(outcomes.empty());
        REQUIRE(runner.skipped() == 2);
    }

    SECTION("FinishedAttemptsAreJoined") {
        std::vector<std::string> files;
        for (int i = 0; i < 12; ++i) {
            files.push_back(clips.add("clip" + std::to_string(i) + ".mp3", "clip" + std::to_string(i)));
        }

        Runner runner(provider, 2);
        REQUIRE(runner.init());

        size_t most_live = 0;
        auto outcomes = runner.run(files, [&](const AttemptOutcome&) {
            most_live = std::max(most_live, runner.active_workers());
        });

        REQUIRE(outcomes.size() == 12);
        REQUIRE(most_live <= 2);
        REQUIRE(runner.active_workers() == 0);
    }

    SECTION("EmptyFileList") {
        Runner runner(provider, 1);
        REQUIRE(runner.init());
        REQUIRE(runner.run({}).empty());
        REQUIRE(runner.skipped() == 0);
    }
}

TEST_CASE("Runner stops on SIGINT with a worker pool running", "[runner]") {
    TmpClips clips;
    InterruptingProvider provider;

    // Same order as main: the pool's threads exist before the runner blocks signals
    WorkerPool pool(2);
    REQUIRE(pool.submit([] { return 1; }).get() == 1);

    std::vector<std::string> files = {
        clips.add("one.mp3", "one"),
        clips.add("two.mp3", "two"),
        clips.add("three.mp3", "three"),
    };

    Runner runner(provider, 1);
    REQUIRE(runner.init());
    auto outcomes = runner.run(files);

    // The attempt in flight still reports; nothing new is launched
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].result);
    REQUIRE(**outcomes[0].result == "one");
    REQUIRE(runner.skipped() == 2);
    REQUIRE(provider.calls.load() == 1);
}
