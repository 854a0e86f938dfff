#pragma once

#include "transcription/provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <signal.h>
#include <string>
#include <thread>
#include <utility>
#include <vector>

struct AttemptOutcome {
    std::string path;
    TranscribeResult result;
    double seconds = 0.0;
};

// Reads a whole audio file into memory.
std::expected<std::vector<uint8_t>, TranscriptionError> read_audio_file(const std::string& path);

// Runs one transcription attempt per file, each on its own worker thread,
// at most `max_concurrent` at a time. The calling thread waits in epoll for
// worker completions (eventfd) and SIGINT/SIGTERM (signalfd).
class Runner {
public:
    using CompletionCallback = std::function<void(const AttemptOutcome&)>;

    Runner(TranscriptionProvider& provider, size_t max_concurrent, bool verbose = false);
    ~Runner();

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    bool init();

    // Returns outcomes in completion order. After a signal no new attempts
    // start; running ones are awaited.
    std::vector<AttemptOutcome> run(const std::vector<std::string>& files,
                                    const CompletionCallback& on_complete = {});

    // Stop launching new attempts.
    void request_stop();

    size_t skipped() const { return skipped_; }

    // Attempt threads not yet joined. Finished attempts are joined as their
    // outcomes are collected, so this never exceeds max_concurrent.
    size_t active_workers() const { return workers_.size(); }

private:
    void launch(std::string path);
    // Moves finished outcomes out of the shared queue and joins their threads.
    std::vector<AttemptOutcome> collect_finished();
    void notify_main();

    void log(const std::string& msg);

    TranscriptionProvider& provider_;
    size_t max_concurrent_;
    bool verbose_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    bool signals_blocked_ = false;
    sigset_t old_mask_{};

    std::atomic<bool> running_{false};
    size_t skipped_ = 0;

    std::mutex finished_mutex_;
    std::vector<std::pair<size_t, AttemptOutcome>> finished_;

    size_t next_attempt_id_ = 0;
    // Declared last: joined before the state their threads write to is destroyed
    std::map<size_t, std::jthread> workers_;
};
