#include "runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <deque>
#include <format>
#include <fstream>
#include <iterator>
#include <print>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

std::expected<std::vector<uint8_t>, TranscriptionError> read_audio_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return fail(ErrorKind::Io, "cannot open " + path + ": " + std::strerror(errno));
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        return fail(ErrorKind::Io, "read " + path + " failed");
    }
    return data;
}

Runner::Runner(TranscriptionProvider& provider, size_t max_concurrent, bool verbose)
    : provider_(provider), max_concurrent_(max_concurrent == 0 ? 1 : max_concurrent),
      verbose_(verbose) {}

Runner::~Runner() {
    for (auto& [id, w] : workers_) {
        if (w.joinable()) w.join();
    }
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (signals_blocked_) {
        sigprocmask(SIG_SETMASK, &old_mask_, nullptr);
    }
}

bool Runner::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd. Attempt threads start after this and
    // inherit the mask; WorkerPool threads block the same set themselves.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (sigprocmask(SIG_BLOCK, &mask, &old_mask_) < 0) {
        std::println(stderr, "sigprocmask failed: {}", std::strerror(errno));
        return false;
    }
    signals_blocked_ = true;

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Worker notification eventfd
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(worker_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

std::vector<AttemptOutcome> Runner::run(const std::vector<std::string>& files,
                                        const CompletionCallback& on_complete) {
    std::vector<AttemptOutcome> outcomes;
    std::deque<std::string> pending(files.begin(), files.end());
    size_t launched = 0;

    auto launch_more = [&] {
        while (running_.load(std::memory_order_relaxed) && !pending.empty() &&
               launched - outcomes.size() < max_concurrent_) {
            launch(std::move(pending.front()));
            pending.pop_front();
            ++launched;
        }
    };

    launch_more();

    constexpr int MAX_EVENTS = 4;
    epoll_event events[MAX_EVENTS];

    while (outcomes.size() < launched) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            // Workers still signal completion through the queue; wait for them below
            running_.store(false, std::memory_order_release);
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                    log(std::format("received signal {}, waiting for running attempts",
                                    info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd read failed: {}", std::strerror(errno));
                }
                for (auto& outcome : collect_finished()) {
                    if (on_complete) on_complete(outcome);
                    outcomes.push_back(std::move(outcome));
                }
            }
        }

        launch_more();
    }

    // Everything launched has reported, except after an epoll failure
    for (auto& [id, w] : workers_) {
        if (w.joinable()) w.join();
    }
    for (auto& outcome : collect_finished()) {
        if (on_complete) on_complete(outcome);
        outcomes.push_back(std::move(outcome));
    }

    skipped_ = pending.size();
    if (skipped_ > 0) {
        log(std::format("{} files not attempted", skipped_));
    }
    return outcomes;
}

void Runner::request_stop() {
    running_.store(false, std::memory_order_release);
}

void Runner::launch(std::string path) {
    log("starting " + path);

    size_t id = next_attempt_id_++;
    workers_.emplace(id, std::jthread([this, id, path = std::move(path)](std::stop_token) {
        auto start = std::chrono::steady_clock::now();

        AttemptOutcome outcome;
        outcome.path = path;

        auto audio = read_audio_file(path);
        if (audio) {
            outcome.result = provider_.transcribe(*audio);
        } else {
            outcome.result = std::unexpected(audio.error());
        }

        auto end = std::chrono::steady_clock::now();
        outcome.seconds = std::chrono::duration<double>(end - start).count();

        {
            std::lock_guard lock(finished_mutex_);
            finished_.emplace_back(id, std::move(outcome));
        }
        notify_main();
    }));
}

std::vector<AttemptOutcome> Runner::collect_finished() {
    std::vector<std::pair<size_t, AttemptOutcome>> done;
    {
        std::lock_guard lock(finished_mutex_);
        done.swap(finished_);
    }

    std::vector<AttemptOutcome> out;
    out.reserve(done.size());
    for (auto& [id, outcome] : done) {
        // The thread has posted its outcome and is about to return
        auto it = workers_.find(id);
        if (it != workers_.end()) {
            if (it->second.joinable()) it->second.join();
            workers_.erase(it);
        }
        out.push_back(std::move(outcome));
    }
    return out;
}

void Runner::notify_main() {
    uint64_t val = 1;
    if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
        std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
    }
}

void Runner::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[clipscribe] {}", msg);
    }
}
