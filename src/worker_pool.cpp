#include "worker_pool.hpp"

#include <signal.h>

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);

    // SIGINT/SIGTERM belong to the runner's signalfd. Pool threads are
    // started with them blocked so the default action never fires on one.
    sigset_t mask;
    sigset_t old_mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, &old_mask);

    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { worker_main(stop); });
    }

    pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
}

WorkerPool::~WorkerPool() {
    for (auto& w : workers_) {
        w.request_stop();
    }
    cv_.notify_all();
    // jthread joins on destruction
}

void WorkerPool::worker_main(std::stop_token stop) {
    while (true) {
        std::move_only_function<void()> task;
        {
            std::unique_lock lock(mutex_);
            if (!cv_.wait(lock, stop, [this] { return !queue_.empty(); })) {
                return; // stop requested and nothing left to run
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}
