#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of threads for CPU-bound work (transcoding). Network I/O stays
// on the attempt threads. Queued tasks still run when the pool is destroyed.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F&& fn) {
        std::packaged_task<std::invoke_result_t<F>()> task(std::forward<F>(fn));
        auto result = task.get_future();
        {
            std::lock_guard lock(mutex_);
            queue_.emplace_back(std::move(task));
        }
        cv_.notify_one();
        return result;
    }

    size_t size() const { return workers_.size(); }

private:
    void worker_main(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::move_only_function<void()>> queue_;
    std::vector<std::jthread> workers_;
};
