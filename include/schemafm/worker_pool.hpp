#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace schemafm {

// ============================================================================
// Worker Pool
// ============================================================================
//
// Fixed set of threads draining a bounded FIFO queue. submit() blocks while
// the queue is full, which keeps file enumeration from running ahead of the
// workers. Exceptions thrown by a task surface through its future.

class WorkerPool {
public:
    WorkerPool(std::size_t workers, std::size_t queue_capacity)
        : capacity_(queue_capacity == 0 ? 1 : queue_capacity) {
        std::size_t count = workers == 0 ? 1 : workers;
        running_ = true;
        threads_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            threads_.emplace_back([this]() { worker_loop(); });
        }
    }

    ~WorkerPool() {
        stop();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using R = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        {
            std::unique_lock<std::mutex> lock(mu_);
            not_full_.wait(lock, [this]() { return !running_ || queue_.size() < capacity_; });
            if (!running_) {
                throw std::runtime_error("worker pool is stopped");
            }
            queue_.push([task]() { (*task)(); });
        }
        not_empty_.notify_one();
        return future;
    }

    // Finish queued tasks, then join the workers
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (!running_) return;
            running_ = false;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
    }

    std::size_t worker_count() const { return threads_.size(); }
    std::size_t capacity() const { return capacity_; }

    std::size_t pending() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size();
    }

private:
    std::size_t capacity_;
    bool running_ = false;
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> queue_;
    mutable std::mutex mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;

    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mu_);
                not_empty_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
                if (queue_.empty()) return;
                task = std::move(queue_.front());
                queue_.pop();
            }
            not_full_.notify_one();
            // packaged_task stores any exception in the future
            task();
        }
    }
};

} // namespace schemafm
