#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace objxfer {

/// Fixed set of workers draining a FIFO queue.
///
/// Each worker runs one task at a time, so the worker count is the
/// concurrency limit. Exceptions thrown by a task land in its future.
/// The destructor runs everything already queued, then joins.
class ThreadPool {
public:
    explicit ThreadPool(size_t workers) {
        workers = workers ? workers : 1;
        threads_.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads_.emplace_back([this] { run(); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard lock(mutex_);
            closing_ = true;
        }
        ready_.notify_all();
        for (auto& t : threads_) t.join();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F&& fn) {
        using Result = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        auto future = task->get_future();
        {
            std::lock_guard lock(mutex_);
            if (closing_) {
                throw std::logic_error("submit() on a closing ThreadPool");
            }
            queue_.emplace_back([task] { (*task)(); });
        }
        ready_.notify_one();
        return future;
    }

    size_t size() const { return threads_.size(); }

private:
    void run() {
        for (;;) {
            std::function<void()> next;
            {
                std::unique_lock lock(mutex_);
                ready_.wait(lock, [this] { return closing_ || !queue_.empty(); });
                if (queue_.empty()) return;
                next = std::move(queue_.front());
                queue_.pop_front();
            }
            next();
        }
    }

    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::function<void()>> queue_;
    bool closing_ = false;
    std::vector<std::thread> threads_;
};

}  // namespace objxfer
