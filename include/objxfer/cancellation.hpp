#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace objxfer {

/// Abort signal shared between a caller and an in-flight transfer.
/// Cancelling wakes any backoff sleep and aborts the active network call.
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const {
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    /// Sleep for up to `duration`. Returns false if cancelled first.
    bool wait_for(std::chrono::milliseconds duration) {
        std::unique_lock lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

}  // namespace objxfer
