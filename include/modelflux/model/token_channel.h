#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace modelflux::model {

/**
 * Ordered single-producer fragment queue with a terminal signal. Pushes never block;
 * next() blocks until a fragment is available or the channel is closed and drained.
 */
class TokenChannel {
public:
    bool push(std::string fragment) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return false;
            queue_.push_back(std::move(fragment));
        }
        cv_.notify_one();
        return true;
    }

    // Rejects further pushes; queued fragments are still handed out by next()
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::optional<std::string> next() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty())
            return std::nullopt;
        std::string out = std::move(queue_.front());
        queue_.pop_front();
        return out;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    bool closed_{false};
};

} // namespace modelflux::model
