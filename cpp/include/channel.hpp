#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace ptyshell {
namespace core {

/**
 * @brief Unbounded multi-producer FIFO with blocking and deadline pops.
 *
 * Items pushed before close() are still delivered; pops report Closed only
 * once the queue is both closed and drained.
 */
template <typename T>
class Channel {
public:
    enum class PopStatus { Item, Timeout, Closed };

    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool push(T value) {
        {
            std::lock_guard<std::mutex> lk(mx_);
            if (closed_) return false;
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Refuses further pushes and drops whatever is still queued.
    void close_and_clear() {
        std::deque<T> dropped;
        {
            std::lock_guard<std::mutex> lk(mx_);
            closed_ = true;
            dropped.swap(items_);
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mx_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mx_);
        return items_.size();
    }

    /// Blocks until an item arrives; nullopt once closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lk(mx_);
        cv_.wait(lk, [this]{ return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;
        T v = std::move(items_.front());
        items_.pop_front();
        return v;
    }

    template <typename Clock, typename Duration>
    PopStatus pop_until(T& out, const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lk(mx_);
        if (!cv_.wait_until(lk, deadline, [this]{ return closed_ || !items_.empty(); })) {
            return PopStatus::Timeout;
        }
        if (items_.empty()) return PopStatus::Closed;
        out = std::move(items_.front());
        items_.pop_front();
        return PopStatus::Item;
    }

    template <typename Rep, typename Period>
    PopStatus pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
        return pop_until(out, std::chrono::steady_clock::now() + timeout);
    }

private:
    mutable std::mutex      mx_;
    std::condition_variable cv_;
    std::deque<T>           items_;
    bool                    closed_{false};
};

/// Caller-owned input for interactive runs; std::nullopt is the stop sentinel.
using InputChannel = Channel<std::optional<std::string>>;

} // namespace core
} // namespace ptyshell
