#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace genai {

// Single-producer / single-consumer hand-off with a fixed capacity.
// push() blocks while the channel is full, which is what stops a producer
// from reading ahead of a slow consumer. The producer ends the sequence with
// close(), optionally carrying the error that terminated it; the consumer
// sees every item pushed before the close, then the error once.
//
// Thread safety: all methods may be called concurrently.
template <typename T>
class BoundedChannel {
public:
    enum class PopStatus { Item, Closed, TimedOut };

    explicit BoundedChannel(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0)
            throw std::invalid_argument("BoundedChannel capacity must be at least 1");
    }

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Blocks while full. Returns false (item discarded) once the channel is
    // closed or cancelled.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Blocks until an item is available or the channel is closed and drained.
    // Rethrows the terminal error once, after the last item.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return take(lock);
    }

    // As pop(), but gives up at deadline.
    template <typename Clock, typename Duration>
    PopStatus pop_until(const std::chrono::time_point<Clock, Duration>& deadline,
                        std::optional<T>& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_until(lock, deadline,
                                   [this] { return closed_ || !items_.empty(); }))
            return PopStatus::TimedOut;
        out = take(lock);
        return out ? PopStatus::Item : PopStatus::Closed;
    }

    // Producer side: no more items. Buffered items stay poppable.
    void close(std::exception_ptr error = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        error_ = std::move(error);
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // Consumer side: drop buffered items and any pending error, and release
    // a producer blocked in push().
    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        items_.clear();
        error_ = nullptr;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> take(std::unique_lock<std::mutex>& lock) {
        if (!items_.empty()) {
            std::optional<T> item(std::move(items_.front()));
            items_.pop_front();
            not_full_.notify_one();
            return item;
        }
        if (error_) {
            std::exception_ptr error = std::move(error_);
            error_ = nullptr;
            lock.unlock();
            std::rethrow_exception(error);
        }
        return std::nullopt;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    std::exception_ptr error_;
    bool closed_ = false;
};

} // namespace genai
