/*
 * Blocking single-consumer channel and replay-latest broadcaster
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef CHANNEL_HPP
#define CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

/**
 * Ordered queue between one producer context and one consumer.
 *
 * The producer push()es and eventually close()s. The consumer reads with
 * next() until it returns std::nullopt, or gives up with cancel(), which
 * drops anything still queued and runs the on-cancel hook exactly once.
 */
template <typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @return false if the channel is closed or cancelled
     */
    bool push(T value)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_all();
        return true;
    }

    /**
     * End of sequence. Queued values stay readable.
     */
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /**
     * Next value, blocking; nullopt once closed and drained
     */
    std::optional<T> next()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return pop_locked();
    }

    /**
     * Next value or nullopt on timeout / end of sequence
     */
    template <typename Rep, typename Period>
    std::optional<T> next_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        return pop_locked();
    }

    std::optional<T> try_next()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    /**
     * Consumer stops consuming. Idempotent.
     */
    void cancel()
    {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                return;
            }
            cancelled_ = true;
            closed_ = true;
            queue_.clear();
            hook = std::move(on_cancel_);
        }
        cv_.notify_all();
        if (hook) {
            hook();
        }
    }

    void set_on_cancel(std::function<void()> hook)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_cancel_ = std::move(hook);
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool is_cancelled() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /**
     * Closed and nothing left to read
     */
    bool is_finished() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && queue_.empty();
    }

private:
    std::optional<T> pop_locked()
    {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_{false};
    bool cancelled_{false};
    std::function<void()> on_cancel_;
};

/**
 * Multi-subscriber broadcast with replay of the latest value.
 *
 * A new subscriber first receives the current value, then every later
 * publish in order. Each subscriber owns its channel: cancelling or
 * dropping it never affects the others.
 */
template <typename T>
class Broadcaster {
public:
    using Subscription = std::shared_ptr<Channel<T>>;

    explicit Broadcaster(T initial = T{})
        : latest_(std::move(initial))
    {}

    Subscription subscribe()
    {
        auto channel = std::make_shared<Channel<T>>();
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            channel->close();
            return channel;
        }
        channel->push(latest_);
        subscribers_.push_back(channel);
        return channel;
    }

    void publish(T value)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = std::move(value);
        prune_locked();
        for (auto& weak : subscribers_) {
            if (auto channel = weak.lock()) {
                channel->push(latest_);
            }
        }
    }

    T latest() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

    std::size_t subscriber_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& weak : subscribers_) {
            auto channel = weak.lock();
            if (channel && !channel->is_closed()) {
                ++count;
            }
        }
        return count;
    }

    /**
     * End every subscription
     */
    void close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        for (auto& weak : subscribers_) {
            if (auto channel = weak.lock()) {
                channel->close();
            }
        }
        subscribers_.clear();
    }

private:
    void prune_locked()
    {
        std::vector<std::weak_ptr<Channel<T>>> alive;
        alive.reserve(subscribers_.size());
        for (auto& weak : subscribers_) {
            auto channel = weak.lock();
            if (channel && !channel->is_closed()) {
                alive.push_back(weak);
            }
        }
        subscribers_.swap(alive);
    }

    mutable std::mutex mutex_;
    T latest_;
    std::vector<std::weak_ptr<Channel<T>>> subscribers_;
    bool closed_{false};
};

#endif // CHANNEL_HPP
