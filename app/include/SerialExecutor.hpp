/*
 * Single-threaded task queue with cancellable timers
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SERIAL_EXECUTOR_HPP
#define SERIAL_EXECUTOR_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

/**
 * Runs posted tasks one at a time on a dedicated thread.
 *
 * State owned by an object that only touches it from tasks on its executor
 * needs no further locking. Timers fire on the same thread, so a timer
 * callback never races with other tasks.
 */
class SerialExecutor {
public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;

    explicit SerialExecutor(std::string name);
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /**
     * Queue a task. Returns false once the executor is stopped.
     */
    bool post(Task task);

    /**
     * Run a task after a delay. Returns 0 once the executor is stopped.
     */
    TimerId post_after(std::chrono::milliseconds delay, Task task);

    /**
     * Cancel a pending timer. Unknown or already fired ids are ignored.
     */
    void cancel_timer(TimerId id);

    /**
     * Block until every task queued before this call has run.
     * Must not be called from the executor thread.
     */
    void drain();

    /**
     * Discard pending work and join the thread. Idempotent.
     */
    void stop();

    bool is_current_thread() const;

    const std::string& name() const { return name_; }

private:
    struct Timer {
        TimerId id;
        Task task;
    };

    void run();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::multimap<std::chrono::steady_clock::time_point, Timer> timers_;
    TimerId next_timer_id_{1};
    bool stopping_{false};
    std::thread thread_;
};

#endif // SERIAL_EXECUTOR_HPP
