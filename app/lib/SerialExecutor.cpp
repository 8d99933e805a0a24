/*
 * Serial executor implementation
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "SerialExecutor.hpp"
#include "Logger.hpp"

#include <future>

SerialExecutor::SerialExecutor(std::string name)
    : name_(std::move(name))
{
    thread_ = std::thread([this] { run(); });
}

SerialExecutor::~SerialExecutor()
{
    stop();
}

bool SerialExecutor::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

SerialExecutor::TimerId SerialExecutor::post_after(std::chrono::milliseconds delay, Task task)
{
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return 0;
        }
        id = next_timer_id_++;
        timers_.emplace(std::chrono::steady_clock::now() + delay, Timer{id, std::move(task)});
    }
    cv_.notify_one();
    return id;
}

void SerialExecutor::cancel_timer(TimerId id)
{
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.id == id) {
            timers_.erase(it);
            return;
        }
    }
}

void SerialExecutor::drain()
{
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    if (!post([done] { done->set_value(); })) {
        return;
    }
    future.wait();
}

void SerialExecutor::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !thread_.joinable()) {
            return;
        }
        stopping_ = true;
        tasks_.clear();
        timers_.clear();
    }
    cv_.notify_all();

    if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
        thread_.join();
    } else if (thread_.joinable()) {
        // Stopped from one of our own tasks: the loop exits after it returns
        thread_.detach();
    }
}

bool SerialExecutor::is_current_thread() const
{
    return std::this_thread::get_id() == thread_.get_id();
}

void SerialExecutor::run()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        const auto now = std::chrono::steady_clock::now();

        Task task;
        if (!timers_.empty() && timers_.begin()->first <= now) {
            task = std::move(timers_.begin()->second.task);
            timers_.erase(timers_.begin());
        } else if (!tasks_.empty()) {
            task = std::move(tasks_.front());
            tasks_.pop_front();
        } else if (!timers_.empty()) {
            cv_.wait_until(lock, timers_.begin()->first);
            continue;
        } else {
            cv_.wait(lock);
            continue;
        }

        lock.unlock();
        try {
            task();
        } catch (const std::exception& ex) {
            if (auto logger = Logger::get_logger(Logger::kCore)) {
                logger->error("Task on executor '{}' threw: {}", name_, ex.what());
            }
        }
        lock.lock();
    }
}
