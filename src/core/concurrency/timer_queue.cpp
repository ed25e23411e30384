#include "core/concurrency/timer_queue.hpp"

namespace hive::core::concurrency {

TimerQueue::TimerQueue() : worker_([this] { run(); }) {}

TimerQueue::~TimerQueue() {
    shutdown();
}

TimerQueue::TimerId TimerQueue::schedule_after(
    const std::chrono::milliseconds delay, Callback callback) {
    const Deadline deadline = std::chrono::steady_clock::now() + delay;
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return 0;
        }
        id = next_id_++;
        entries_.emplace(Key{deadline, id}, std::move(callback));
        index_.emplace(id, deadline);
    }
    cv_.notify_one();
    return id;
}

bool TimerQueue::cancel(const TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(Key{it->second, id});
    index_.erase(it);
    return true;
}

std::size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TimerQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
        entries_.clear();
        index_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (entries_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !entries_.empty(); });
            continue;
        }

        const auto next = entries_.begin();
        const Deadline deadline = next->first.first;
        if (std::chrono::steady_clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        Callback callback = std::move(next->second);
        index_.erase(next->first.second);
        entries_.erase(next);

        lock.unlock();
        callback();
        lock.lock();
    }
}

}  // namespace hive::core::concurrency
