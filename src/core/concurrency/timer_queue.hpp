#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace hive::core::concurrency {

// One background thread firing one-shot callbacks at their deadline.
// Callbacks run on the timer thread without the queue lock held.
class TimerQueue {
public:
    using TimerId = std::uint64_t;
    using Callback = std::function<void()>;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerId schedule_after(std::chrono::milliseconds delay, Callback callback);

    // False when the timer already fired, was cancelled, or never existed.
    bool cancel(TimerId id);

    std::size_t pending() const;

    // Drops pending timers and joins the thread. Idempotent.
    void shutdown();

private:
    using Deadline = std::chrono::steady_clock::time_point;
    using Key = std::pair<Deadline, TimerId>;

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<Key, Callback> entries_;
    std::unordered_map<TimerId, Deadline> index_;
    TimerId next_id_ = 1;
    bool stopping_ = false;
    std::thread worker_;
};

}  // namespace hive::core::concurrency
