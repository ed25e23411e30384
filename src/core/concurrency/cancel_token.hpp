#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace hive::core::concurrency {

// Shared cancellation flag. Copies observe the same state; cancel() is
// idempotent and runs each registered callback exactly once.
class CancelToken {
public:
    using CallbackId = std::size_t;

    CancelToken();

    bool is_cancelled() const;
    void cancel() const;

    // Runs immediately (on the caller's thread) when already cancelled.
    CallbackId on_cancel(std::function<void()> callback) const;
    void remove_callback(CallbackId id) const;

    // Token that is cancelled whenever this one is, but can also be
    // cancelled on its own.
    CancelToken child() const;

    // Sleeps up to `duration`; returns true when woken by cancellation.
    bool wait_for(std::chrono::milliseconds duration) const;

    // Callbacks still waiting for cancel(), one per live child included.
    std::size_t pending_callbacks() const;

private:
    struct State {
        ~State();

        std::atomic_bool cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
        std::unordered_map<CallbackId, std::function<void()>> callbacks;
        CallbackId next_id = 1;
        // Registration on the parent of a child token; dropped with the child.
        std::weak_ptr<State> parent;
        CallbackId parent_callback = 0;
    };

    static void cancel_state(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

}  // namespace hive::core::concurrency
