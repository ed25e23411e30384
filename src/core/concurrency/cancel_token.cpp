#include "core/concurrency/cancel_token.hpp"

#include <utility>
#include <vector>

namespace hive::core::concurrency {

CancelToken::State::~State() {
    if (parent_callback == 0) {
        return;
    }
    if (auto parent_state = parent.lock()) {
        std::lock_guard<std::mutex> lock(parent_state->mutex);
        parent_state->callbacks.erase(parent_callback);
    }
}

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

bool CancelToken::is_cancelled() const {
    return state_->cancelled.load();
}

void CancelToken::cancel() const {
    cancel_state(state_);
}

void CancelToken::cancel_state(const std::shared_ptr<State>& state) {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled.exchange(true)) {
            return;
        }
        to_run.reserve(state->callbacks.size());
        for (auto& entry : state->callbacks) {
            to_run.push_back(std::move(entry.second));
        }
        state->callbacks.clear();
    }
    state->cv.notify_all();

    for (auto& callback : to_run) {
        callback();
    }
}

CancelToken::CallbackId CancelToken::on_cancel(
    std::function<void()> callback) const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load()) {
            const CallbackId id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancelToken::remove_callback(const CallbackId id) const {
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

CancelToken CancelToken::child() const {
    CancelToken child_token;
    std::weak_ptr<State> weak_child = child_token.state_;
    const CallbackId id = on_cancel([weak_child]() {
        if (auto child_state = weak_child.lock()) {
            cancel_state(child_state);
        }
    });
    child_token.state_->parent = state_;
    child_token.state_->parent_callback = id;
    return child_token;
}

bool CancelToken::wait_for(const std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration,
                               [this] { return state_->cancelled.load(); });
}

std::size_t CancelToken::pending_callbacks() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->callbacks.size();
}

}  // namespace hive::core::concurrency
