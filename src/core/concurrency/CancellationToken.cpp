#include "core/concurrency/CancellationToken.hpp"

#include <algorithm>

namespace signfleet::core {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken CancellationToken::withTimeout(std::chrono::milliseconds budget) {
    CancellationToken token;
    token.state_->deadline = Clock::now() + budget;
    return token;
}

void CancellationToken::cancel() {
    std::map<CallbackId, std::function<void()>> callbacks;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->cancelled.exchange(true)) {
            return;
        }
        callbacks.swap(state_->callbacks);
    }

    for (auto& [id, callback] : callbacks) {
        callback();
    }
}

bool CancellationToken::isCancelled() const {
    if (state_->cancelled.load()) {
        return true;
    }
    return state_->deadline && Clock::now() >= *state_->deadline;
}

std::chrono::milliseconds CancellationToken::remaining(std::chrono::milliseconds cap) const {
    using namespace std::chrono;

    if (state_->cancelled.load()) {
        return milliseconds(0);
    }
    if (!state_->deadline) {
        return cap;
    }
    auto left = duration_cast<milliseconds>(*state_->deadline - Clock::now());
    return std::clamp(left, milliseconds(0), cap);
}

CancellationToken::CallbackId CancellationToken::onCancel(std::function<void()> callback) {
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->cancelled.load()) {
            auto id = state_->nextId++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void CancellationToken::removeCallback(CallbackId id) {
    std::lock_guard lock(state_->mutex);
    state_->callbacks.erase(id);
}

} // namespace signfleet::core
