#include "core/events/ChangeNotifier.hpp"

#include <algorithm>
#include <utility>

namespace signfleet::core {

bool Subscription::wait(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return pending_; })) {
        return false;
    }
    pending_ = false;
    return true;
}

bool Subscription::tryConsume() {
    std::lock_guard lock(mutex_);
    return std::exchange(pending_, false);
}

uint64_t Subscription::received() const {
    std::lock_guard lock(mutex_);
    return received_;
}

void Subscription::signal() {
    {
        std::lock_guard lock(mutex_);
        pending_ = true;
        ++received_;
    }
    cv_.notify_all();
}

std::shared_ptr<Subscription> ChangeNotifier::subscribe() {
    auto subscription = std::make_shared<Subscription>();
    std::lock_guard lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

void ChangeNotifier::publish() {
    std::vector<std::shared_ptr<Subscription>> live;
    {
        std::lock_guard lock(mutex_);
        std::erase_if(subscribers_, [](const auto& weak) { return weak.expired(); });
        for (const auto& weak : subscribers_) {
            if (auto subscription = weak.lock()) {
                live.push_back(std::move(subscription));
            }
        }
    }

    for (const auto& subscription : live) {
        subscription->signal();
    }
}

size_t ChangeNotifier::subscriberCount() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
                                             [](const auto& weak) { return !weak.expired(); }));
}

} // namespace signfleet::core
