/**
 * @file ChangeNotifier.hpp
 * @brief Payload-free change broadcast for roster consumers.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace signfleet::core {

/**
 * @brief One subscriber's view of the change broadcast.
 *
 * Holds at most one pending signal; repeated publishes before the
 * subscriber consumes coalesce into one. The subscriber owns this object
 * through the shared_ptr returned by ChangeNotifier::subscribe(); dropping
 * it unsubscribes.
 */
class Subscription {
public:
    /**
     * @brief Waits until a change is pending, then consumes it.
     * @param timeout Maximum time to wait.
     * @return True if a change was consumed, false on timeout.
     */
    bool wait(std::chrono::milliseconds timeout);

    /**
     * @brief Consumes a pending change without waiting.
     * @return True if a change was pending.
     */
    bool tryConsume();

    /**
     * @brief Returns the number of publishes observed, including coalesced ones.
     */
    uint64_t received() const;

private:
    friend class ChangeNotifier;

    void signal();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_{false};
    uint64_t received_{0};
};

/**
 * @brief Broadcasts "the roster changed" to any number of subscribers.
 *
 * Subscribers are held weakly. publish() never waits on a subscriber, so a
 * slow consumer cannot stall the mutation that triggered the publish.
 */
class ChangeNotifier {
public:
    /**
     * @brief Registers a new subscriber.
     * @return Subscription handle; keep it alive to keep receiving.
     */
    std::shared_ptr<Subscription> subscribe();

    /**
     * @brief Signals every live subscriber.
     */
    void publish();

    /**
     * @brief Returns the number of subscribers still alive.
     */
    size_t subscriberCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Subscription>> subscribers_;
};

} // namespace signfleet::core
