/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation with an optional deadline.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace signfleet::core {

/**
 * @brief Shared cancellation signal threaded through network operations.
 *
 * Copies share state: cancelling any copy cancels all of them. A token may
 * carry a deadline, after which isCancelled() reports true even if
 * cancel() was never called. Callbacks registered with onCancel() run once
 * when cancel() is called; owners that need callbacks at the deadline arm
 * a timer that calls cancel().
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;
    using CallbackId = uint64_t;

    /**
     * @brief Creates a token with no deadline.
     */
    CancellationToken();

    /**
     * @brief Creates a token that expires after the given budget.
     * @param budget Time from now until the deadline.
     * @return New token.
     */
    static CancellationToken withTimeout(std::chrono::milliseconds budget);

    /**
     * @brief Cancels the token and runs the registered callbacks.
     */
    void cancel();

    /**
     * @brief Checks whether the token was cancelled or its deadline passed.
     */
    [[nodiscard]] bool isCancelled() const;

    /**
     * @brief Returns the deadline, if any.
     */
    [[nodiscard]] std::optional<Clock::time_point> deadline() const { return state_->deadline; }

    /**
     * @brief Returns the time left until the deadline.
     * @param cap Value returned when the token has no deadline.
     * @return Remaining time, clamped to zero and to cap.
     */
    [[nodiscard]] std::chrono::milliseconds remaining(std::chrono::milliseconds cap) const;

    /**
     * @brief Registers a callback run on cancel().
     *
     * If the token is already cancelled the callback runs immediately on
     * the calling thread.
     *
     * @param callback Function to run.
     * @return Id for removeCallback().
     */
    CallbackId onCancel(std::function<void()> callback);

    /**
     * @brief Unregisters a callback.
     * @param id Id returned by onCancel().
     */
    void removeCallback(CallbackId id);

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
        std::mutex mutex;
        std::map<CallbackId, std::function<void()>> callbacks;
        CallbackId nextId{1};
    };

    std::shared_ptr<State> state_;
};

} // namespace signfleet::core
