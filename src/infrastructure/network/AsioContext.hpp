#pragma once

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace signfleet::infra {

/**
 * @brief Manages an Asio I/O context with a pool of worker threads.
 *
 * Socket operations (discovery dials, the HTTP server) and detached
 * background tasks (probes, pushes, discovery passes) all run here. Uses
 * executor_work_guard to keep the context running until explicitly stopped.
 *
 * @note This class is non-copyable. The application owns one instance and
 *       passes it by reference.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (defaults to hardware concurrency).
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the I/O context and worker threads.
     *
     * Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the I/O context and joins all worker threads.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Posts a handler to be executed asynchronously.
     * @tparam Handler Callable type (function, lambda, etc.).
     * @param handler The handler to execute on the I/O thread pool.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    /**
     * @brief Runs a task in the background without waiting for it.
     *
     * Exceptions escaping the task are logged with its name and never reach
     * the worker thread.
     *
     * @param name Label used in log lines.
     * @param task Callable with no arguments.
     */
    template <typename Task>
    void spawn(std::string name, Task&& task) {
        asio::post(ioContext_, [name = std::move(name), task = std::forward<Task>(task)]() mutable {
            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("Background task '{}' failed: {}", name, e.what());
            }
        });
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace signfleet::infra
