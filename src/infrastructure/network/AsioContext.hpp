#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace vikabh::infra {

/**
 * @brief Worker pool built on an Asio I/O context.
 *
 * The monitoring engine posts one probe per device onto this pool; the pool
 * size is the upper bound on probes running at the same time. An
 * executor_work_guard keeps the workers alive between cycles.
 *
 * @note This class is non-copyable. It is created once by the application
 *       and passed by reference to the components that need it.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one is used).
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     * @throws std::system_error if a worker thread cannot be created.
     */
    void start();

    /**
     * @brief Stops the I/O context and joins all worker threads.
     *
     * Handlers still queued are discarded; callers that need their work
     * finished must wait for it before stopping.
     */
    void stop();

    /**
     * @brief Posts a handler to be executed on the worker pool.
     * @tparam Handler Callable type.
     * @param handler The handler to execute.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    [[nodiscard]] size_t threadCount() const { return threadCount_; }

    [[nodiscard]] bool isRunning() const { return running_.load(); }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace vikabh::infra
