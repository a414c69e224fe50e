#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace vikabh::infra {

/**
 * @brief Level-triggered "statuses changed" signal.
 *
 * notify() sets a flag and bumps a generation counter; any number of
 * notifications before the reader looks collapse into one. notify() never
 * waits on readers: the listener is invoked on the notifying thread and
 * must only schedule work elsewhere (view models use a queued Qt call).
 */
class ChangeNotifier {
public:
    using Listener = std::function<void()>;

    /**
     * @brief Raises the signal and wakes waiters.
     */
    void notify();

    /**
     * @brief Tests and clears the signal.
     * @return True if notify() was called since the last consume().
     */
    bool consume();

    /**
     * @brief Waits until the signal is raised, then clears it.
     * @return True if the signal was raised within the timeout.
     */
    bool waitFor(std::chrono::milliseconds timeout);

    /**
     * @brief Number of notify() calls since construction.
     */
    [[nodiscard]] uint64_t generation() const { return generation_.load(); }

    /**
     * @brief Installs (or clears, with an empty function) the listener.
     *
     * Blocks while the current listener is running, so once this returns the
     * old listener is never called again. Must not be called from inside
     * the listener.
     */
    void setListener(Listener listener);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_{false};
    std::atomic<uint64_t> generation_{0};

    std::mutex listenerMutex_;
    Listener listener_;
};

} // namespace vikabh::infra
