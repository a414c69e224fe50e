#include "infrastructure/monitoring/ChangeNotifier.hpp"

#include <spdlog/spdlog.h>

namespace vikabh::infra {

void ChangeNotifier::notify() {
    {
        std::lock_guard lock(mutex_);
        pending_ = true;
        ++generation_;
    }
    cv_.notify_all();

    // Held while the listener runs so setListener() cannot return mid-call
    std::lock_guard lock(listenerMutex_);
    if (listener_) {
        try {
            listener_();
        } catch (const std::exception& e) {
            spdlog::error("Status change listener failed: {}", e.what());
        }
    }
}

bool ChangeNotifier::consume() {
    std::lock_guard lock(mutex_);
    bool was = pending_;
    pending_ = false;
    return was;
}

bool ChangeNotifier::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return pending_; })) {
        return false;
    }
    pending_ = false;
    return true;
}

void ChangeNotifier::setListener(Listener listener) {
    std::lock_guard lock(listenerMutex_);
    listener_ = std::move(listener);
}

} // namespace vikabh::infra
