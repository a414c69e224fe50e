#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace vikabh::infra {

AsioContext::AsioContext(size_t threadCount)
    : threadCount_(threadCount > 0 ? threadCount : 1) {
    spdlog::debug("Probe worker pool created with {} threads", threadCount_);
}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    try {
        for (size_t i = 0; i < threadCount_; ++i) {
            threads_.emplace_back([this, i]() {
                spdlog::debug("Probe worker {} started", i);
                ioContext_.run();
                spdlog::debug("Probe worker {} stopped", i);
            });
        }
    } catch (const std::system_error& e) {
        spdlog::critical("Failed to create probe worker thread: {}", e.what());
        stop();
        throw;
    }

    spdlog::info("Probe worker pool started with {} threads", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::info("Probe worker pool stopped");
}

} // namespace vikabh::infra
