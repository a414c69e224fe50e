#include "infrastructure/network/Prober.hpp"

#include <spdlog/spdlog.h>

#include <future>

namespace vikabh::infra {

Prober::Prober(ProberOptions options) : options_(options) {}

CheckResult Prober::primaryCheck(const core::Device& device,
                                 std::chrono::milliseconds timeout) const {
    switch (device.method) {
    case core::CheckMethod::Tcp: {
        uint16_t port = device.port >= core::kMinPort && device.port <= core::kMaxPort
                            ? static_cast<uint16_t>(device.port)
                            : options_.defaultTcpPort;
        return connector_.connect(device.host, port, timeout);
    }
    case core::CheckMethod::Ping:
        return pinger_.ping(device.host, timeout);
    }
    return CheckResult::failed(core::ProbeFailure::Internal, "unknown check method");
}

bool Prober::auxiliaryCheck(const std::string& host, std::chrono::milliseconds timeout) const {
    return connector_.connect(host, options_.auxiliaryPort, timeout).ok();
}

core::ProbeResult Prober::probe(const core::Device& device, std::chrono::milliseconds timeout) {
    core::ProbeResult result;
    result.deviceId = device.id;

    try {
        auto auxiliary = std::async(std::launch::async, [this, host = device.host, timeout]() {
            return auxiliaryCheck(host, timeout);
        });

        CheckResult check = primaryCheck(device, timeout);
        result.auxiliaryServiceDetected = auxiliary.get();

        if (check.ok()) {
            result.outcome = core::ProbeOutcome::Online;
            result.latency = check.elapsed;
        } else {
            result.outcome = core::outcomeForFailure(check.failure);
            result.failure = check.failure;
            result.message = std::move(check.message);
        }
    } catch (const std::exception& e) {
        result.outcome = core::ProbeOutcome::Error;
        result.failure = core::ProbeFailure::Internal;
        result.latency.reset();
        result.auxiliaryServiceDetected = false;
        result.message = e.what();
    }

    result.timestamp = std::chrono::system_clock::now();

    if (result.isOnline()) {
        spdlog::debug("Probe {} ({} {}): Online {:.2f}ms{}", device.name, device.methodToString(),
                      device.host, *result.latencyMs(),
                      result.auxiliaryServiceDetected ? " [remote access]" : "");
    } else if (result.failure == core::ProbeFailure::Timeout) {
        spdlog::info("Probe {} ({} {}): timed out after {}ms", device.name,
                     device.methodToString(), device.host, timeout.count());
    } else if (result.outcome == core::ProbeOutcome::Offline) {
        spdlog::info("Probe {} ({} {}): Offline ({}): {}", device.name, device.methodToString(),
                     device.host, core::failureToString(result.failure), result.message);
    } else {
        spdlog::warn("Probe {} ({} {}): Error ({}): {}", device.name, device.methodToString(),
                     device.host, core::failureToString(result.failure), result.message);
    }

    return result;
}

} // namespace vikabh::infra
