#include "infrastructure/network/TcpConnector.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace vikabh::infra {

using asio::ip::tcp;

core::ProbeFailure TcpConnector::classify(const asio::error_code& ec, bool duringResolve) {
    if (ec == asio::error::connection_refused) {
        return core::ProbeFailure::Refused;
    }
    if (ec == asio::error::timed_out) {
        return core::ProbeFailure::Timeout;
    }
    if (ec == asio::error::host_unreachable || ec == asio::error::network_unreachable ||
        ec == asio::error::network_down) {
        return core::ProbeFailure::Unreachable;
    }
    if (ec == asio::error::access_denied || ec == asio::error::no_permission) {
        return core::ProbeFailure::PermissionDenied;
    }
    if (duringResolve || ec == asio::error::host_not_found ||
        ec == asio::error::host_not_found_try_again || ec == asio::error::no_data) {
        return core::ProbeFailure::ResolutionFailed;
    }
    return core::ProbeFailure::Unreachable;
}

CheckResult TcpConnector::connect(const std::string& host, uint16_t port,
                                  std::chrono::milliseconds timeout) const {
    const auto started = std::chrono::steady_clock::now();
    const std::string target = host + ":" + std::to_string(port);
    auto timedOut = [&]() {
        return CheckResult::failed(core::ProbeFailure::Timeout,
                                   "connect to " + target + " timed out after " +
                                       std::to_string(timeout.count()) + "ms");
    };

    std::vector<tcp::endpoint> endpoints;
    asio::error_code parseError;
    auto address = asio::ip::make_address(host, parseError);
    if (!parseError) {
        endpoints.emplace_back(address, port);
    } else {
        Resolution resolution = resolver_.resolve(host, timeout);
        if (resolution.timedOut) {
            spdlog::trace("TCP check {}: lookup did not finish in time", target);
            return timedOut();
        }
        if (!resolution.ok()) {
            auto result = CheckResult::failed(
                resolution.error ? classify(resolution.error, true)
                                 : core::ProbeFailure::ResolutionFailed,
                "cannot resolve " + host + ": " +
                    (resolution.error ? resolution.error.message() : std::string("no addresses")));
            spdlog::trace("TCP check {}: {}", target, result.message);
            return result;
        }
        for (const auto& resolved : resolution.addresses) {
            endpoints.emplace_back(resolved, port);
        }
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        started + timeout - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return timedOut();
    }

    asio::io_context io;
    tcp::socket socket(io);
    asio::steady_timer deadline(io);

    CheckResult result = CheckResult::failed(core::ProbeFailure::Internal, "connect did not run");
    bool finished = false;
    const auto connectStart = std::chrono::steady_clock::now();

    deadline.expires_after(remaining);
    deadline.async_wait([&](const asio::error_code& ec) {
        if (ec || finished) {
            return;
        }
        finished = true;
        result = timedOut();
        asio::error_code ignored;
        socket.close(ignored);
    });

    asio::async_connect(socket, endpoints,
                        [&](const asio::error_code& ec, const tcp::endpoint& /*endpoint*/) {
                            if (finished) {
                                return;
                            }
                            finished = true;
                            deadline.cancel();

                            if (!ec) {
                                result = CheckResult::success(
                                    std::chrono::duration_cast<std::chrono::microseconds>(
                                        std::chrono::steady_clock::now() - connectStart));
                            } else {
                                result = CheckResult::failed(classify(ec, false),
                                                             "connect to " + target +
                                                                 " failed: " + ec.message());
                            }
                        });

    io.run();

    asio::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);

    if (!result.ok()) {
        spdlog::trace("TCP check {}: {}", target, result.message);
    }
    return result;
}

} // namespace vikabh::infra
