#pragma once

#include "core/services/IProber.hpp"
#include "infrastructure/network/IcmpPinger.hpp"
#include "infrastructure/network/TcpConnector.hpp"

#include <cstdint>

namespace vikabh::infra {

/**
 * @brief Options for the Prober.
 */
struct ProberOptions {
    uint16_t auxiliaryPort{5900}; ///< Remote-access (VNC) port checked on every probe
    uint16_t defaultTcpPort{80};  ///< Used for TCP devices stored without a port
};

/**
 * @brief Reachability checks for devices.
 *
 * The primary check (ICMP echo or TCP connect) and the auxiliary
 * remote-access check run side by side, so a probe takes at most about
 * one timeout. Implements the core::IProber interface.
 *
 * @note ICMP needs an unprivileged ping socket or CAP_NET_RAW. Without
 *       either, Ping devices report Error with PermissionDenied.
 */
class Prober : public core::IProber {
public:
    explicit Prober(ProberOptions options = {});

    core::ProbeResult probe(const core::Device& device, std::chrono::milliseconds timeout) override;

    [[nodiscard]] const ProberOptions& options() const { return options_; }

private:
    CheckResult primaryCheck(const core::Device& device, std::chrono::milliseconds timeout) const;
    bool auxiliaryCheck(const std::string& host, std::chrono::milliseconds timeout) const;

    ProberOptions options_;
    IcmpPinger pinger_;
    TcpConnector connector_;
};

} // namespace vikabh::infra
