#pragma once

#include "infrastructure/network/CheckResult.hpp"
#include "infrastructure/network/HostResolver.hpp"

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace vikabh::infra {

/**
 * @brief TCP reachability check with a hard deadline.
 *
 * Each call runs on its own io_context so concurrent calls share nothing.
 * The socket is closed before connect() returns, whatever the outcome.
 */
class TcpConnector {
public:
    explicit TcpConnector(HostResolver resolver = HostResolver());

    /**
     * @brief Attempts a TCP connection to host:port.
     * @param host Hostname or IP literal. IP literals skip name resolution.
     * @param port Destination port.
     * @param timeout Deadline for resolution plus connection establishment.
     * @return Success with the connect time, or the failure reason.
     *
     * @note Resolution time is charged against the deadline. A lookup that
     *       is still pending when it expires is abandoned and reported as
     *       Timeout.
     */
    CheckResult connect(const std::string& host, uint16_t port,
                        std::chrono::milliseconds timeout) const;

    /**
     * @brief Maps an Asio/system error from resolve or connect to a failure reason.
     */
    static core::ProbeFailure classify(const asio::error_code& ec, bool duringResolve);

private:
    HostResolver resolver_;
};

} // namespace vikabh::infra
