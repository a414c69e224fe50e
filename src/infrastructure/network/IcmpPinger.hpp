#pragma once

#include "infrastructure/network/CheckResult.hpp"
#include "infrastructure/network/HostResolver.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace vikabh::infra {

/**
 * @brief Single ICMP echo request/reply exchange.
 *
 * Uses an unprivileged ICMP datagram socket where the kernel allows it
 * (net.ipv4.ping_group_range) and falls back to a raw socket, which needs
 * CAP_NET_RAW. Each call owns its socket, so calls may run concurrently.
 */
class IcmpPinger {
public:
    /// How an incoming ICMP message relates to the request in flight.
    enum class ReplyKind {
        Unrelated,   ///< Someone else's traffic
        EchoReply,   ///< Our echo came back
        Unreachable, ///< Destination unreachable or time exceeded for our request
    };

    explicit IcmpPinger(HostResolver resolver = HostResolver());

    /**
     * @brief Sends one echo request and waits for the matching reply.
     * @param host Hostname or IPv4 literal.
     * @param timeout Deadline for name resolution plus the reply.
     * @return Success with the round-trip time, or the failure reason.
     */
    CheckResult ping(const std::string& host, std::chrono::milliseconds timeout) const;

    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildEchoRequest(uint16_t identifier, uint16_t sequence);

    /**
     * @brief Matches an ICMP message against the request in flight.
     *
     * Error messages quote the IP header and the first 8 bytes of the
     * offending datagram; they only count when that quote is our echo
     * request to our destination.
     *
     * @param icmp Start of the ICMP message (past any outer IP header).
     * @param length Bytes available from icmp.
     * @param destination Pinged IPv4 address, host byte order.
     * @param checkIdentifier False on datagram sockets, where the kernel
     *        rewrites the identifier.
     */
    static ReplyKind classifyReply(const uint8_t* icmp, size_t length, uint32_t destination,
                                   uint16_t identifier, uint16_t sequence, bool checkIdentifier);

private:
    HostResolver resolver_;
};

} // namespace vikabh::infra
