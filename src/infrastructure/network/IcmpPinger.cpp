#include "infrastructure/network/IcmpPinger.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <random>

#ifdef __linux__
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace vikabh::infra {

namespace {

constexpr uint8_t kEchoRequest = 8;
constexpr uint8_t kEchoReply = 0;
constexpr uint8_t kDestinationUnreachable = 3;
constexpr uint8_t kTimeExceeded = 11;
constexpr uint8_t kProtocolIcmp = 1;
constexpr size_t kIcmpHeaderSize = 8;
constexpr size_t kMinIpHeaderSize = 20;
constexpr size_t kPacketSize = 64;

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t readU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint16_t nextRandom() {
    thread_local std::mt19937 rng{std::random_device{}()};
    return static_cast<uint16_t>(rng() & 0xFFFF);
}

#ifdef __linux__

/// Owns a socket descriptor for the duration of one exchange.
class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

core::ProbeFailure failureForErrno(int err) {
    switch (err) {
    case EACCES:
    case EPERM:
        return core::ProbeFailure::PermissionDenied;
    case EHOSTUNREACH:
    case ENETUNREACH:
    case ENETDOWN:
        return core::ProbeFailure::Unreachable;
    case ETIMEDOUT:
        return core::ProbeFailure::Timeout;
    default:
        return core::ProbeFailure::Internal;
    }
}

#endif

} // namespace

IcmpPinger::IcmpPinger(HostResolver resolver) : resolver_(std::move(resolver)) {}

uint16_t IcmpPinger::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> IcmpPinger::buildEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(kPacketSize, 0);

    packet[0] = kEchoRequest;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

IcmpPinger::ReplyKind IcmpPinger::classifyReply(const uint8_t* icmp, size_t length,
                                                 uint32_t destination, uint16_t identifier,
                                                 uint16_t sequence, bool checkIdentifier) {
    if (length < kIcmpHeaderSize) {
        return ReplyKind::Unrelated;
    }

    if (icmp[0] == kEchoReply) {
        if (readU16(icmp + 6) != sequence ||
            (checkIdentifier && readU16(icmp + 4) != identifier)) {
            return ReplyKind::Unrelated;
        }
        return ReplyKind::EchoReply;
    }

    if (icmp[0] != kDestinationUnreachable && icmp[0] != kTimeExceeded) {
        return ReplyKind::Unrelated;
    }

    // Quoted IP header of the offending datagram, then its first 8 bytes
    const uint8_t* quoted = icmp + kIcmpHeaderSize;
    size_t quotedLength = length - kIcmpHeaderSize;
    if (quotedLength < kMinIpHeaderSize) {
        return ReplyKind::Unrelated;
    }
    size_t headerLength = static_cast<size_t>((quoted[0] & 0x0F) * 4);
    if (headerLength < kMinIpHeaderSize || quotedLength < headerLength + kIcmpHeaderSize) {
        return ReplyKind::Unrelated;
    }
    if (quoted[9] != kProtocolIcmp || readU32(quoted + 16) != destination) {
        return ReplyKind::Unrelated;
    }

    const uint8_t* original = quoted + headerLength;
    if (original[0] != kEchoRequest || readU16(original + 6) != sequence ||
        (checkIdentifier && readU16(original + 4) != identifier)) {
        return ReplyKind::Unrelated;
    }
    return ReplyKind::Unreachable;
}

CheckResult IcmpPinger::ping(const std::string& host, std::chrono::milliseconds timeout) const {
#ifdef __linux__
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;
    auto timedOut = [&]() {
        return CheckResult::failed(core::ProbeFailure::Timeout,
                                   "no echo reply from " + host + " within " +
                                       std::to_string(timeout.count()) + "ms");
    };

    asio::error_code parseError;
    asio::ip::address_v4 target = asio::ip::make_address_v4(host, parseError);
    if (parseError) {
        Resolution resolution = resolver_.resolve(host, timeout);
        if (resolution.timedOut) {
            spdlog::trace("Echo to {}: lookup did not finish in time", host);
            return timedOut();
        }
        auto v4 = std::find_if(resolution.addresses.begin(), resolution.addresses.end(),
                               [](const asio::ip::address& a) { return a.is_v4(); });
        if (resolution.error || v4 == resolution.addresses.end()) {
            return CheckResult::failed(
                core::ProbeFailure::ResolutionFailed,
                "cannot resolve " + host + ": " +
                    (resolution.error ? resolution.error.message()
                                      : std::string("no IPv4 address")));
        }
        target = v4->to_v4();
    }

    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    dest.sin_addr.s_addr = htonl(target.to_uint());

    // Datagram ICMP sockets hand back the bare ICMP message and rewrite the
    // identifier; raw sockets include the IP header and keep ours.
    bool rawSocket = false;
    int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (fd < 0) {
        fd = ::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
        rawSocket = true;
    }
    if (fd < 0) {
        int err = errno;
        return CheckResult::failed(
            err == EPERM || err == EACCES ? core::ProbeFailure::PermissionDenied
                                          : core::ProbeFailure::Internal,
            std::string("cannot open ICMP socket (need CAP_NET_RAW or ping_group_range): ") +
                std::strerror(err));
    }
    SocketHandle sock(fd);

    const uint16_t identifier = nextRandom();
    const uint16_t sequence = nextRandom();
    auto packet = buildEchoRequest(identifier, sequence);

    auto sendTime = std::chrono::steady_clock::now();
    if (sendTime >= deadline) {
        return timedOut();
    }

    ssize_t sent = ::sendto(sock.get(), packet.data(), packet.size(), 0,
                            reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        int err = errno;
        return CheckResult::failed(failureForErrno(err),
                                   "echo request to " + host + " failed: " + std::strerror(err));
    }

    std::array<uint8_t, 1024> buffer{};
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        struct pollfd pfd {};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            return CheckResult::failed(core::ProbeFailure::Internal,
                                       std::string("poll failed: ") + std::strerror(err));
        }
        if (ready == 0) {
            break;
        }

        ssize_t received = ::recv(sock.get(), buffer.data(), buffer.size(), 0);
        auto recvTime = std::chrono::steady_clock::now();
        if (received < 0) {
            int err = errno;
            if (err == EINTR || err == EAGAIN) {
                continue;
            }
            return CheckResult::failed(failureForErrno(err),
                                       "echo reply from " + host + " failed: " + std::strerror(err));
        }

        size_t offset = 0;
        if (rawSocket) {
            if (received < 20) {
                continue;
            }
            offset = static_cast<size_t>((buffer[0] & 0x0F) * 4);
        }
        if (static_cast<size_t>(received) < offset + 8) {
            continue;
        }
        const uint8_t* icmp = buffer.data() + offset;

        auto kind = classifyReply(icmp, static_cast<size_t>(received) - offset, target.to_uint(),
                                  identifier, sequence, rawSocket);
        if (kind == ReplyKind::Unrelated) {
            continue;
        }
        if (kind == ReplyKind::Unreachable) {
            return CheckResult::failed(core::ProbeFailure::Unreachable,
                                       host + " reported destination unreachable");
        }

        auto rtt = std::chrono::duration_cast<std::chrono::microseconds>(recvTime - sendTime);
        spdlog::trace("Echo reply from {} in {}us", host, rtt.count());
        return CheckResult::success(rtt);
    }

    return timedOut();
#else
    (void)host;
    (void)timeout;
    return CheckResult::failed(core::ProbeFailure::Internal,
                               "ICMP echo is not implemented for this platform");
#endif
}

} // namespace vikabh::infra
