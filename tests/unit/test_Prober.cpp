#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/HostResolver.hpp"
#include "infrastructure/network/IcmpPinger.hpp"
#include "infrastructure/network/Prober.hpp"
#include "infrastructure/network/TcpConnector.hpp"

#include <asio.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <vector>

using namespace vikabh::core;
using namespace vikabh::infra;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Listening socket on 127.0.0.1 with an ephemeral port.
 *
 * Connections complete in the kernel backlog, so nothing needs to accept them.
 */
class LocalListener {
public:
    LocalListener()
        : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    void close() { acceptor_.close(); }

private:
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
};

/// A port that was listening a moment ago and is now closed.
uint16_t closedPort() {
    LocalListener listener;
    uint16_t port = listener.port();
    listener.close();
    return port;
}

Device tcpDevice(const std::string& host, int port) {
    Device device;
    device.id = 7;
    device.name = "Switch";
    device.host = host;
    device.method = CheckMethod::Tcp;
    device.port = port;
    return device;
}

/**
 * @brief ICMP error message quoting an echo request sent to destination.
 * @param type 3 (destination unreachable) or 11 (time exceeded).
 */
std::vector<uint8_t> icmpError(uint8_t type, uint32_t destination, uint16_t identifier,
                               uint16_t sequence) {
    std::vector<uint8_t> message(8, 0);
    message[0] = type;
    message[1] = 1;

    std::vector<uint8_t> quotedIp(20, 0);
    quotedIp[0] = 0x45;
    quotedIp[8] = 64;
    quotedIp[9] = 1; // ICMP
    quotedIp[12] = 10;
    quotedIp[15] = 2;
    quotedIp[16] = static_cast<uint8_t>(destination >> 24);
    quotedIp[17] = static_cast<uint8_t>(destination >> 16);
    quotedIp[18] = static_cast<uint8_t>(destination >> 8);
    quotedIp[19] = static_cast<uint8_t>(destination);
    message.insert(message.end(), quotedIp.begin(), quotedIp.end());

    auto request = IcmpPinger::buildEchoRequest(identifier, sequence);
    message.insert(message.end(), request.begin(), request.begin() + 8);
    return message;
}

/// Lookup that blocks until released, like a resolver whose nameserver never answers.
class StalledLookup {
public:
    HostResolver::Lookup lookup() const {
        auto gate = gate_;
        return [gate](const std::string&, asio::error_code&) {
            gate->wait();
            return std::vector<asio::ip::address>{};
        };
    }

    ~StalledLookup() { release_.set_value(); }

private:
    std::promise<void> release_;
    std::shared_ptr<std::shared_future<void>> gate_ =
        std::make_shared<std::shared_future<void>>(release_.get_future().share());
};

} // namespace

TEST_CASE("TcpConnector connects with a deadline", "[Prober][TcpConnector]") {
    TcpConnector connector;

    SECTION("Open port succeeds with a connect time") {
        LocalListener listener;
        auto result = connector.connect("127.0.0.1", listener.port(), 1s);

        REQUIRE(result.ok());
        REQUIRE(result.elapsed.count() >= 0);
        REQUIRE(result.elapsed < 1s);
    }

    SECTION("Closed port is refused") {
        auto result = connector.connect("127.0.0.1", closedPort(), 1s);

        REQUIRE_FALSE(result.ok());
        REQUIRE(result.failure == ProbeFailure::Refused);
        REQUIRE_FALSE(result.message.empty());
    }

    SECTION("Hostnames are resolved") {
        LocalListener listener;
        auto result = connector.connect("localhost", listener.port(), 2s);
        REQUIRE(result.ok());
    }

    SECTION("Repeated checks do not leak sockets") {
        LocalListener listener;
        for (int i = 0; i < 200; ++i) {
            REQUIRE(connector.connect("127.0.0.1", listener.port(), 1s).ok());
        }
    }
}

TEST_CASE("TcpConnector error classification", "[Prober][TcpConnector]") {
    REQUIRE(TcpConnector::classify(asio::error::connection_refused, false) ==
            ProbeFailure::Refused);
    REQUIRE(TcpConnector::classify(asio::error::timed_out, false) == ProbeFailure::Timeout);
    REQUIRE(TcpConnector::classify(asio::error::host_unreachable, false) ==
            ProbeFailure::Unreachable);
    REQUIRE(TcpConnector::classify(asio::error::network_unreachable, false) ==
            ProbeFailure::Unreachable);
    REQUIRE(TcpConnector::classify(asio::error::access_denied, false) ==
            ProbeFailure::PermissionDenied);
    REQUIRE(TcpConnector::classify(asio::error::host_not_found, true) ==
            ProbeFailure::ResolutionFailed);
}

TEST_CASE("IcmpPinger echo request encoding", "[Prober][IcmpPinger]") {
    auto packet = IcmpPinger::buildEchoRequest(0x1234, 0x0042);

    REQUIRE(packet.size() == 64);
    REQUIRE(packet[0] == 8);
    REQUIRE(packet[1] == 0);
    REQUIRE(packet[4] == 0x12);
    REQUIRE(packet[5] == 0x34);
    REQUIRE(packet[6] == 0x00);
    REQUIRE(packet[7] == 0x42);

    // A packet carrying its own checksum sums to zero
    REQUIRE(IcmpPinger::calculateChecksum(packet.data(), packet.size()) == 0);
}

TEST_CASE("IcmpPinger checksum of odd-length data", "[Prober][IcmpPinger]") {
    const uint8_t data[] = {0x01, 0x02, 0x03};
    // 0x0102 + 0x0300 = 0x0402, complemented
    REQUIRE(IcmpPinger::calculateChecksum(data, sizeof(data)) == 0xFBFD);
}

TEST_CASE("Prober TCP devices", "[Prober]") {
    SECTION("Reachable port is Online with latency") {
        LocalListener listener;
        Prober prober(ProberOptions{.auxiliaryPort = closedPort(), .defaultTcpPort = 80});

        auto result = prober.probe(tcpDevice("127.0.0.1", listener.port()), 1s);

        REQUIRE(result.deviceId == 7);
        REQUIRE(result.outcome == ProbeOutcome::Online);
        REQUIRE(result.latency.has_value());
        REQUIRE(result.failure == ProbeFailure::None);
        REQUIRE_FALSE(result.auxiliaryServiceDetected);
    }

    SECTION("Refused port is Offline without latency") {
        Prober prober(ProberOptions{.auxiliaryPort = closedPort(), .defaultTcpPort = 80});

        auto result = prober.probe(tcpDevice("127.0.0.1", closedPort()), 1s);

        REQUIRE(result.outcome == ProbeOutcome::Offline);
        REQUIRE(result.failure == ProbeFailure::Refused);
        REQUIRE_FALSE(result.latency.has_value());
    }

    SECTION("Port 0 falls back to the default TCP port") {
        LocalListener listener;
        Prober prober(
            ProberOptions{.auxiliaryPort = closedPort(), .defaultTcpPort = listener.port()});

        auto result = prober.probe(tcpDevice("127.0.0.1", 0), 1s);
        REQUIRE(result.outcome == ProbeOutcome::Online);
    }

    SECTION("Unresolvable host is Error") {
        Prober prober(ProberOptions{.auxiliaryPort = closedPort(), .defaultTcpPort = 80});

        auto result = prober.probe(tcpDevice("no-such-device.invalid", 80), 3s);

        REQUIRE(result.outcome == ProbeOutcome::Error);
        REQUIRE(result.failure == ProbeFailure::ResolutionFailed);
        REQUIRE_FALSE(result.latency.has_value());
        REQUIRE_FALSE(result.message.empty());
    }
}

TEST_CASE("Prober auxiliary remote-access detection", "[Prober]") {
    SECTION("Detected when the auxiliary port accepts") {
        LocalListener primary;
        LocalListener remoteAccess;
        Prober prober(ProberOptions{.auxiliaryPort = remoteAccess.port(), .defaultTcpPort = 80});

        auto result = prober.probe(tcpDevice("127.0.0.1", primary.port()), 1s);

        REQUIRE(result.outcome == ProbeOutcome::Online);
        REQUIRE(result.auxiliaryServiceDetected);
    }

    SECTION("Does not change a failed primary outcome") {
        LocalListener remoteAccess;
        Prober prober(ProberOptions{.auxiliaryPort = remoteAccess.port(), .defaultTcpPort = 80});

        auto result = prober.probe(tcpDevice("127.0.0.1", closedPort()), 1s);

        REQUIRE(result.outcome == ProbeOutcome::Offline);
        REQUIRE(result.auxiliaryServiceDetected);
    }
}

TEST_CASE("Prober respects the timeout", "[Prober]") {
    Prober prober(ProberOptions{.auxiliaryPort = closedPort(), .defaultTcpPort = 80});

    // TEST-NET-1 address: either silently dropped (timeout) or reported unreachable
    auto device = tcpDevice("192.0.2.1", 9);
    auto started = std::chrono::steady_clock::now();
    auto result = prober.probe(device, 300ms);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.outcome != ProbeOutcome::Online);
    REQUIRE(elapsed < 1500ms);
}

TEST_CASE("Prober is safe to call concurrently", "[Prober]") {
    LocalListener listener;
    Prober prober(ProberOptions{.auxiliaryPort = closedPort(), .defaultTcpPort = 80});

    std::vector<std::future<ProbeResult>> results;
    for (int i = 0; i < 16; ++i) {
        results.push_back(std::async(std::launch::async, [&prober, &listener, i]() {
            auto device = tcpDevice("127.0.0.1", listener.port());
            device.id = i;
            return prober.probe(device, 1s);
        }));
    }

    for (int i = 0; i < 16; ++i) {
        auto result = results[i].get();
        REQUIRE(result.deviceId == i);
        REQUIRE(result.outcome == ProbeOutcome::Online);
    }
}

TEST_CASE("Prober ping devices", "[Prober][IcmpPinger]") {
    Prober prober;
    Device device;
    device.id = 1;
    device.name = "Loopback";
    device.host = "127.0.0.1";
    device.method = CheckMethod::Ping;

    auto result = prober.probe(device, 1s);

    // Without ping socket permission the check reports Error, never throws
    if (result.outcome == ProbeOutcome::Online) {
        REQUIRE(result.latency.has_value());
    } else {
        REQUIRE(result.outcome == ProbeOutcome::Error);
        REQUIRE(result.failure == ProbeFailure::PermissionDenied);
    }
}

TEST_CASE("IcmpPinger matches replies to the request in flight", "[Prober][IcmpPinger]") {
    constexpr uint32_t kTarget = 0x0A000005;  // 10.0.0.5
    constexpr uint32_t kNeighbor = 0x0A000006; // 10.0.0.6
    constexpr uint16_t kId = 0x1234;
    constexpr uint16_t kSeq = 0x0042;

    auto classify = [&](const std::vector<uint8_t>& message, bool checkIdentifier = true) {
        return IcmpPinger::classifyReply(message.data(), message.size(), kTarget, kId, kSeq,
                                         checkIdentifier);
    };

    SECTION("Our echo reply") {
        auto reply = IcmpPinger::buildEchoRequest(kId, kSeq);
        reply[0] = 0;
        REQUIRE(classify(reply) == IcmpPinger::ReplyKind::EchoReply);

        auto otherSequence = IcmpPinger::buildEchoRequest(kId, kSeq + 1);
        otherSequence[0] = 0;
        REQUIRE(classify(otherSequence) == IcmpPinger::ReplyKind::Unrelated);
    }

    SECTION("Unreachable quoting our request") {
        REQUIRE(classify(icmpError(3, kTarget, kId, kSeq)) ==
                IcmpPinger::ReplyKind::Unreachable);
        REQUIRE(classify(icmpError(11, kTarget, kId, kSeq)) ==
                IcmpPinger::ReplyKind::Unreachable);
    }

    SECTION("Unreachable for another destination is ignored") {
        REQUIRE(classify(icmpError(3, kNeighbor, kId, kSeq)) ==
                IcmpPinger::ReplyKind::Unrelated);
    }

    SECTION("Unreachable for another request to the same destination is ignored") {
        REQUIRE(classify(icmpError(3, kTarget, kId + 1, kSeq)) ==
                IcmpPinger::ReplyKind::Unrelated);
        REQUIRE(classify(icmpError(3, kTarget, kId, kSeq + 1)) ==
                IcmpPinger::ReplyKind::Unrelated);
    }

    SECTION("Datagram sockets compare only the sequence") {
        REQUIRE(classify(icmpError(3, kTarget, 0x9999, kSeq), false) ==
                IcmpPinger::ReplyKind::Unreachable);
        REQUIRE(classify(icmpError(3, kTarget, 0x9999, kSeq + 1), false) ==
                IcmpPinger::ReplyKind::Unrelated);
    }

    SECTION("Truncated error message is ignored") {
        auto message = icmpError(3, kTarget, kId, kSeq);
        message.resize(8 + 20 + 4);
        REQUIRE(classify(message) == IcmpPinger::ReplyKind::Unrelated);
    }

    SECTION("Other ICMP types are ignored") {
        auto redirect = icmpError(5, kTarget, kId, kSeq);
        REQUIRE(classify(redirect) == IcmpPinger::ReplyKind::Unrelated);
    }
}

TEST_CASE("Name resolution is bounded by the check timeout", "[Prober][HostResolver]") {
    StalledLookup stalled;

    SECTION("HostResolver abandons a lookup that does not answer") {
        HostResolver resolver(stalled.lookup());

        auto started = std::chrono::steady_clock::now();
        auto resolution = resolver.resolve("printer.example", 200ms);
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(resolution.timedOut);
        REQUIRE_FALSE(resolution.ok());
        REQUIRE(elapsed < 1s);
    }

    SECTION("HostResolver passes lookup failures through") {
        HostResolver resolver([](const std::string&, asio::error_code& ec) {
            ec = asio::error::host_not_found;
            return std::vector<asio::ip::address>{};
        });

        auto resolution = resolver.resolve("printer.example", 1s);

        REQUIRE_FALSE(resolution.timedOut);
        REQUIRE(resolution.error == asio::error::host_not_found);
    }

    SECTION("TcpConnector reports Timeout within its deadline") {
        TcpConnector connector{HostResolver(stalled.lookup())};

        auto started = std::chrono::steady_clock::now();
        auto result = connector.connect("printer.example", 80, 200ms);
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(result.failure == ProbeFailure::Timeout);
        REQUIRE(elapsed < 1s);
    }

    SECTION("TcpConnector connects to resolved addresses") {
        LocalListener listener;
        TcpConnector connector{HostResolver([](const std::string&, asio::error_code&) {
            return std::vector<asio::ip::address>{asio::ip::make_address("127.0.0.1")};
        })};

        REQUIRE(connector.connect("printer.example", listener.port(), 1s).ok());
    }

    SECTION("IcmpPinger reports Timeout within its deadline") {
        IcmpPinger pinger{HostResolver(stalled.lookup())};

        auto started = std::chrono::steady_clock::now();
        auto result = pinger.ping("printer.example", 200ms);
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(result.failure == ProbeFailure::Timeout);
        REQUIRE(elapsed < 1s);
    }

    SECTION("IcmpPinger rejects names without an IPv4 address") {
        IcmpPinger pinger{HostResolver([](const std::string&, asio::error_code&) {
            return std::vector<asio::ip::address>{asio::ip::make_address("::1")};
        })};

        auto result = pinger.ping("printer.example", 1s);
        REQUIRE(result.failure == ProbeFailure::ResolutionFailed);
    }
}
