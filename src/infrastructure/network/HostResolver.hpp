#pragma once

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace vikabh::infra {

/**
 * @brief Outcome of a name lookup that was given a deadline.
 */
struct Resolution {
    std::vector<asio::ip::address> addresses;
    asio::error_code error; ///< Set when the lookup itself failed
    bool timedOut{false};   ///< Lookup still running when the deadline passed

    [[nodiscard]] bool ok() const { return !timedOut && !error && !addresses.empty(); }
};

/**
 * @brief Hostname lookup bounded by a deadline.
 *
 * The system resolver blocks and cannot be cancelled, so each lookup runs on
 * its own detached thread. When the deadline passes first, the result is
 * abandoned and the thread finishes on its own.
 */
class HostResolver {
public:
    /// Blocking lookup; reports failure through the error code.
    using Lookup =
        std::function<std::vector<asio::ip::address>(const std::string& host, asio::error_code&)>;

    explicit HostResolver(Lookup lookup = systemLookup);

    /**
     * @brief Resolves host, waiting at most timeout for the answer.
     * @throws std::system_error if the lookup thread cannot be created.
     */
    Resolution resolve(const std::string& host, std::chrono::milliseconds timeout) const;

    /// getaddrinfo through Asio's synchronous resolver.
    static std::vector<asio::ip::address> systemLookup(const std::string& host,
                                                       asio::error_code& ec);

private:
    Lookup lookup_;
};

} // namespace vikabh::infra
