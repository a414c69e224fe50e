#include "infrastructure/network/HostResolver.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <memory>
#include <thread>

namespace vikabh::infra {

HostResolver::HostResolver(Lookup lookup) : lookup_(std::move(lookup)) {}

std::vector<asio::ip::address> HostResolver::systemLookup(const std::string& host,
                                                          asio::error_code& ec) {
    asio::io_context io;
    asio::ip::tcp::resolver resolver(io);
    auto results = resolver.resolve(host, "", ec);

    std::vector<asio::ip::address> addresses;
    if (ec) {
        return addresses;
    }
    for (const auto& entry : results) {
        addresses.push_back(entry.endpoint().address());
    }
    return addresses;
}

Resolution HostResolver::resolve(const std::string& host,
                                 std::chrono::milliseconds timeout) const {
    auto promise = std::make_shared<std::promise<Resolution>>();
    auto future = promise->get_future();

    std::thread([lookup = lookup_, host, promise]() {
        try {
            Resolution resolution;
            resolution.addresses = lookup(host, resolution.error);
            promise->set_value(std::move(resolution));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        spdlog::trace("Lookup of {} still pending after {}ms, abandoned", host, timeout.count());
        Resolution abandoned;
        abandoned.timedOut = true;
        return abandoned;
    }
    return future.get();
}

} // namespace vikabh::infra
