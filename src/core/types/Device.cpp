#include "core/types/Device.hpp"

#include "core/types/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace vikabh::core {

bool Device::isValid() const {
    if (name.empty() || host.empty()) {
        return false;
    }
    if (method == CheckMethod::Tcp) {
        return port >= kMinPort && port <= kMaxPort;
    }
    return true;
}

void Device::validate() const {
    if (name.empty()) {
        throw ConfigurationError("Device name must not be empty");
    }
    if (host.empty()) {
        throw ConfigurationError("Device host must not be empty");
    }
    if (method == CheckMethod::Tcp && (port < kMinPort || port > kMaxPort)) {
        throw ConfigurationError("TCP device '" + name + "' requires a port in [1, 65535], got " +
                                 std::to_string(port));
    }
}

std::string Device::methodToString() const {
    return method == CheckMethod::Tcp ? "TCP" : "Ping";
}

CheckMethod Device::methodFromString(const std::string& str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.starts_with("tcp") ? CheckMethod::Tcp : CheckMethod::Ping;
}

} // namespace vikabh::core
