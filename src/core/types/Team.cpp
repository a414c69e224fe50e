#include "core/types/Team.hpp"

#include <algorithm>
#include <cctype>

namespace vikabh::core {

bool Team::isValid() const {
    return std::any_of(name.begin(), name.end(),
                       [](unsigned char c) { return !std::isspace(c); });
}

} // namespace vikabh::core
