#include "IClock.hpp"

namespace fleetsense {

std::string SystemClock::iso8601() const {
    return formatIso8601(now());
}

} // namespace fleetsense
