#include "clock.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

namespace rv {

std::uint64_t SystemClock::now() const {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since).count();
    return seconds < 0 ? 0 : static_cast<std::uint64_t>(seconds);
}

void ManualClock::advance(std::uint64_t seconds) {
    if (std::numeric_limits<std::uint64_t>::max() - now_ < seconds) {
        throw std::overflow_error("ManualClock advanced past the end of time");
    }
    now_ += seconds;
}

} // namespace rv
