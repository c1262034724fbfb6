#pragma once
#include <chrono>
#include <functional>

namespace asap::transport {

using SteadyClock = std::chrono::steady_clock;

// Injectable monotonic time source; an empty function means SteadyClock::now
using TimeSource = std::function<SteadyClock::time_point()>;

inline SteadyClock::time_point read_clock(const TimeSource& source) {
    return source ? source() : SteadyClock::now();
}

} // namespace asap::transport
