#include "clock.hpp"

#include <limits>
#include <stdexcept>

namespace pd {

ManualClock::ManualClock(Tick start)
    : now_(start) {}

void ManualClock::advance(Tick ticks) {
    if (std::numeric_limits<Tick>::max() - now_ < ticks) {
        throw std::overflow_error("clock advance overflows tick counter");
    }
    now_ += ticks;
}

void ManualClock::set(Tick tick) {
    if (tick < now_) {
        throw std::invalid_argument("clock must not move backwards");
    }
    now_ = tick;
}

} // namespace pd
