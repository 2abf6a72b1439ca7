#pragma once

#include <cstdint>

namespace pd {

using Tick = std::uint64_t;

// Monotonically non-decreasing tick counter supplied by the execution substrate.
class Clock {
public:
    virtual ~Clock() = default;
    virtual Tick now() const = 0;
};

// Caller-driven clock for tools and tests.
class ManualClock : public Clock {
public:
    explicit ManualClock(Tick start = 0);

    Tick now() const override { return now_; }
    void advance(Tick ticks);
    void set(Tick tick);

private:
    Tick now_;
};

} // namespace pd
