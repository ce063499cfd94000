#pragma once
#include <chrono>

namespace edgli {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

class IClock {
public:
    virtual ~IClock() = default;
    virtual TimePoint Now() const = 0;
};

class SteadyClock final : public IClock {
public:
    TimePoint Now() const override { return Clock::now(); }
};

}
