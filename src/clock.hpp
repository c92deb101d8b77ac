#pragma once

#include <chrono>
#include <cstdint>

// Wall clock in unix seconds. Injected so tests can drive time.
class Clock {
  public:
    virtual ~Clock() = default;
    virtual std::int64_t NowUnix() const = 0;
};

class SystemClock : public Clock {
  public:
    std::int64_t NowUnix() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }
};
