#pragma once

#include <chrono>

namespace xorblur {

class Timer {
public:
    void start();
    void stop();
    double elapsedSeconds() const;

private:
    using Clock = std::chrono::steady_clock;

    Clock::time_point startTime_;
    Clock::time_point endTime_;
};

}
