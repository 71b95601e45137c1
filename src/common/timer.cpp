#include "timer.hpp"

namespace xorblur {

void Timer::start() {
    startTime_ = Clock::now();
    endTime_ = startTime_;
}

void Timer::stop() {
    endTime_ = Clock::now();
}

double Timer::elapsedSeconds() const {
    return std::chrono::duration<double>(endTime_ - startTime_).count();
}

}
