#include "pacer/Calculator.hpp"

#include <limits>
#include <stdexcept>

using namespace rfs::pacer;
using namespace std::chrono;

DefaultCalculator::DefaultCalculator(const nanoseconds minSleep, const nanoseconds maxSleep,
                                     const unsigned int decayConstant)
    : minSleep_(minSleep), maxSleep_(maxSleep), decayConstant_(decayConstant) {
    if (minSleep_ < nanoseconds::zero() || maxSleep_ < nanoseconds::zero())
        throw std::invalid_argument("[DefaultCalculator] Sleep bounds must not be negative");
    if (decayConstant_ >= std::numeric_limits<nanoseconds::rep>::digits)
        throw std::invalid_argument("[DefaultCalculator] Decay constant too large");
}

nanoseconds DefaultCalculator::calculate(const State& state) const {
    if (state.consecutiveRetries <= 0) return nanoseconds::zero();
    if (state.consecutiveRetries == 1) return minSleep_;

    // saturate instead of overflowing the shift
    constexpr auto maxRep = std::numeric_limits<nanoseconds::rep>::max();
    const auto prev = state.sleepTime.count();
    auto sleepTime = prev > (maxRep >> decayConstant_) ? nanoseconds(maxRep) : nanoseconds(prev << decayConstant_);

    if (sleepTime < minSleep_) sleepTime = minSleep_;
    if (maxSleep_ > nanoseconds::zero() && sleepTime > maxSleep_) sleepTime = maxSleep_;
    return sleepTime;
}
