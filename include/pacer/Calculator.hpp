#pragma once

#include "pacer/State.hpp"

#include <chrono>

namespace rfs::pacer {

/// Backoff strategy. Implementations must be pure functions of the state.
class Calculator {
public:
    virtual ~Calculator() = default;

    [[nodiscard]] virtual std::chrono::nanoseconds calculate(const State& state) const = 0;
};

/// No delay before the first retry is requested, minSleep after exactly one,
/// then the previous delay shifted left by decayConstant, clamped to
/// [minSleep, maxSleep]. A zero maxSleep leaves growth unbounded.
class DefaultCalculator final : public Calculator {
public:
    static constexpr std::chrono::nanoseconds DEFAULT_MIN_SLEEP = std::chrono::milliseconds(10);
    static constexpr std::chrono::nanoseconds DEFAULT_MAX_SLEEP = std::chrono::seconds(2);
    static constexpr unsigned int DEFAULT_DECAY_CONSTANT = 2;

    DefaultCalculator() = default;
    DefaultCalculator(std::chrono::nanoseconds minSleep, std::chrono::nanoseconds maxSleep,
                      unsigned int decayConstant);

    [[nodiscard]] std::chrono::nanoseconds calculate(const State& state) const override;

    [[nodiscard]] std::chrono::nanoseconds minSleep() const { return minSleep_; }
    [[nodiscard]] std::chrono::nanoseconds maxSleep() const { return maxSleep_; }
    [[nodiscard]] unsigned int decayConstant() const { return decayConstant_; }

private:
    std::chrono::nanoseconds minSleep_ = DEFAULT_MIN_SLEEP;
    std::chrono::nanoseconds maxSleep_ = DEFAULT_MAX_SLEEP;
    unsigned int decayConstant_ = DEFAULT_DECAY_CONSTANT;
};

}
