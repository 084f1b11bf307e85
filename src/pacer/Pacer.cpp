#include "pacer/Pacer.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace rfs::pacer;
using namespace rfs::concurrency;
using namespace rfs::logging;
using namespace std::chrono;

Pacer::Pacer() : Pacer(DEFAULT_MAX_CONNECTIONS, DEFAULT_RETRIES) {}

Pacer::Pacer(const config::PacerConfig& cfg)
    : Pacer(cfg.max_connections, cfg.retries,
            std::make_shared<DefaultCalculator>(cfg.min_sleep, cfg.max_sleep, cfg.decay_constant)) {}

Pacer::Pacer(const unsigned int maxConnections, const int retries,
             std::shared_ptr<const Calculator> calculator,
             std::shared_ptr<const Invoker> invoker)
    : retries_(retries),
      calculator_(std::move(calculator)),
      invoker_(std::move(invoker)),
      connTokens_(maxConnections) {
    if (retries_ < 0) throw std::invalid_argument("[Pacer] Retries must not be negative");
    if (!calculator_) throw std::invalid_argument("[Pacer] Calculator is required");
    if (!invoker_) throw std::invalid_argument("[Pacer] Invoker is required");
}

void Pacer::call(const Context& ctx, const Paced& fn) {
    run(ctx, fn, retries());
}

void Pacer::call(const Paced& fn) {
    run(Context::background(), fn, retries());
}

void Pacer::callNoRetry(const Context& ctx, const Paced& fn) {
    run(ctx, fn, 0);
}

// retry bookkeeping is cleared on every exit, exceptions included
void Pacer::run(const Context& ctx, const Paced& fn, const int retries) {
    try {
        retryLoop(ctx, fn, retries);
    } catch (...) {
        resetState();
        throw;
    }
    resetState();
}

void Pacer::retryLoop(const Context& ctx, const Paced& fn, const int retries) {
    std::shared_ptr<const Invoker> invoker;
    {
        std::scoped_lock lock(mutex_);
        invoker = invoker_;
    }

    // carried over from the backoff sleep of the previous attempt
    TokenPool::Lease pacing;

    for (int attempt = 0;; ++attempt) {
        if (!pacing.held()) pacing = pacingTokens_.acquire(ctx);
        auto conn = connTokens_.acquire(ctx);
        pacing.release();

        const auto result = invoker->invoke(attempt, retries, fn);
        conn.release();

        if (!result.retry || attempt >= retries) {
            if (result.error) std::rethrow_exception(result.error);
            return;
        }

        nanoseconds sleepTime;
        {
            std::scoped_lock lock(mutex_);
            ++state_.consecutiveRetries;
            state_.lastError = result.error;
            sleepTime = calculator_->calculate(state_);
            state_.sleepTime = sleepTime;
        }

        LogRegistry::pacer()->debug("[Pacer] Attempt {}/{} asked for a retry, backing off {}ms",
                                    attempt + 1, retries + 1, duration_cast<milliseconds>(sleepTime).count());

        pacing = pacingTokens_.acquire(ctx);
        ctx.sleepFor(sleepTime);
    }
}

void Pacer::resetState() {
    std::scoped_lock lock(mutex_);
    state_.consecutiveRetries = 0;
    state_.lastError = nullptr;
}

void Pacer::setMaxConnections(const unsigned int n) {
    connTokens_.resize(n);
    LogRegistry::pacer()->info("[Pacer] Connection pool resized to {}", n);
}

void Pacer::setRetries(const int retries) {
    if (retries < 0) throw std::invalid_argument("[Pacer] Retries must not be negative");
    std::scoped_lock lock(mutex_);
    retries_ = retries;
}

void Pacer::setCalculator(std::shared_ptr<const Calculator> calculator) {
    if (!calculator) throw std::invalid_argument("[Pacer] Calculator is required");
    std::scoped_lock lock(mutex_);
    calculator_ = std::move(calculator);
}

void Pacer::setInvoker(std::shared_ptr<const Invoker> invoker) {
    if (!invoker) throw std::invalid_argument("[Pacer] Invoker is required");
    std::scoped_lock lock(mutex_);
    invoker_ = std::move(invoker);
}

unsigned int Pacer::maxConnections() const {
    return connTokens_.capacity();
}

int Pacer::retries() const {
    std::scoped_lock lock(mutex_);
    return retries_;
}

State Pacer::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}
