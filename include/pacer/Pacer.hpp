#pragma once

#include "concurrency/Context.hpp"
#include "concurrency/TokenPool.hpp"
#include "pacer/Calculator.hpp"
#include "pacer/Invoker.hpp"
#include "pacer/State.hpp"

#include <memory>
#include <mutex>

namespace rfs::config {
struct PacerConfig;
}

namespace rfs::pacer {

/// Paces, retries and bounds the concurrency of calls to a remote backend.
///
/// Every attempt needs the single pacing token and then one of the
/// connection tokens. The connection token is handed back as soon as the
/// attempt returns. When an attempt asks for a retry, the caller takes the
/// pacing token again and keeps it through the backoff sleep, so no other
/// call can start while a retry round is waiting.
class Pacer {
public:
    static constexpr unsigned int DEFAULT_MAX_CONNECTIONS = 8;
    static constexpr int DEFAULT_RETRIES = 10;

    Pacer();
    explicit Pacer(const config::PacerConfig& cfg);
    Pacer(unsigned int maxConnections, int retries,
          std::shared_ptr<const Calculator> calculator = std::make_shared<DefaultCalculator>(),
          std::shared_ptr<const Invoker> invoker = std::make_shared<DefaultInvoker>());

    Pacer(const Pacer&) = delete;
    Pacer& operator=(const Pacer&) = delete;

    /// Runs fn until it stops asking for retries or the budget is spent.
    /// Rethrows the last attempt's error, if any. Throws Cancelled or
    /// DeadlineExceeded when ctx ends while waiting for a token or sleeping.
    void call(const concurrency::Context& ctx, const Paced& fn);
    void call(const Paced& fn);

    /// Single paced attempt, a retry request is ignored.
    void callNoRetry(const concurrency::Context& ctx, const Paced& fn);

    void setMaxConnections(unsigned int n);
    void setRetries(int retries);
    void setCalculator(std::shared_ptr<const Calculator> calculator);
    void setInvoker(std::shared_ptr<const Invoker> invoker);

    [[nodiscard]] unsigned int maxConnections() const;
    [[nodiscard]] int retries() const;
    [[nodiscard]] State state() const;

private:
    void run(const concurrency::Context& ctx, const Paced& fn, int retries);
    void retryLoop(const concurrency::Context& ctx, const Paced& fn, int retries);
    void resetState();

    mutable std::mutex mutex_;   // guards state_, retries_, calculator_, invoker_
    State state_;
    int retries_;
    std::shared_ptr<const Calculator> calculator_;
    std::shared_ptr<const Invoker> invoker_;

    concurrency::TokenPool pacingTokens_{1};
    concurrency::TokenPool connTokens_;
};

}
