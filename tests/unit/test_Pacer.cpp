#include "pacer/Pacer.hpp"
#include "config/Config.hpp"
#include "errors/Errors.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace rfs::pacer;
using namespace rfs::concurrency;
using namespace rfs::errors;
using namespace std::chrono;
using namespace std::chrono_literals;

namespace {

class RecordingCalculator : public Calculator {
public:
    explicit RecordingCalculator(DefaultCalculator inner) : inner_(inner) {}

    nanoseconds calculate(const State& state) const override {
        const auto d = inner_.calculate(state);
        std::scoped_lock lock(mutex_);
        delays_.push_back(d);
        return d;
    }

    std::vector<nanoseconds> delays() const {
        std::scoped_lock lock(mutex_);
        return delays_;
    }

private:
    DefaultCalculator inner_;
    mutable std::mutex mutex_;
    mutable std::vector<nanoseconds> delays_;
};

class FixedCalculator : public Calculator {
public:
    explicit FixedCalculator(const nanoseconds d) : d_(d) {}
    nanoseconds calculate(const State&) const override { return d_; }

private:
    nanoseconds d_;
};

class CountingInvoker : public Invoker {
public:
    Attempt invoke(const int attempt, const int retries, const Paced& paced) const override {
        ++calls;
        return DefaultInvoker().invoke(attempt, retries, paced);
    }

    mutable std::atomic<int> calls{0};
};

}

class PacerTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingCalculator> calculator =
        std::make_shared<RecordingCalculator>(DefaultCalculator(1ms, 8ms, 1));
    std::atomic<int> invocations{0};
};

TEST_F(PacerTest, SuccessInvokesOnce) {
    Pacer pacer(4, 5, calculator);
    pacer.call([&] {
        ++invocations;
        return Attempt::done();
    });
    EXPECT_EQ(invocations.load(), 1);
    EXPECT_TRUE(calculator->delays().empty());
}

TEST_F(PacerTest, PollsUntilDoneWithoutError) {
    Pacer pacer(4, 5, calculator);
    pacer.call([&] {
        return ++invocations < 3 ? Attempt::again() : Attempt::done();
    });
    EXPECT_EQ(invocations.load(), 3);
    EXPECT_EQ(calculator->delays().size(), 2u);
}

TEST_F(PacerTest, ExhaustedBudgetRethrowsLastError) {
    Pacer pacer(4, 4, calculator);
    try {
        pacer.call([&] {
            const int n = ++invocations;
            return Attempt::again(std::make_exception_ptr(std::runtime_error("attempt " + std::to_string(n))));
        });
        FAIL() << "expected the last attempt's error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "attempt 5");
    }
    EXPECT_EQ(invocations.load(), 5);
}

TEST_F(PacerTest, BackoffFollowsCalculator) {
    Pacer pacer(4, 5, calculator);
    EXPECT_THROW(pacer.call([&] {
        ++invocations;
        return Attempt::again(std::make_exception_ptr(HttpStatusError(503, "unavailable")));
    }), HttpStatusError);

    const std::vector<nanoseconds> expected{1ms, 2ms, 4ms, 8ms, 8ms};
    EXPECT_EQ(calculator->delays(), expected);
    EXPECT_EQ(invocations.load(), 6);
}

TEST_F(PacerTest, CalculatorSeesRetryState) {
    class Probe : public Calculator {
    public:
        nanoseconds calculate(const State& s) const override {
            retries.push_back(s.consecutiveRetries);
            hadError.push_back(s.lastError != nullptr);
            return 0ns;
        }
        mutable std::vector<int> retries;
        mutable std::vector<bool> hadError;
    };
    const auto probe = std::make_shared<Probe>();

    Pacer pacer(1, 3, probe);
    pacer.call([&] {
        const int n = ++invocations;
        if (n == 1) return Attempt::again(std::make_exception_ptr(std::runtime_error("x")));
        if (n == 2) return Attempt::again();
        return Attempt::done();
    });

    EXPECT_EQ(probe->retries, (std::vector<int>{1, 2}));
    EXPECT_EQ(probe->hadError, (std::vector<bool>{true, false}));
    EXPECT_EQ(pacer.state().consecutiveRetries, 0);
    EXPECT_EQ(pacer.state().lastError, nullptr);
}

TEST_F(PacerTest, FinalFailureIsNotRetried) {
    Pacer pacer(4, 5, calculator);
    EXPECT_THROW(pacer.call([&] {
        ++invocations;
        return Attempt::fail(std::make_exception_ptr(NotFound("gone")));
    }), NotFound);
    EXPECT_EQ(invocations.load(), 1);
}

TEST_F(PacerTest, ThrowingOperationReleasesTokens) {
    Pacer pacer(1, 5, calculator);
    EXPECT_THROW(pacer.call([]() -> Attempt { throw std::runtime_error("boom"); }), std::runtime_error);

    pacer.call(Context::withTimeout(Context::background(), 1s), [&] {
        ++invocations;
        return Attempt::done();
    });
    EXPECT_EQ(invocations.load(), 1);
}

TEST_F(PacerTest, ThrowingRetryResetsState) {
    Pacer pacer(1, 5, calculator);
    EXPECT_THROW(pacer.call([&]() -> Attempt {
        if (++invocations < 3) return Attempt::again(std::make_exception_ptr(std::runtime_error("busy")));
        throw std::runtime_error("boom");
    }), std::runtime_error);

    EXPECT_EQ(invocations.load(), 3);
    EXPECT_EQ(pacer.state().consecutiveRetries, 0);
    EXPECT_EQ(pacer.state().lastError, nullptr);
}

TEST_F(PacerTest, CallNoRetryMakesOneAttempt) {
    Pacer pacer(4, 5, calculator);
    EXPECT_THROW(pacer.callNoRetry(Context::background(), [&] {
        ++invocations;
        return Attempt::again(std::make_exception_ptr(HttpStatusError(503, "unavailable")));
    }), HttpStatusError);
    EXPECT_EQ(invocations.load(), 1);
    EXPECT_EQ(pacer.retries(), 5);
}

TEST_F(PacerTest, ConcurrencyNeverExceedsMaxConnections) {
    constexpr unsigned int maxConnections = 3;
    Pacer pacer(maxConnections, 0, calculator);

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            pacer.call([&] {
                const int now = ++active;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(20ms);
                --active;
                ++invocations;
                return Attempt::done();
            });
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(invocations.load(), 12);
    EXPECT_GE(peak.load(), 1);
    EXPECT_LE(peak.load(), static_cast<int>(maxConnections));
}

TEST_F(PacerTest, SetMaxConnectionsLimitsLaterCalls) {
    Pacer pacer(8, 0, calculator);
    pacer.setMaxConnections(1);
    EXPECT_EQ(pacer.maxConnections(), 1u);

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            pacer.call([&] {
                const int now = ++active;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(10ms);
                --active;
                return Attempt::done();
            });
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(peak.load(), 1);
}

TEST_F(PacerTest, CancelWhileWaitingForConnection) {
    Pacer pacer(1, 0, calculator);

    std::atomic<bool> release{false};
    std::thread holder([&] {
        pacer.call([&] {
            while (!release) std::this_thread::sleep_for(1ms);
            return Attempt::done();
        });
    });
    std::this_thread::sleep_for(20ms);

    const auto ctx = Context::cancellable();
    std::thread canceller([&] {
        std::this_thread::sleep_for(30ms);
        ctx.cancel();
    });

    const auto start = steady_clock::now();
    EXPECT_THROW(pacer.call(ctx, [&] {
        ++invocations;
        return Attempt::done();
    }), Cancelled);
    EXPECT_LT(steady_clock::now() - start, 5s);
    EXPECT_EQ(invocations.load(), 0);

    release = true;
    canceller.join();
    holder.join();
}

TEST_F(PacerTest, DoneContextNeverInvokes) {
    Pacer pacer(1, 3, calculator);
    const auto ctx = Context::cancellable();
    ctx.cancel();
    EXPECT_THROW(pacer.call(ctx, [&] {
        ++invocations;
        return Attempt::done();
    }), Cancelled);
    EXPECT_EQ(invocations.load(), 0);
}

TEST_F(PacerTest, DeadlineDuringBackoffAbortsCall) {
    Pacer pacer(1, 10, std::make_shared<FixedCalculator>(10s));
    const auto ctx = Context::withTimeout(Context::background(), 50ms);

    const auto start = steady_clock::now();
    EXPECT_THROW(pacer.call(ctx, [&] {
        ++invocations;
        return Attempt::again(std::make_exception_ptr(HttpStatusError(503, "unavailable")));
    }), DeadlineExceeded);
    EXPECT_LT(steady_clock::now() - start, 5s);
    EXPECT_EQ(invocations.load(), 1);
    EXPECT_EQ(pacer.state().consecutiveRetries, 0);
    EXPECT_EQ(pacer.state().lastError, nullptr);
}

TEST_F(PacerTest, BackoffHoldsOffOtherCalls) {
    Pacer pacer(4, 1, std::make_shared<FixedCalculator>(200ms));

    steady_clock::time_point firstAttempt;
    std::atomic<bool> started{false};
    std::thread retrying([&] {
        pacer.call([&] {
            if (!started.exchange(true)) {
                firstAttempt = steady_clock::now();
                return Attempt::again();
            }
            return Attempt::done();
        });
    });

    while (!started) std::this_thread::sleep_for(1ms);
    std::this_thread::sleep_for(20ms);

    steady_clock::time_point otherAttempt;
    pacer.call([&] {
        otherAttempt = steady_clock::now();
        return Attempt::done();
    });
    retrying.join();

    EXPECT_GE(otherAttempt - firstAttempt, 150ms);
}

TEST_F(PacerTest, CustomInvokerWrapsEveryAttempt) {
    const auto invoker = std::make_shared<CountingInvoker>();
    Pacer pacer(2, 3, calculator);
    pacer.setInvoker(invoker);

    pacer.call([&] {
        return ++invocations < 3 ? Attempt::again() : Attempt::done();
    });
    EXPECT_EQ(invoker->calls.load(), 3);
}

TEST_F(PacerTest, SettersValidateArguments) {
    Pacer pacer;
    EXPECT_EQ(pacer.maxConnections(), Pacer::DEFAULT_MAX_CONNECTIONS);
    EXPECT_EQ(pacer.retries(), Pacer::DEFAULT_RETRIES);

    EXPECT_THROW(pacer.setRetries(-1), std::invalid_argument);
    EXPECT_THROW(pacer.setMaxConnections(0), std::invalid_argument);
    EXPECT_THROW(pacer.setCalculator(nullptr), std::invalid_argument);
    EXPECT_THROW(pacer.setInvoker(nullptr), std::invalid_argument);
    EXPECT_THROW(Pacer(0, 1), std::invalid_argument);

    pacer.setRetries(2);
    EXPECT_EQ(pacer.retries(), 2);
}

TEST_F(PacerTest, BuildsFromConfig) {
    rfs::config::PacerConfig cfg;
    cfg.max_connections = 3;
    cfg.retries = 1;
    cfg.min_sleep = 1ms;
    cfg.max_sleep = 1ms;

    Pacer pacer(cfg);
    EXPECT_EQ(pacer.maxConnections(), 3u);
    EXPECT_EQ(pacer.retries(), 1);

    pacer.call([&] {
        ++invocations;
        return Attempt::again();
    });
    EXPECT_EQ(invocations.load(), 2);
}
