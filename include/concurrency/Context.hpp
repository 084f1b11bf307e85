#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>

namespace rfs::concurrency {

/// Cancellation handle passed down every call path that may block.
/// Copies share state: cancelling one copy cancels all of them, and
/// derived contexts are cancelled together with their parent.
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() = default;

    static Context background() { return {}; }
    static Context cancellable(const Context& parent = {});
    static Context withDeadline(const Context& parent, Clock::time_point deadline);
    static Context withTimeout(const Context& parent, Clock::duration timeout);

    void cancel() const;

    [[nodiscard]] bool done() const;

    /// Cancelled or DeadlineExceeded once done(), null before.
    [[nodiscard]] std::exception_ptr err() const;

    void throwIfDone() const;

    [[nodiscard]] std::stop_token stopToken() const;
    [[nodiscard]] std::optional<Clock::time_point> deadline() const;

    /// Blocks on cv until pred holds or the context is done.
    /// Returns pred(); false means the context ended the wait.
    template <class Lock, class Predicate>
    bool wait(std::condition_variable_any& cv, Lock& lock, Predicate pred) const {
        if (const auto dl = deadline()) return cv.wait_until(lock, stopToken(), *dl, std::move(pred));
        return cv.wait(lock, stopToken(), std::move(pred));
    }

    /// Sleeps for d, throwing the context's error as soon as it is done.
    void sleepFor(Clock::duration d) const;

private:
    struct State;

    std::shared_ptr<State> state_;
};

}
