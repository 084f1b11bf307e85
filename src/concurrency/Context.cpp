#include "concurrency/Context.hpp"
#include "errors/Errors.hpp"

#include <mutex>

using namespace rfs::concurrency;

struct Context::State {
    struct Forward {
        std::stop_source target;
        void operator()() noexcept { target.request_stop(); }
    };

    std::stop_source source;
    std::optional<Clock::time_point> deadline;
    std::optional<std::stop_callback<Forward>> parentLink;
};

Context Context::cancellable(const Context& parent) {
    Context ctx;
    ctx.state_ = std::make_shared<State>();
    ctx.state_->deadline = parent.deadline();

    // fires immediately if the parent is already cancelled
    if (const auto token = parent.stopToken(); token.stop_possible())
        ctx.state_->parentLink.emplace(token, State::Forward{ctx.state_->source});

    return ctx;
}

Context Context::withDeadline(const Context& parent, const Clock::time_point deadline) {
    auto ctx = cancellable(parent);
    auto& dl = ctx.state_->deadline;
    if (!dl || deadline < *dl) dl = deadline;
    return ctx;
}

Context Context::withTimeout(const Context& parent, const Clock::duration timeout) {
    return withDeadline(parent, Clock::now() + timeout);
}

void Context::cancel() const {
    if (state_) state_->source.request_stop();
}

bool Context::done() const {
    if (!state_) return false;
    if (state_->source.stop_requested()) return true;
    return state_->deadline && Clock::now() >= *state_->deadline;
}

std::exception_ptr Context::err() const {
    if (!state_) return nullptr;
    if (state_->source.stop_requested()) return std::make_exception_ptr(errors::Cancelled());
    if (state_->deadline && Clock::now() >= *state_->deadline)
        return std::make_exception_ptr(errors::DeadlineExceeded());
    return nullptr;
}

void Context::throwIfDone() const {
    if (const auto e = err()) std::rethrow_exception(e);
}

std::stop_token Context::stopToken() const {
    if (!state_) return {};
    return state_->source.get_token();
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    if (!state_) return std::nullopt;
    return state_->deadline;
}

void Context::sleepFor(const Clock::duration d) const {
    throwIfDone();
    if (d <= Clock::duration::zero()) return;

    const auto now = Clock::now();
    auto until = d >= Clock::time_point::max() - now ? Clock::time_point::max() : now + d;
    if (const auto dl = deadline(); dl && *dl < until) until = *dl;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_until(lock, stopToken(), until, [] { return false; });

    throwIfDone();
}
