#pragma once

#include "pacer/Invoker.hpp"

#include <exception>

namespace rfs::pacer {

/// Decides whether a backend failure deserves another attempt.
/// Rate limiting, 5xx and dropped connections are retried. Quota
/// exhaustion is rewritten to LimitExceeded and is final, as is
/// cancellation and anything unrecognised.
[[nodiscard]] Attempt shouldRetry(std::exception_ptr error);

/// Runs fn once and classifies what it threw with shouldRetry.
template <class Fn>
Attempt attempt(Fn&& fn) {
    try {
        fn();
        return Attempt::done();
    } catch (...) {
        return shouldRetry(std::current_exception());
    }
}

}
