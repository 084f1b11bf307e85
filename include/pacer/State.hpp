#pragma once

#include <chrono>
#include <exception>

namespace rfs::pacer {

/// Snapshot of the pacer's retry bookkeeping handed to a Calculator.
struct State {
    std::chrono::nanoseconds sleepTime{0};   // delay computed for the previous retry
    int consecutiveRetries = 0;              // reset to 0 once a call finishes
    std::exception_ptr lastError;            // error of the last attempt that asked for a retry
};

}
