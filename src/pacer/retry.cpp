#include "pacer/retry.hpp"
#include "errors/Errors.hpp"

#include <array>
#include <string>
#include <string_view>

using namespace rfs::pacer;
using namespace rfs::errors;

namespace {

bool contains(const std::string_view haystack, const std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

// transport failures that are worth another go regardless of their type
constexpr std::array<std::string_view, 5> RETRYABLE_MESSAGES = {
    "429 Too Many Requests",
    "can't write HTTP request on broken connection",
    "timeout awaiting response headers",
    "TLS handshake timeout",
    "connection reset by peer",
};

Attempt classifyStatus(const HttpStatusError& e, std::exception_ptr error) {
    const auto& reason = e.reason();
    switch (e.status()) {
        case 403:
            if (contains(reason, "User Rate Limit Exceeded")) return Attempt::again(error);
            if (contains(reason, "Rate Limit Exceeded")) return Attempt::again(error);
            if (contains(reason, "rateLimitExceeded")) return Attempt::again(error);
            if (contains(reason, "userRateLimitExceeded") || contains(reason, "Quota exceeded"))
                return Attempt::fail(std::make_exception_ptr(LimitExceeded("limit exceeded: " + reason)));
            return Attempt::fail(error);
        case 429:
        case 500:
        case 502:
        case 503:
        case 504:
            return Attempt::again(error);
        default:
            return Attempt::fail(error);
    }
}

}

Attempt rfs::pacer::shouldRetry(std::exception_ptr error) {
    if (!error) return Attempt::done();

    try {
        std::rethrow_exception(error);
    } catch (const Cancelled&) {
        return Attempt::fail(error);
    } catch (const LimitExceeded&) {
        return Attempt::fail(error);
    } catch (const HttpStatusError& e) {
        return classifyStatus(e, error);
    } catch (const std::exception& e) {
        for (const auto msg : RETRYABLE_MESSAGES)
            if (contains(e.what(), msg)) return Attempt::again(error);
        return Attempt::fail(error);
    } catch (...) {
        return Attempt::fail(error);
    }
}
