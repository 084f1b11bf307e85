#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace rfs::errors {

// A path or directory ID that is neither cached nor known to the backend.
struct NotFound : std::runtime_error {
    explicit NotFound(const std::string& what) : std::runtime_error(what) {}
};

// Internal misuse, e.g. resolving directories before the root was found.
// Never worth retrying.
struct PreconditionFailed : std::logic_error {
    explicit PreconditionFailed(const std::string& what) : std::logic_error(what) {}
};

// A collaborator error annotated with the path being resolved.
// The collaborator's own exception is nested (std::throw_with_nested).
struct BackendError : std::runtime_error {
    BackendError(std::string path, const std::string& what)
        : std::runtime_error(what), path_(std::move(path)) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

// What a transport reports for a non-2xx response.
struct HttpStatusError : std::runtime_error {
    HttpStatusError(const long status, const std::string& reason)
        : std::runtime_error("HTTP " + std::to_string(status) + ": " + reason), status_(status), reason_(reason) {}

    [[nodiscard]] long status() const noexcept { return status_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    long status_;
    std::string reason_;
};

// Quota exhausted on the backend side, retrying won't help.
struct LimitExceeded : std::runtime_error {
    explicit LimitExceeded(const std::string& what = "limit exceeded") : std::runtime_error(what) {}
};

struct Cancelled : std::runtime_error {
    explicit Cancelled(const std::string& what = "context canceled") : std::runtime_error(what) {}
};

struct DeadlineExceeded : Cancelled {
    explicit DeadlineExceeded(const std::string& what = "context deadline exceeded") : Cancelled(what) {}
};

}
