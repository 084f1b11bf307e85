#pragma once

#include <exception>
#include <functional>
#include <utility>

namespace rfs::pacer {

/// Outcome of one attempt of a paced operation. An attempt may ask for
/// another try with or without an error (polling).
struct Attempt {
    bool retry = false;
    std::exception_ptr error;

    static Attempt done() { return {}; }
    static Attempt again(std::exception_ptr e = nullptr) { return {true, std::move(e)}; }
    static Attempt fail(std::exception_ptr e) { return {false, std::move(e)}; }
};

using Paced = std::function<Attempt()>;

/// Wraps each attempt. attempt counts from 0, retries is the call's budget.
class Invoker {
public:
    virtual ~Invoker() = default;

    virtual Attempt invoke(int attempt, int retries, const Paced& paced) const = 0;
};

/// Runs the attempt and stops asking for more once the budget is spent.
class DefaultInvoker final : public Invoker {
public:
    Attempt invoke(int attempt, int retries, const Paced& paced) const override;
};

}
