#include "pacer/Invoker.hpp"

using namespace rfs::pacer;

Attempt DefaultInvoker::invoke(const int attempt, const int retries, const Paced& paced) const {
    auto result = paced();
    if (attempt >= retries) result.retry = false;
    return result;
}
