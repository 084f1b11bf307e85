#include "concurrency/TokenPool.hpp"

#include <stdexcept>

using namespace rfs::concurrency;

TokenPool::Lease& TokenPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        other.pool_ = nullptr;
    }
    return *this;
}

void TokenPool::Lease::release() noexcept {
    if (!pool_) return;
    pool_->put();
    pool_ = nullptr;
}

TokenPool::TokenPool(const unsigned int capacity) : capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("[TokenPool] Capacity must be at least 1");
}

TokenPool::Lease TokenPool::acquire(const Context& ctx) {
    ctx.throwIfDone();

    std::unique_lock lock(mutex_);
    if (!ctx.wait(cv_, lock, [this] { return inUse_ < capacity_; })) {
        lock.unlock();
        ctx.throwIfDone();
        throw std::logic_error("[TokenPool] Wait ended without a token or a finished context");
    }

    ++inUse_;
    return Lease(this);
}

void TokenPool::resize(const unsigned int capacity) {
    if (capacity == 0) throw std::invalid_argument("[TokenPool] Capacity must be at least 1");
    {
        std::scoped_lock lock(mutex_);
        capacity_ = capacity;
    }
    cv_.notify_all();
}

unsigned int TokenPool::capacity() const {
    std::scoped_lock lock(mutex_);
    return capacity_;
}

unsigned int TokenPool::inUse() const {
    std::scoped_lock lock(mutex_);
    return inUse_;
}

void TokenPool::put() noexcept {
    {
        std::scoped_lock lock(mutex_);
        --inUse_;
    }
    cv_.notify_one();
}
