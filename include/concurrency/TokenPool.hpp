#pragma once

#include "concurrency/Context.hpp"

#include <condition_variable>
#include <mutex>

namespace rfs::concurrency {

/// Counting semaphore whose capacity can change while leases are out.
/// Shrinking never revokes a lease; new acquisitions block until the
/// number of outstanding leases drops below the new capacity.
class TokenPool {
public:
    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() { release(); }

        void release() noexcept;
        [[nodiscard]] bool held() const noexcept { return pool_ != nullptr; }

    private:
        friend class TokenPool;
        explicit Lease(TokenPool* pool) : pool_(pool) {}

        TokenPool* pool_ = nullptr;
    };

    explicit TokenPool(unsigned int capacity);

    TokenPool(const TokenPool&) = delete;
    TokenPool& operator=(const TokenPool&) = delete;

    /// Blocks until a token is free. Throws the context's error if it ends first.
    [[nodiscard]] Lease acquire(const Context& ctx = Context::background());

    void resize(unsigned int capacity);

    [[nodiscard]] unsigned int capacity() const;
    [[nodiscard]] unsigned int inUse() const;

private:
    void put() noexcept;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    unsigned int capacity_;
    unsigned int inUse_ = 0;
};

}
