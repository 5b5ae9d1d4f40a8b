#pragma once

#include "breaker/circuit_breaker.hpp"
#include <atomic>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <semaphore>
#include <string>

namespace meshguard {

/**
 * @brief Concurrency cap in front of a circuit breaker (bulkhead)
 *
 * Each call takes a permit from a fixed-capacity counting_semaphore before
 * reaching the breaker. try_acquire() never blocks: when all permits are
 * held the call fails with TOO_MANY_REQUESTS and the breaker never sees it,
 * so saturation consumes no admission slot and records no failure.
 */
class BulkheadCircuitBreaker {
public:
    BulkheadCircuitBreaker(std::shared_ptr<CircuitBreaker> breaker, uint32_t max_concurrent);
    BulkheadCircuitBreaker(std::string name, const CircuitBreaker::Config& config,
                           uint32_t max_concurrent);

    template<typename F>
    auto execute(F&& fn) -> std::invoke_result_t<F&>;

    Status call(const std::function<Status()>& fn);

    [[nodiscard]] uint32_t concurrent_requests() const {
        return in_flight_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint32_t max_concurrent_requests() const { return max_concurrent_; }
    [[nodiscard]] uint64_t rejected_count() const {
        return rejected_.load(std::memory_order_relaxed);
    }

    CircuitBreaker& breaker() { return *breaker_; }
    const CircuitBreaker& breaker() const { return *breaker_; }

private:
    /**
     * @brief RAII permit: releases the semaphore slot on scope exit
     */
    class Permit {
    public:
        explicit Permit(BulkheadCircuitBreaker& owner) : owner_(owner) {}
        ~Permit() {
            owner_.in_flight_.fetch_sub(1, std::memory_order_relaxed);
            owner_.permits_.release();
        }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        BulkheadCircuitBreaker& owner_;
    };

    [[nodiscard]] bool try_acquire();

    std::shared_ptr<CircuitBreaker> breaker_;
    const uint32_t max_concurrent_;
    std::counting_semaphore<> permits_;
    std::atomic<uint32_t> in_flight_{0};
    std::atomic<uint64_t> rejected_{0};
};

template<typename F>
auto BulkheadCircuitBreaker::execute(F&& fn) -> std::invoke_result_t<F&> {
    using R = std::invoke_result_t<F&>;

    if (!try_acquire()) {
        return R::error(ErrorCategory::TOO_MANY_REQUESTS,
            std::format("bulkhead '{}' saturated ({} concurrent)",
                        breaker_->name(), max_concurrent_));
    }
    Permit permit(*this);
    return breaker_->execute(fn);
}

} // namespace meshguard
