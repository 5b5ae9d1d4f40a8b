#include "breaker/bulkhead_circuit_breaker.hpp"

#include <algorithm>

namespace meshguard {

BulkheadCircuitBreaker::BulkheadCircuitBreaker(std::shared_ptr<CircuitBreaker> breaker,
                                               uint32_t max_concurrent)
    : breaker_(std::move(breaker)),
      max_concurrent_(std::max<uint32_t>(1, max_concurrent)),
      permits_(static_cast<std::ptrdiff_t>(max_concurrent_)) {}

BulkheadCircuitBreaker::BulkheadCircuitBreaker(std::string name,
                                               const CircuitBreaker::Config& config,
                                               uint32_t max_concurrent)
    : BulkheadCircuitBreaker(std::make_shared<CircuitBreaker>(std::move(name), config),
                             max_concurrent) {}

Status BulkheadCircuitBreaker::call(const std::function<Status()>& fn) {
    return execute(fn);
}

bool BulkheadCircuitBreaker::try_acquire() {
    if (!permits_.try_acquire()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    in_flight_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

} // namespace meshguard
