#include "breaker/two_step_circuit_breaker.hpp"

#include <atomic>

namespace meshguard {

TwoStepCircuitBreaker::TwoStepCircuitBreaker(std::shared_ptr<CircuitBreaker> breaker)
    : breaker_(std::move(breaker)) {}

TwoStepCircuitBreaker::TwoStepCircuitBreaker(std::string name,
                                             const CircuitBreaker::Config& config)
    : breaker_(std::make_shared<CircuitBreaker>(std::move(name), config)) {}

Result<TwoStepCircuitBreaker::DoneCallback> TwoStepCircuitBreaker::allow() {
    auto admitted = breaker_->before_request();
    if (admitted.is_error()) {
        return Result<DoneCallback>::error(admitted.error_category(), admitted.error_message());
    }

    // The callback keeps the breaker alive until the outcome is reported
    auto done = std::make_shared<std::atomic<bool>>(false);
    DoneCallback cb = [breaker = breaker_, generation = admitted.value(), done](bool success) {
        if (done->exchange(true, std::memory_order_acq_rel)) return;
        breaker->after_request(generation, success);
    };
    return Result<DoneCallback>::ok(std::move(cb));
}

} // namespace meshguard
