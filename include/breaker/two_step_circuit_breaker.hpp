#pragma once

#include "breaker/circuit_breaker.hpp"
#include <functional>
#include <memory>
#include <string>

namespace meshguard {

/**
 * @brief Splits admission from outcome recording.
 *
 * For asynchronous or callback-shaped work: allow() performs the admission
 * check and hands back a completion callback that the caller invokes later,
 * from any thread, with the outcome. Only the first invocation of a given
 * callback is recorded.
 */
class TwoStepCircuitBreaker {
public:
    using DoneCallback = std::function<void(bool success)>;

    explicit TwoStepCircuitBreaker(std::shared_ptr<CircuitBreaker> breaker);
    explicit TwoStepCircuitBreaker(std::string name,
                                   const CircuitBreaker::Config& config = CircuitBreaker::Config());

    /**
     * @brief Admission check.
     * @return Completion callback, or CIRCUIT_OPEN / TOO_MANY_REQUESTS
     */
    [[nodiscard]] Result<DoneCallback> allow();

    CircuitBreaker& breaker() { return *breaker_; }
    const CircuitBreaker& breaker() const { return *breaker_; }

private:
    std::shared_ptr<CircuitBreaker> breaker_;
};

} // namespace meshguard
