#pragma once

#include "breaker/circuit_breaker.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace meshguard {

/**
 * @brief Classifies outcomes by a caller-supplied result code.
 *
 * The wrapped call returns Result<int>. A transport error (error Result)
 * counts as a failure. Otherwise the returned code alone decides: codes in
 * the failure set count as failures, everything else as success. The code is
 * handed back to the caller unchanged either way; classification only drives
 * the breaker's accounting.
 */
class ResultCodeCircuitBreaker {
public:
    using CodeFn = std::function<Result<int>()>;

    /**
     * @brief 500, 502, 503, 504
     */
    [[nodiscard]] static std::vector<int> default_failure_codes();

    explicit ResultCodeCircuitBreaker(std::shared_ptr<CircuitBreaker> breaker,
                                      const std::vector<int>& failure_codes = default_failure_codes());
    explicit ResultCodeCircuitBreaker(std::string name,
                                      const CircuitBreaker::Config& config = CircuitBreaker::Config());

    /**
     * @brief Run fn under the breaker.
     * @return fn's result, or CIRCUIT_OPEN / TOO_MANY_REQUESTS without calling fn
     */
    Result<int> execute(const CodeFn& fn);

    void set_failure_codes(const std::vector<int>& codes);
    [[nodiscard]] bool is_failure_code(int code) const;
    [[nodiscard]] std::vector<int> failure_codes() const;

    CircuitBreaker& breaker() { return *breaker_; }
    const CircuitBreaker& breaker() const { return *breaker_; }

private:
    std::shared_ptr<CircuitBreaker> breaker_;
    std::unordered_set<int> failure_codes_;
    mutable std::shared_mutex codes_mutex_;
};

} // namespace meshguard
