#include "breaker/result_code_circuit_breaker.hpp"

#include <algorithm>
#include <mutex>

namespace meshguard {

std::vector<int> ResultCodeCircuitBreaker::default_failure_codes() {
    return {500, 502, 503, 504};
}

ResultCodeCircuitBreaker::ResultCodeCircuitBreaker(std::shared_ptr<CircuitBreaker> breaker,
                                                   const std::vector<int>& failure_codes)
    : breaker_(std::move(breaker)),
      failure_codes_(failure_codes.begin(), failure_codes.end()) {}

ResultCodeCircuitBreaker::ResultCodeCircuitBreaker(std::string name,
                                                   const CircuitBreaker::Config& config)
    : ResultCodeCircuitBreaker(std::make_shared<CircuitBreaker>(std::move(name), config)) {}

Result<int> ResultCodeCircuitBreaker::execute(const CodeFn& fn) {
    auto admitted = breaker_->before_request();
    if (admitted.is_error()) {
        return Result<int>::error(admitted.error_category(), admitted.error_message());
    }
    const uint64_t generation = admitted.value();

    try {
        Result<int> result = fn();
        const bool success = result.is_ok() && !is_failure_code(result.value());
        breaker_->after_request(generation, success);
        return result;
    } catch (...) {
        breaker_->after_request(generation, false);
        throw;
    }
}

void ResultCodeCircuitBreaker::set_failure_codes(const std::vector<int>& codes) {
    std::unique_lock lock(codes_mutex_);
    failure_codes_ = std::unordered_set<int>(codes.begin(), codes.end());
}

bool ResultCodeCircuitBreaker::is_failure_code(int code) const {
    std::shared_lock lock(codes_mutex_);
    return failure_codes_.contains(code);
}

std::vector<int> ResultCodeCircuitBreaker::failure_codes() const {
    std::shared_lock lock(codes_mutex_);
    std::vector<int> codes(failure_codes_.begin(), failure_codes_.end());
    std::sort(codes.begin(), codes.end());
    return codes;
}

} // namespace meshguard
