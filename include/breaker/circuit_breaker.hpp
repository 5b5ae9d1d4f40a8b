#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <vector>

namespace meshguard {

/**
 * @brief Structured event emitted on circuit breaker state transitions
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string breaker_name;
};

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;     // Consecutive failures to trip OPEN
    uint32_t success_threshold = 3;     // Consecutive successes to close from HALF_OPEN
    std::chrono::milliseconds timeout{60000};   // OPEN duration before HALF_OPEN
    uint32_t max_requests = 1;          // Concurrent probes in HALF_OPEN
    std::chrono::milliseconds interval{60000};  // CLOSED window length, 0 = never roll
    uint32_t min_requests = 3;          // Sample size gating the ratio check
    double failure_ratio = 0.6;         // <= 0 disables the ratio check
};

/**
 * @brief Circuit Breaker guarding calls to one dependency
 *
 * Three states:
 * - CLOSED:     Normal operation, all requests pass through
 * - OPEN:       Failing, reject requests immediately
 * - HALF_OPEN:  Testing recovery, allow up to max_requests probes
 *
 * State transitions:
 * - CLOSED → OPEN:      consecutive_failures >= failure_threshold, or
 *                       requests >= min_requests and failure ratio >= failure_ratio
 * - OPEN → HALF_OPEN:   timeout elapsed (evaluated lazily on the next request)
 *                       HALF_OPEN admits while fewer than max_requests probes
 *                       are outstanding
 * - HALF_OPEN → CLOSED: consecutive_successes >= success_threshold
 * - HALF_OPEN → OPEN:   any failure
 * - CLOSED → CLOSED:    interval elapsed, counts start a new window
 *
 * Every transition and every window rollover starts a new generation.
 * Outcomes reported for an older generation are discarded, so a slow call
 * admitted before a transition never touches the new window's counts.
 *
 * The lock is held only for the bookkeeping in before_request() and
 * after_request(), never across the wrapped call.
 */
class CircuitBreaker {
public:
    using Config = CircuitBreakerConfig;

    using StateChangeCallback = std::function<void(const StateChangeEvent&)>;

    explicit CircuitBreaker(std::string name, const Config& config = Config());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Run fn under the breaker.
     *
     * fn must return a Result<T>. Rejections come back as CIRCUIT_OPEN or
     * TOO_MANY_REQUESTS without invoking fn. An exception thrown by fn is
     * counted as a failure and rethrown unchanged.
     */
    template<typename F>
    auto execute(F&& fn) -> std::invoke_result_t<F&>;

    /**
     * @brief execute() for work that only reports success or failure
     */
    Status call(const std::function<Status()>& fn);

    /**
     * @brief Admission check. On success returns the generation the
     *        outcome must be reported against.
     */
    [[nodiscard]] Result<uint64_t> before_request();

    /**
     * @brief Record the outcome of a request admitted at `generation`.
     *        Stale generations are ignored.
     */
    void after_request(uint64_t generation, bool success);

    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] Counts counts() const;
    [[nodiscard]] uint64_t generation() const;
    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /**
     * @brief Force CLOSED and start a fresh generation
     */
    void reset();

    const std::string& name() const { return name_; }
    const Config& config() const { return config_; }

    void set_on_state_change(StateChangeCallback cb);

    /**
     * @brief Get recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

private:
    using Clock = std::chrono::steady_clock;

    // All private helpers expect mutex_ held exclusively.
    CircuitState current_state(Clock::time_point now);
    void on_success(CircuitState state, Clock::time_point now);
    void on_failure(CircuitState state, Clock::time_point now);
    void set_state(CircuitState to, Clock::time_point now);
    void to_new_generation(Clock::time_point now);
    [[nodiscard]] bool ready_to_trip() const;
    [[nodiscard]] uint32_t outstanding_probes() const;

    // Logs and runs the callback for transitions collected under the lock.
    void dispatch(std::vector<StateChangeEvent>& pending, const StateChangeCallback& cb);

    std::string name_;
    const Config config_;

    mutable std::shared_mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint64_t generation_ = 0;
    Counts counts_;
    std::optional<Clock::time_point> expiry_;

    StateChangeCallback on_state_change_;
    std::vector<StateChangeEvent> pending_events_;
    std::deque<StateChangeEvent> recent_events_;
    static constexpr size_t kMaxRecentEvents = 100;
    uint64_t transitions_to_open_ = 0;
    uint64_t transitions_to_half_open_ = 0;
    uint64_t transitions_to_closed_ = 0;
};

template<typename F>
auto CircuitBreaker::execute(F&& fn) -> std::invoke_result_t<F&> {
    using R = std::invoke_result_t<F&>;

    auto admitted = before_request();
    if (admitted.is_error()) {
        return R::error(admitted.error_category(), admitted.error_message());
    }
    const uint64_t generation = admitted.value();

    try {
        R result = std::invoke(fn);
        after_request(generation, result.is_ok());
        return result;
    } catch (...) {
        after_request(generation, false);
        throw;
    }
}

} // namespace meshguard
