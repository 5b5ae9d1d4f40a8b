#include "breaker/circuit_breaker.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace meshguard {

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(config) {
    to_new_generation(Clock::now());
}

Status CircuitBreaker::call(const std::function<Status()>& fn) {
    return execute(fn);
}

Result<uint64_t> CircuitBreaker::before_request() {
    std::vector<StateChangeEvent> pending;
    StateChangeCallback cb;
    Result<uint64_t> result;

    {
        std::unique_lock lock(mutex_);
        const CircuitState state = current_state(Clock::now());

        if (state == CircuitState::OPEN) {
            result = Result<uint64_t>::error(ErrorCategory::CIRCUIT_OPEN,
                std::format("circuit breaker '{}' is open", name_));
        } else if (state == CircuitState::HALF_OPEN &&
                   outstanding_probes() >= config_.max_requests) {
            result = Result<uint64_t>::error(ErrorCategory::TOO_MANY_REQUESTS,
                std::format("circuit breaker '{}' is half-open and probing ({} in flight)",
                            name_, outstanding_probes()));
        } else {
            ++counts_.requests;
            result = Result<uint64_t>::ok(generation_);
        }

        pending.swap(pending_events_);
        if (!pending.empty()) cb = on_state_change_;
    }

    dispatch(pending, cb);
    return result;
}

void CircuitBreaker::after_request(uint64_t generation, bool success) {
    std::vector<StateChangeEvent> pending;
    StateChangeCallback cb;

    {
        std::unique_lock lock(mutex_);
        const auto now = Clock::now();
        const CircuitState state = current_state(now);

        if (generation == generation_) {
            if (success) {
                on_success(state, now);
            } else {
                on_failure(state, now);
            }
        }

        pending.swap(pending_events_);
        if (!pending.empty()) cb = on_state_change_;
    }

    dispatch(pending, cb);
}

CircuitState CircuitBreaker::state() const {
    std::shared_lock lock(mutex_);
    return state_;
}

Counts CircuitBreaker::counts() const {
    std::shared_lock lock(mutex_);
    return counts_;
}

uint64_t CircuitBreaker::generation() const {
    std::shared_lock lock(mutex_);
    return generation_;
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    std::shared_lock lock(mutex_);

    CircuitBreakerStats stats;
    stats.name = name_;
    stats.state = state_;
    stats.generation = generation_;
    stats.counts = counts_;
    if (state_ == CircuitState::OPEN && expiry_) {
        const auto now = Clock::now();
        if (*expiry_ > now) {
            stats.open_remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(*expiry_ - now);
        }
    }
    stats.transitions_to_open = transitions_to_open_;
    stats.transitions_to_half_open = transitions_to_half_open_;
    stats.transitions_to_closed = transitions_to_closed_;
    return stats;
}

void CircuitBreaker::reset() {
    std::vector<StateChangeEvent> pending;
    StateChangeCallback cb;

    {
        std::unique_lock lock(mutex_);
        const auto now = Clock::now();
        if (state_ != CircuitState::CLOSED) {
            set_state(CircuitState::CLOSED, now);
        } else {
            to_new_generation(now);
        }

        pending.swap(pending_events_);
        if (!pending.empty()) cb = on_state_change_;
    }

    dispatch(pending, cb);
}

void CircuitBreaker::set_on_state_change(StateChangeCallback cb) {
    std::unique_lock lock(mutex_);
    on_state_change_ = std::move(cb);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::shared_lock lock(mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

// ---- State machine (mutex_ held) -------------------------------------------

CircuitState CircuitBreaker::current_state(Clock::time_point now) {
    switch (state_) {
        case CircuitState::CLOSED:
            if (expiry_ && *expiry_ <= now) {
                // Rolling window elapsed without a trip
                to_new_generation(now);
            }
            break;
        case CircuitState::OPEN:
            if (expiry_ && *expiry_ <= now) {
                set_state(CircuitState::HALF_OPEN, now);
            }
            break;
        case CircuitState::HALF_OPEN:
            break;
    }
    return state_;
}

void CircuitBreaker::on_success(CircuitState state, Clock::time_point now) {
    switch (state) {
        case CircuitState::CLOSED:
            ++counts_.total_successes;
            ++counts_.consecutive_successes;
            counts_.consecutive_failures = 0;
            break;
        case CircuitState::HALF_OPEN:
            ++counts_.total_successes;
            ++counts_.consecutive_successes;
            counts_.consecutive_failures = 0;
            if (counts_.consecutive_successes >= config_.success_threshold) {
                set_state(CircuitState::CLOSED, now);
            }
            break;
        case CircuitState::OPEN:
            break;
    }
}

void CircuitBreaker::on_failure(CircuitState state, Clock::time_point now) {
    switch (state) {
        case CircuitState::CLOSED:
            ++counts_.total_failures;
            ++counts_.consecutive_failures;
            counts_.consecutive_successes = 0;
            if (ready_to_trip()) {
                set_state(CircuitState::OPEN, now);
            }
            break;
        case CircuitState::HALF_OPEN:
            set_state(CircuitState::OPEN, now);
            break;
        case CircuitState::OPEN:
            break;
    }
}

void CircuitBreaker::set_state(CircuitState to, Clock::time_point now) {
    if (state_ == to) return;

    const CircuitState from = state_;
    state_ = to;
    to_new_generation(now);

    switch (to) {
        case CircuitState::OPEN:      ++transitions_to_open_; break;
        case CircuitState::HALF_OPEN: ++transitions_to_half_open_; break;
        case CircuitState::CLOSED:    ++transitions_to_closed_; break;
    }

    StateChangeEvent event{from, to, std::chrono::system_clock::now(), name_};
    recent_events_.push_back(event);
    if (recent_events_.size() > kMaxRecentEvents) {
        recent_events_.pop_front();
    }
    pending_events_.push_back(std::move(event));
}

void CircuitBreaker::to_new_generation(Clock::time_point now) {
    ++generation_;
    counts_ = Counts{};

    switch (state_) {
        case CircuitState::CLOSED:
            if (config_.interval.count() > 0) {
                expiry_ = now + config_.interval;
            } else {
                expiry_.reset();
            }
            break;
        case CircuitState::OPEN:
            expiry_ = now + config_.timeout;
            break;
        case CircuitState::HALF_OPEN:
            expiry_.reset();
            break;
    }
}

uint32_t CircuitBreaker::outstanding_probes() const {
    // Any failure leaves HALF_OPEN, so completed probes are the successes
    const uint32_t completed = counts_.total_successes + counts_.total_failures;
    return counts_.requests > completed ? counts_.requests - completed : 0;
}

bool CircuitBreaker::ready_to_trip() const {
    if (counts_.consecutive_failures >= config_.failure_threshold) {
        return true;
    }
    if (config_.failure_ratio <= 0.0 || counts_.requests < config_.min_requests ||
        counts_.requests == 0) {
        return false;
    }
    const double ratio = static_cast<double>(counts_.total_failures) /
                         static_cast<double>(counts_.requests);
    return ratio >= config_.failure_ratio;
}

void CircuitBreaker::dispatch(std::vector<StateChangeEvent>& pending,
                              const StateChangeCallback& cb) {
    for (const auto& event : pending) {
        utils::log::info(std::format("Circuit breaker '{}' state changed: {} -> {}",
            event.breaker_name,
            circuit_state_to_string(event.from),
            circuit_state_to_string(event.to)));
        if (cb) cb(event);
    }
}

} // namespace meshguard
