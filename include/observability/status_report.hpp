#pragma once

#include "balancer/load_balancer_manager.hpp"
#include "breaker/circuit_breaker_manager.hpp"
#include <string>

namespace meshguard {

/**
 * @brief Read-only JSON snapshots of breaker and balancer state.
 *
 * Output is a single JSON object per call; instance entries are sorted by id
 * so consecutive reports diff cleanly.
 */
class StatusReport {
public:
    StatusReport(const CircuitBreakerManager& breakers, const LoadBalancerManager& balancer)
        : breakers_(breakers), balancer_(balancer) {}

    /**
     * @brief {"breakers":[...],"total":N}
     */
    [[nodiscard]] std::string breakers_json() const;

    /**
     * @brief {"algorithm":"...","strategies":[...],"instances":[...]}
     */
    [[nodiscard]] std::string load_balancer_json() const;

    /**
     * @brief Both sections plus a timestamp
     */
    [[nodiscard]] std::string to_json() const;

    [[nodiscard]] static std::string breaker_stats_json(const CircuitBreakerStats& stats);

private:
    const CircuitBreakerManager& breakers_;
    const LoadBalancerManager& balancer_;
};

} // namespace meshguard
