#pragma once

#include "balancer/instance_stats_store.hpp"
#include "balancer/load_balancer_strategy.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace meshguard {

// ============================================================================
// Round Robin
// ============================================================================

/**
 * @brief Atomic counter modulo candidate count. Fairness across calls needs
 *        the caller to pass candidates in a stable order.
 */
class RoundRobinStrategy : public LoadBalancerStrategy {
public:
    [[nodiscard]] Result<ServiceInstancePtr> select(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key) override;
    [[nodiscard]] Algorithm algorithm() const override { return Algorithm::ROUND_ROBIN; }
    [[nodiscard]] StrategyStats get_stats() const override;

private:
    std::atomic<uint64_t> counter_{0};
};

// ============================================================================
// Weighted Round Robin
// ============================================================================

/**
 * @brief Each candidate occupies `weight` consecutive slots; a rotating
 *        cursor walks the expanded sequence, so weights {A:3, B:1} yield
 *        A A A B A A A B ...
 */
class WeightedRoundRobinStrategy : public LoadBalancerStrategy {
public:
    explicit WeightedRoundRobinStrategy(WeightMap weights = {});

    [[nodiscard]] Result<ServiceInstancePtr> select(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key) override;
    [[nodiscard]] Algorithm algorithm() const override { return Algorithm::WEIGHTED_ROUND_ROBIN; }
    [[nodiscard]] StrategyStats get_stats() const override;

private:
    const WeightMap weights_;
    std::atomic<uint64_t> cursor_{0};
    std::atomic<uint64_t> last_slot_count_{0};
};

// ============================================================================
// Least Connections
// ============================================================================

/**
 * @brief Minimum active connections from the shared stats store.
 *        Ties go to the earliest candidate; unknown instances count as zero.
 */
class LeastConnectionsStrategy : public LoadBalancerStrategy {
public:
    explicit LeastConnectionsStrategy(const InstanceStatsStore& stats);

    [[nodiscard]] Result<ServiceInstancePtr> select(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key) override;
    [[nodiscard]] Algorithm algorithm() const override { return Algorithm::LEAST_CONNECTIONS; }

private:
    const InstanceStatsStore& stats_;
};

// ============================================================================
// Random
// ============================================================================

class RandomStrategy : public LoadBalancerStrategy {
public:
    explicit RandomStrategy(std::optional<uint64_t> seed = std::nullopt);

    [[nodiscard]] Result<ServiceInstancePtr> select(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key) override;
    [[nodiscard]] Algorithm algorithm() const override { return Algorithm::RANDOM; }

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

// ============================================================================
// Weighted Random
// ============================================================================

/**
 * @brief Draws r in [0, total_weight) and returns the first candidate whose
 *        cumulative weight exceeds r.
 */
class WeightedRandomStrategy : public LoadBalancerStrategy {
public:
    explicit WeightedRandomStrategy(WeightMap weights = {},
                                    std::optional<uint64_t> seed = std::nullopt);

    [[nodiscard]] Result<ServiceInstancePtr> select(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key) override;
    [[nodiscard]] Algorithm algorithm() const override { return Algorithm::WEIGHTED_RANDOM; }

private:
    const WeightMap weights_;
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

// ============================================================================
// Source-key Hash
// ============================================================================

/**
 * @brief crc32(key) modulo candidate count. Stateless; no rebalancing
 *        guarantee when the candidate set changes.
 */
class IpHashStrategy : public LoadBalancerStrategy {
public:
    [[nodiscard]] Result<ServiceInstancePtr> select(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key) override;
    [[nodiscard]] Algorithm algorithm() const override { return Algorithm::IP_HASH; }
};

} // namespace meshguard
