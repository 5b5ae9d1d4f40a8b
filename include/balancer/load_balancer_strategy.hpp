#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace meshguard {

using WeightMap = std::unordered_map<std::string, int>;

/**
 * @brief Weight of an instance: configured weight, else the instance's own,
 *        else 1. Non-positive values count as unset.
 */
[[nodiscard]] inline int effective_weight(const ServiceInstance& instance, const WeightMap& weights) {
    const auto it = weights.find(instance.id);
    if (it != weights.end() && it->second > 0) {
        return it->second;
    }
    return instance.weight > 0 ? instance.weight : 1;
}

/**
 * @brief Abstract selection algorithm
 *
 * select() picks one of the caller-owned candidates (all non-null). The
 * candidate list is never modified; stateful strategies keep only small
 * counters or a ring. Empty input yields NO_HEALTHY_INSTANCES.
 */
class LoadBalancerStrategy {
public:
    virtual ~LoadBalancerStrategy() = default;

    [[nodiscard]] virtual Result<ServiceInstancePtr> select(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key) = 0;

    [[nodiscard]] virtual Algorithm algorithm() const = 0;

    /**
     * @brief Algorithm name, selection count and algorithm-specific details
     */
    [[nodiscard]] virtual StrategyStats get_stats() const;

protected:
    [[nodiscard]] static Result<ServiceInstancePtr> no_candidates();

    Result<ServiceInstancePtr> selected(ServiceInstancePtr instance) {
        selections_.fetch_add(1, std::memory_order_relaxed);
        return Result<ServiceInstancePtr>::ok(std::move(instance));
    }

    std::atomic<uint64_t> selections_{0};
};

} // namespace meshguard
