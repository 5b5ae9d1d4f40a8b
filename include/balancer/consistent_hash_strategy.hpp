#pragma once

#include "balancer/load_balancer_strategy.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace meshguard {

/**
 * @brief Hash ring with virtual nodes.
 *
 * Every instance contributes kVirtualNodes points, the crc32 of
 * "<instance id>:<index>". Points are kept as a sorted array. A key maps to
 * the first point whose hash is >= crc32(key), wrapping to the first point
 * past the end of the ring.
 *
 * The ring is derived from the full candidate list of each call. It is
 * reused only while the candidate ids arrive in the same order, which makes
 * the result identical to a rebuild. Rebuild and lookup run under one mutex.
 */
class ConsistentHashStrategy : public LoadBalancerStrategy {
public:
    static constexpr int kVirtualNodes = 100;

    [[nodiscard]] Result<ServiceInstancePtr> select(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key) override;
    [[nodiscard]] Algorithm algorithm() const override { return Algorithm::CONSISTENT_HASH; }
    [[nodiscard]] StrategyStats get_stats() const override;

    [[nodiscard]] static std::string virtual_node_key(const std::string& instance_id, int index);

private:
    // Point on the ring: (hash, index into the candidate list)
    using RingPoint = std::pair<uint32_t, size_t>;

    void rebuild(const std::vector<ServiceInstancePtr>& candidates);
    [[nodiscard]] bool matches(const std::vector<ServiceInstancePtr>& candidates) const;

    mutable std::mutex mutex_;
    std::vector<RingPoint> ring_;
    std::vector<std::string> members_;
    uint64_t rebuilds_ = 0;
};

} // namespace meshguard
