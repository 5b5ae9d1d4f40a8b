#include "balancer/consistent_hash_strategy.hpp"
#include "core/hash.hpp"

#include <algorithm>
#include <format>

namespace meshguard {

std::string ConsistentHashStrategy::virtual_node_key(const std::string& instance_id, int index) {
    return std::format("{}:{}", instance_id, index);
}

Result<ServiceInstancePtr> ConsistentHashStrategy::select(
    const std::vector<ServiceInstancePtr>& candidates, std::string_view key) {
    if (candidates.empty()) return no_candidates();

    const uint32_t hash = crc32_of(key);
    size_t chosen = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!matches(candidates)) {
            rebuild(candidates);
        }

        // Closest successor on the ring
        auto it = std::lower_bound(ring_.begin(), ring_.end(), hash,
            [](const RingPoint& point, uint32_t h) { return point.first < h; });
        if (it == ring_.end()) {
            it = ring_.begin();
        }
        chosen = it->second;
    }
    return selected(candidates[chosen]);
}

StrategyStats ConsistentHashStrategy::get_stats() const {
    auto stats = LoadBalancerStrategy::get_stats();
    std::lock_guard<std::mutex> lock(mutex_);
    stats.details.emplace_back("virtual_nodes", ring_.size());
    stats.details.emplace_back("instances", members_.size());
    stats.details.emplace_back("rebuilds", rebuilds_);
    return stats;
}

void ConsistentHashStrategy::rebuild(const std::vector<ServiceInstancePtr>& candidates) {
    ring_.clear();
    ring_.reserve(candidates.size() * kVirtualNodes);
    members_.clear();
    members_.reserve(candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& id = candidates[i]->id;
        members_.push_back(id);
        for (int v = 0; v < kVirtualNodes; ++v) {
            ring_.emplace_back(crc32_of(virtual_node_key(id, v)), i);
        }
    }

    // Ties on hash resolve by candidate position, keeping lookups deterministic
    std::sort(ring_.begin(), ring_.end());
    ++rebuilds_;
}

bool ConsistentHashStrategy::matches(const std::vector<ServiceInstancePtr>& candidates) const {
    if (members_.size() != candidates.size()) return false;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (members_[i] != candidates[i]->id) return false;
    }
    return true;
}

} // namespace meshguard
