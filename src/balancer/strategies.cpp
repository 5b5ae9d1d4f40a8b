#include "balancer/strategies.hpp"
#include "core/hash.hpp"

#include <algorithm>

namespace meshguard {

namespace {

uint64_t make_seed(std::optional<uint64_t> seed) {
    if (seed) return *seed;
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

} // anonymous namespace

// ---- Base ------------------------------------------------------------------

StrategyStats LoadBalancerStrategy::get_stats() const {
    StrategyStats stats;
    stats.algorithm = algorithm();
    stats.selections = selections_.load(std::memory_order_relaxed);
    return stats;
}

Result<ServiceInstancePtr> LoadBalancerStrategy::no_candidates() {
    return Result<ServiceInstancePtr>::error(ErrorCategory::NO_HEALTHY_INSTANCES,
                                             "no healthy instances available");
}

// ---- Round Robin -----------------------------------------------------------

Result<ServiceInstancePtr> RoundRobinStrategy::select(
    const std::vector<ServiceInstancePtr>& candidates, std::string_view /*key*/) {
    if (candidates.empty()) return no_candidates();

    const uint64_t index = counter_.fetch_add(1, std::memory_order_relaxed) % candidates.size();
    return selected(candidates[index]);
}

StrategyStats RoundRobinStrategy::get_stats() const {
    auto stats = LoadBalancerStrategy::get_stats();
    stats.details.emplace_back("counter", counter_.load(std::memory_order_relaxed));
    return stats;
}

// ---- Weighted Round Robin --------------------------------------------------

WeightedRoundRobinStrategy::WeightedRoundRobinStrategy(WeightMap weights)
    : weights_(std::move(weights)) {}

Result<ServiceInstancePtr> WeightedRoundRobinStrategy::select(
    const std::vector<ServiceInstancePtr>& candidates, std::string_view /*key*/) {
    if (candidates.empty()) return no_candidates();

    std::vector<uint64_t> cumulative;
    cumulative.reserve(candidates.size());
    uint64_t total = 0;
    for (const auto& instance : candidates) {
        total += static_cast<uint64_t>(effective_weight(*instance, weights_));
        cumulative.push_back(total);
    }
    last_slot_count_.store(total, std::memory_order_relaxed);

    // Slot lookup on cumulative weights, same order as the expanded sequence
    const uint64_t slot = cursor_.fetch_add(1, std::memory_order_relaxed) % total;
    const auto it = std::upper_bound(cumulative.begin(), cumulative.end(), slot);
    return selected(candidates[static_cast<size_t>(it - cumulative.begin())]);
}

StrategyStats WeightedRoundRobinStrategy::get_stats() const {
    auto stats = LoadBalancerStrategy::get_stats();
    stats.details.emplace_back("cursor", cursor_.load(std::memory_order_relaxed));
    stats.details.emplace_back("slots", last_slot_count_.load(std::memory_order_relaxed));
    stats.details.emplace_back("weights", weights_.size());
    return stats;
}

// ---- Least Connections -----------------------------------------------------

LeastConnectionsStrategy::LeastConnectionsStrategy(const InstanceStatsStore& stats)
    : stats_(stats) {}

Result<ServiceInstancePtr> LeastConnectionsStrategy::select(
    const std::vector<ServiceInstancePtr>& candidates, std::string_view /*key*/) {
    if (candidates.empty()) return no_candidates();

    const auto connections = stats_.active_connections(candidates);
    size_t best = 0;
    for (size_t i = 1; i < connections.size(); ++i) {
        if (connections[i] < connections[best]) {
            best = i;
        }
    }
    return selected(candidates[best]);
}

// ---- Random ----------------------------------------------------------------

RandomStrategy::RandomStrategy(std::optional<uint64_t> seed)
    : rng_(make_seed(seed)) {}

Result<ServiceInstancePtr> RandomStrategy::select(
    const std::vector<ServiceInstancePtr>& candidates, std::string_view /*key*/) {
    if (candidates.empty()) return no_candidates();

    size_t index = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
        index = dist(rng_);
    }
    return selected(candidates[index]);
}

// ---- Weighted Random -------------------------------------------------------

WeightedRandomStrategy::WeightedRandomStrategy(WeightMap weights, std::optional<uint64_t> seed)
    : weights_(std::move(weights)),
      rng_(make_seed(seed)) {}

Result<ServiceInstancePtr> WeightedRandomStrategy::select(
    const std::vector<ServiceInstancePtr>& candidates, std::string_view /*key*/) {
    if (candidates.empty()) return no_candidates();

    uint64_t total = 0;
    for (const auto& instance : candidates) {
        total += static_cast<uint64_t>(effective_weight(*instance, weights_));
    }

    uint64_t draw = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<uint64_t> dist(0, total - 1);
        draw = dist(rng_);
    }

    uint64_t cumulative = 0;
    for (const auto& instance : candidates) {
        cumulative += static_cast<uint64_t>(effective_weight(*instance, weights_));
        if (draw < cumulative) {
            return selected(instance);
        }
    }
    return selected(candidates.back());
}

// ---- Source-key Hash -------------------------------------------------------

Result<ServiceInstancePtr> IpHashStrategy::select(
    const std::vector<ServiceInstancePtr>& candidates, std::string_view key) {
    if (candidates.empty()) return no_candidates();

    const uint32_t hash = crc32_of(key);
    return selected(candidates[hash % candidates.size()]);
}

} // namespace meshguard
