#include "balancer/load_balancer_manager.hpp"
#include "core/utils.hpp"

#include <format>

namespace meshguard {

LoadBalancerManager::LoadBalancerManager()
    : LoadBalancerManager(Config()) {}

LoadBalancerManager::LoadBalancerManager(Config config)
    : config_(std::move(config)),
      algorithm_(parse_algorithm(config_.algorithm)),
      filter_(config_.health_check_enabled, config_.healthy_status) {
    strategies_[Algorithm::ROUND_ROBIN] = std::make_unique<RoundRobinStrategy>();
    strategies_[Algorithm::WEIGHTED_ROUND_ROBIN] =
        std::make_unique<WeightedRoundRobinStrategy>(config_.weights);
    strategies_[Algorithm::LEAST_CONNECTIONS] = std::make_unique<LeastConnectionsStrategy>(stats_);
    strategies_[Algorithm::RANDOM] = std::make_unique<RandomStrategy>();
    strategies_[Algorithm::WEIGHTED_RANDOM] =
        std::make_unique<WeightedRandomStrategy>(config_.weights);
    strategies_[Algorithm::CONSISTENT_HASH] = std::make_unique<ConsistentHashStrategy>();
    strategies_[Algorithm::IP_HASH] = std::make_unique<IpHashStrategy>();

    if (!algorithm_) {
        utils::log::warn(std::format("Unknown load balancing algorithm '{}'", config_.algorithm));
    }
}

Result<ServiceInstancePtr> LoadBalancerManager::select(
    const std::vector<ServiceInstancePtr>& candidates, std::string_view key) {
    return select_with(candidates, key, algorithm_, config_.algorithm);
}

Result<ServiceInstancePtr> LoadBalancerManager::select(
    const std::vector<ServiceInstancePtr>& candidates, std::string_view key,
    std::string_view algorithm) {
    return select_with(candidates, key, parse_algorithm(algorithm), algorithm);
}

Result<ServiceInstancePtr> LoadBalancerManager::select_service(
    const IServiceRegistry& registry, const std::string& service_name, std::string_view key) {
    auto result = select(registry.list_instances(service_name), key);
    if (result.is_error()) {
        return Result<ServiceInstancePtr>::error(result.error_category(),
            std::format("{}: {}", service_name, result.error_message()));
    }
    return result;
}

Result<ServiceInstancePtr> LoadBalancerManager::select_with(
    const std::vector<ServiceInstancePtr>& candidates, std::string_view key,
    std::optional<Algorithm> algorithm, std::string_view requested_name) {
    if (candidates.empty()) {
        utils::log::warn("Load balancer: empty candidate list");
        return Result<ServiceInstancePtr>::error(ErrorCategory::NO_HEALTHY_INSTANCES,
                                                 "no healthy instances available");
    }

    const auto healthy = filter_.apply(candidates);
    if (healthy.empty()) {
        utils::log::warn(std::format("Load balancer: none of {} candidates is healthy",
                                     candidates.size()));
        return Result<ServiceInstancePtr>::error(ErrorCategory::NO_HEALTHY_INSTANCES,
                                                 "no healthy instances available");
    }

    if (!algorithm) {
        utils::log::warn(std::format("Load balancer: invalid algorithm '{}'", requested_name));
        return Result<ServiceInstancePtr>::error(ErrorCategory::INVALID_ALGORITHM,
            std::format("invalid load balancing algorithm '{}'", requested_name));
    }

    const auto it = strategies_.find(*algorithm);
    if (it == strategies_.end()) {
        return Result<ServiceInstancePtr>::error(ErrorCategory::INVALID_ALGORITHM,
            std::format("algorithm '{}' is not registered", algorithm_to_string(*algorithm)));
    }

    auto result = it->second->select(healthy, key);
    if (result.is_ok() && config_.stats_enabled) {
        stats_.record_selection(result.value()->id);
    }
    return result;
}

void LoadBalancerManager::update_stats(const std::string& instance_id, const InstanceStats& stats) {
    if (!config_.stats_enabled) return;
    stats_.update(instance_id, stats);
}

void LoadBalancerManager::connection_started(const std::string& instance_id) {
    if (!config_.stats_enabled) return;
    stats_.connection_started(instance_id);
}

void LoadBalancerManager::connection_finished(const std::string& instance_id, bool success,
                                              std::chrono::microseconds response_time) {
    if (!config_.stats_enabled) return;
    stats_.connection_finished(instance_id, success, response_time);
}

std::optional<InstanceStats> LoadBalancerManager::get_instance_stats(
    const std::string& instance_id) const {
    return stats_.find(instance_id);
}

std::unordered_map<std::string, InstanceStats> LoadBalancerManager::get_all_instance_stats() const {
    return stats_.snapshot();
}

std::vector<StrategyStats> LoadBalancerManager::get_strategy_stats() const {
    std::vector<StrategyStats> result;
    result.reserve(strategies_.size());
    for (const Algorithm algorithm : kAllAlgorithms) {
        const auto it = strategies_.find(algorithm);
        if (it != strategies_.end()) {
            result.push_back(it->second->get_stats());
        }
    }
    return result;
}

} // namespace meshguard
