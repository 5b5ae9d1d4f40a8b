#pragma once

#include "balancer/consistent_hash_strategy.hpp"
#include "balancer/instance_filter.hpp"
#include "balancer/instance_stats_store.hpp"
#include "balancer/iservice_registry.hpp"
#include "balancer/strategies.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace meshguard {

/**
 * @brief Health filtering + strategy dispatch + usage statistics
 *
 * One instance of every strategy is created up front; the configured
 * algorithm is the default and any call may name another one. After a
 * successful selection the winner's TotalRequests and LastUsed are updated
 * (when statistics are enabled).
 */
class LoadBalancerManager {
public:
    struct Config {
        std::string algorithm = "round_robin";
        bool health_check_enabled = true;
        bool stats_enabled = true;
        std::string healthy_status = std::string(kHealthPassing);
        WeightMap weights;                  // instance id → weight
    };

    LoadBalancerManager();
    explicit LoadBalancerManager(Config config);

    LoadBalancerManager(const LoadBalancerManager&) = delete;
    LoadBalancerManager& operator=(const LoadBalancerManager&) = delete;

    /**
     * @brief Select with the configured algorithm
     * @return Instance, or NO_HEALTHY_INSTANCES / INVALID_ALGORITHM
     */
    [[nodiscard]] Result<ServiceInstancePtr> select(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key = {});

    /**
     * @brief Select with an explicit algorithm name for this call only
     */
    [[nodiscard]] Result<ServiceInstancePtr> select(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key,
        std::string_view algorithm);

    /**
     * @brief List the service's instances from the registry, then select
     */
    [[nodiscard]] Result<ServiceInstancePtr> select_service(
        const IServiceRegistry& registry, const std::string& service_name,
        std::string_view key = {});

    // ---- Statistics ---------------------------------------------------------

    /**
     * @brief Overwrite measured values for one instance. No-op when
     *        statistics are disabled.
     */
    void update_stats(const std::string& instance_id, const InstanceStats& stats);

    void connection_started(const std::string& instance_id);
    void connection_finished(const std::string& instance_id, bool success,
                             std::chrono::microseconds response_time);

    [[nodiscard]] std::optional<InstanceStats> get_instance_stats(const std::string& instance_id) const;
    [[nodiscard]] std::unordered_map<std::string, InstanceStats> get_all_instance_stats() const;
    [[nodiscard]] std::vector<StrategyStats> get_strategy_stats() const;

    // ---- Introspection ------------------------------------------------------

    [[nodiscard]] const std::string& algorithm_name() const { return config_.algorithm; }
    [[nodiscard]] std::optional<Algorithm> algorithm() const { return algorithm_; }
    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const InstanceFilter& filter() const { return filter_; }

private:
    [[nodiscard]] Result<ServiceInstancePtr> select_with(
        const std::vector<ServiceInstancePtr>& candidates, std::string_view key,
        std::optional<Algorithm> algorithm, std::string_view requested_name);

    Config config_;
    std::optional<Algorithm> algorithm_;
    InstanceFilter filter_;
    InstanceStatsStore stats_;
    std::unordered_map<Algorithm, std::unique_ptr<LoadBalancerStrategy>> strategies_;
};

} // namespace meshguard
