#include "balancer/instance_stats_store.hpp"

#include <mutex>

namespace meshguard {

void InstanceStatsStore::update(const std::string& instance_id, const InstanceStats& stats) {
    std::unique_lock lock(mutex_);
    auto& existing = stats_[instance_id];
    existing.active_connections = stats.active_connections;
    existing.failed_requests = stats.failed_requests;
    existing.response_time = stats.response_time;
}

void InstanceStatsStore::record_selection(const std::string& instance_id) {
    std::unique_lock lock(mutex_);
    auto& existing = stats_[instance_id];
    ++existing.total_requests;
    existing.last_used = std::chrono::system_clock::now();
}

void InstanceStatsStore::connection_started(const std::string& instance_id) {
    std::unique_lock lock(mutex_);
    ++stats_[instance_id].active_connections;
}

void InstanceStatsStore::connection_finished(const std::string& instance_id, bool success,
                                             std::chrono::microseconds response_time) {
    std::unique_lock lock(mutex_);
    auto& existing = stats_[instance_id];
    if (existing.active_connections > 0) {
        --existing.active_connections;
    }
    if (!success) {
        ++existing.failed_requests;
    }
    existing.response_time = response_time;
}

InstanceStats InstanceStatsStore::get(const std::string& instance_id) const {
    std::shared_lock lock(mutex_);
    const auto it = stats_.find(instance_id);
    return it != stats_.end() ? it->second : InstanceStats{};
}

std::optional<InstanceStats> InstanceStatsStore::find(const std::string& instance_id) const {
    std::shared_lock lock(mutex_);
    const auto it = stats_.find(instance_id);
    if (it == stats_.end()) return std::nullopt;
    return it->second;
}

std::unordered_map<std::string, InstanceStats> InstanceStatsStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return stats_;
}

std::vector<int64_t> InstanceStatsStore::active_connections(
    const std::vector<ServiceInstancePtr>& candidates) const {
    std::vector<int64_t> result;
    result.reserve(candidates.size());

    std::shared_lock lock(mutex_);
    for (const auto& instance : candidates) {
        const auto it = stats_.find(instance->id);
        result.push_back(it != stats_.end() ? it->second.active_connections : 0);
    }
    return result;
}

size_t InstanceStatsStore::size() const {
    std::shared_lock lock(mutex_);
    return stats_.size();
}

} // namespace meshguard
