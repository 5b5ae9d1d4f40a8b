#pragma once

#include "core/types.hpp"
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshguard {

/**
 * @brief Per-instance usage statistics keyed by instance id.
 *
 * Entries are created on first write and never removed. Reads of unknown
 * ids return zeroed stats. One shared_mutex guards the whole map; the
 * least-connections scan reads all candidates under a single shared lock.
 */
class InstanceStatsStore {
public:
    /**
     * @brief Overwrite active connections, failed requests and response time
     *        with externally measured values
     */
    void update(const std::string& instance_id, const InstanceStats& stats);

    /**
     * @brief Count a selection: TotalRequests + 1, LastUsed = now
     */
    void record_selection(const std::string& instance_id);

    void connection_started(const std::string& instance_id);
    void connection_finished(const std::string& instance_id, bool success,
                             std::chrono::microseconds response_time);

    [[nodiscard]] InstanceStats get(const std::string& instance_id) const;
    [[nodiscard]] std::optional<InstanceStats> find(const std::string& instance_id) const;
    [[nodiscard]] std::unordered_map<std::string, InstanceStats> snapshot() const;

    /**
     * @brief Active connection count for each candidate, in order
     */
    [[nodiscard]] std::vector<int64_t> active_connections(
        const std::vector<ServiceInstancePtr>& candidates) const;

    [[nodiscard]] size_t size() const;

private:
    std::unordered_map<std::string, InstanceStats> stats_;
    mutable std::shared_mutex mutex_;
};

} // namespace meshguard
