#include "observability/status_report.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace meshguard {

std::string StatusReport::breaker_stats_json(const CircuitBreakerStats& stats) {
    return std::format(
        "{{\"name\":\"{}\",\"state\":\"{}\",\"generation\":{},"
        "\"counts\":{{\"requests\":{},\"total_successes\":{},\"total_failures\":{},"
        "\"consecutive_successes\":{},\"consecutive_failures\":{}}},"
        "\"open_remaining_ms\":{},"
        "\"transitions\":{{\"open\":{},\"half_open\":{},\"closed\":{}}}}}",
        utils::escape_json(stats.name), circuit_state_to_string(stats.state), stats.generation,
        stats.counts.requests, stats.counts.total_successes, stats.counts.total_failures,
        stats.counts.consecutive_successes, stats.counts.consecutive_failures,
        stats.open_remaining.count(),
        stats.transitions_to_open, stats.transitions_to_half_open, stats.transitions_to_closed);
}

std::string StatusReport::breakers_json() const {
    const auto all = breakers_.get_all_stats();

    std::string json = "{\"breakers\":[";
    for (size_t i = 0; i < all.size(); ++i) {
        if (i > 0) json += ",";
        json += breaker_stats_json(all[i]);
    }
    json += std::format("],\"total\":{}}}", all.size());
    return json;
}

std::string StatusReport::load_balancer_json() const {
    std::string json = std::format("{{\"algorithm\":\"{}\",\"valid\":{},\"strategies\":[",
        utils::escape_json(balancer_.algorithm_name()),
        utils::booltostr(balancer_.algorithm().has_value()));

    const auto strategies = balancer_.get_strategy_stats();
    for (size_t i = 0; i < strategies.size(); ++i) {
        if (i > 0) json += ",";
        const auto& s = strategies[i];
        json += std::format("{{\"algorithm\":\"{}\",\"selections\":{}",
                            algorithm_to_string(s.algorithm), s.selections);
        for (const auto& [key, value] : s.details) {
            json += std::format(",\"{}\":{}", utils::escape_json(key), value);
        }
        json += "}";
    }

    json += "],\"instances\":[";
    const auto snapshot = balancer_.get_all_instance_stats();
    std::vector<std::pair<std::string, InstanceStats>> instances(snapshot.begin(), snapshot.end());
    std::sort(instances.begin(), instances.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    for (size_t i = 0; i < instances.size(); ++i) {
        if (i > 0) json += ",";
        const auto& [id, st] = instances[i];
        const std::string last_used = st.last_used.time_since_epoch().count() == 0
            ? std::string{} : utils::format_timestamp(st.last_used);
        json += std::format(
            "{{\"id\":\"{}\",\"active_connections\":{},\"total_requests\":{},"
            "\"failed_requests\":{},\"response_time_us\":{},\"last_used\":\"{}\"}}",
            utils::escape_json(id), st.active_connections, st.total_requests,
            st.failed_requests, st.response_time.count(), last_used);
    }
    json += "]}";
    return json;
}

std::string StatusReport::to_json() const {
    return std::format("{{\"circuit_breakers\":{},\"load_balancer\":{},\"timestamp\":\"{}\"}}",
        breakers_json(), load_balancer_json(),
        utils::format_timestamp(std::chrono::system_clock::now()));
}

} // namespace meshguard
