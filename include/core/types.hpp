#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <optional>
#include <chrono>
#include <cstdint>
#include <memory>

namespace meshguard {

// ============================================================================
// Service Instances (read-only input from the registry)
// ============================================================================

inline constexpr std::string_view kHealthPassing = "passing";

struct HealthStatus {
    std::string status;     // passing, warning, critical
    std::string output;
    std::chrono::system_clock::time_point last_checked;
};

struct ServiceInstance {
    std::string id;
    std::string service_name;
    std::string address;
    uint16_t port = 0;
    std::vector<std::string> tags;
    std::unordered_map<std::string, std::string> meta;
    HealthStatus health;
    int weight = 0;         // <= 0 means unset (treated as 1)

    [[nodiscard]] bool is_passing() const { return health.status == kHealthPassing; }
};

using ServiceInstancePtr = std::shared_ptr<const ServiceInstance>;

// ============================================================================
// Circuit Breaker Types
// ============================================================================

enum class CircuitState {
    CLOSED,         // Normal operation
    HALF_OPEN,      // Testing recovery
    OPEN            // Failing, reject requests
};

inline constexpr const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::HALF_OPEN: return "half-open";
        case CircuitState::OPEN:      return "open";
    }
    return "unknown";
}

/**
 * @brief Per-generation request counters of one breaker.
 * Reset to zero on every generation rollover.
 */
struct Counts {
    uint32_t requests = 0;
    uint32_t total_successes = 0;
    uint32_t total_failures = 0;
    uint32_t consecutive_successes = 0;
    uint32_t consecutive_failures = 0;

    bool operator==(const Counts&) const = default;
};

struct CircuitBreakerStats {
    std::string name;
    CircuitState state = CircuitState::CLOSED;
    uint64_t generation = 0;
    Counts counts;
    std::chrono::milliseconds open_remaining{0};   // Zero unless OPEN
    uint64_t transitions_to_open = 0;
    uint64_t transitions_to_half_open = 0;
    uint64_t transitions_to_closed = 0;
};

// ============================================================================
// Load Balancer Types
// ============================================================================

enum class Algorithm {
    ROUND_ROBIN,
    WEIGHTED_ROUND_ROBIN,
    LEAST_CONNECTIONS,
    RANDOM,
    WEIGHTED_RANDOM,
    CONSISTENT_HASH,
    IP_HASH
};

inline constexpr const char* algorithm_to_string(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::ROUND_ROBIN:          return "round_robin";
        case Algorithm::WEIGHTED_ROUND_ROBIN: return "weighted_round_robin";
        case Algorithm::LEAST_CONNECTIONS:    return "least_connections";
        case Algorithm::RANDOM:               return "random";
        case Algorithm::WEIGHTED_RANDOM:      return "weighted_random";
        case Algorithm::CONSISTENT_HASH:      return "consistent_hash";
        case Algorithm::IP_HASH:              return "ip_hash";
    }
    return "unknown";
}

/**
 * @brief Parse algorithm name (case-insensitive). "source_hash" aliases ip_hash.
 */
[[nodiscard]] std::optional<Algorithm> parse_algorithm(std::string_view name);

inline constexpr Algorithm kAllAlgorithms[] = {
    Algorithm::ROUND_ROBIN,
    Algorithm::WEIGHTED_ROUND_ROBIN,
    Algorithm::LEAST_CONNECTIONS,
    Algorithm::RANDOM,
    Algorithm::WEIGHTED_RANDOM,
    Algorithm::CONSISTENT_HASH,
    Algorithm::IP_HASH,
};

/**
 * @brief Usage statistics for one instance. Absent entries read as zero.
 */
struct InstanceStats {
    int64_t active_connections = 0;
    int64_t total_requests = 0;
    int64_t failed_requests = 0;
    std::chrono::microseconds response_time{0};
    std::chrono::system_clock::time_point last_used;
};

/**
 * @brief Introspection snapshot of one selection strategy
 */
struct StrategyStats {
    Algorithm algorithm = Algorithm::ROUND_ROBIN;
    uint64_t selections = 0;
    std::vector<std::pair<std::string, uint64_t>> details;
};

} // namespace meshguard
