#pragma once

#include "balancer/load_balancer_manager.hpp"
#include "breaker/circuit_breaker.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace meshguard {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Circuit Breaker Config (mirrors TOML hierarchy)
// ============================================================================

struct DependencyBreakerConfig {
    std::string name;
    CircuitBreaker::Config breaker;
};

struct CircuitBreakerConfig {
    bool enabled = true;
    CircuitBreaker::Config defaults;
    std::vector<int> failure_status_codes = {500, 502, 503, 504};
    uint32_t max_concurrent = 0;    // Bulkhead capacity, 0 = no bulkhead
    std::vector<DependencyBreakerConfig> dependencies;
};

// ============================================================================
// MeshConfig - Complete parsed configuration
// ============================================================================

struct MeshConfig {
    LoggingConfig logging;
    CircuitBreakerConfig circuit_breaker;
    LoadBalancerManager::Config load_balancer;
    std::map<std::string, std::string> services;   // name → "host:port,host:port"
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief TOML configuration loader (toml++)
 *
 * Supports ${ENV_VAR} expansion in string values and `include` directives
 * (string or array of paths relative to the including file). Included files
 * are the base, the including file wins on conflicts.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        MeshConfig config;

        static LoadResult ok(MeshConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to meshguard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check ranges and names; returns every problem found
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const MeshConfig& config);
};

} // namespace meshguard
