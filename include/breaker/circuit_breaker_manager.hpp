#pragma once

#include "breaker/circuit_breaker.hpp"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshguard {

/**
 * @brief Registry owning one circuit breaker per dependency name.
 *
 * Lazily creates breakers on first access using double-checked locking
 * with a shared_mutex for read-heavy workloads (lookups dominate, creates
 * happen once per name).
 *
 * Config resolution on creation: explicit config argument, then the
 * per-dependency override, then the default config.
 */
class CircuitBreakerManager {
public:
    CircuitBreakerManager();
    explicit CircuitBreakerManager(const CircuitBreaker::Config& default_config);

    /**
     * @brief Get or create the breaker for `name`.
     *
     * Uses double-checked locking: shared_lock for fast path (existing),
     * unique_lock + try_emplace for slow path (creation).
     *
     * @return Shared pointer to the breaker (never null)
     */
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get_breaker(const std::string& name);

    /**
     * @brief Get or create with an explicit config. The config is only used
     *        when this call creates the breaker.
     */
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get_breaker(
        const std::string& name, const CircuitBreaker::Config& config);

    /**
     * @brief Lookup without creating
     */
    [[nodiscard]] std::shared_ptr<CircuitBreaker> find(const std::string& name) const;

    /**
     * @brief Set per-dependency config override.
     * Affects subsequently created breakers for this name.
     */
    void set_dependency_config(const std::string& name, const CircuitBreaker::Config& config);

    /**
     * @brief Remove a breaker. Holders of the shared_ptr keep a working
     *        (detached) instance; the next get_breaker() creates a fresh one.
     * @return true if a breaker was removed
     */
    bool remove(const std::string& name);

    /**
     * @brief Force one breaker back to CLOSED
     * @return NOT_FOUND if no breaker exists under `name`
     */
    Status reset(const std::string& name);

    void reset_all();

    /**
     * @brief Names of all breakers, sorted
     */
    [[nodiscard]] std::vector<std::string> list() const;

    [[nodiscard]] std::vector<CircuitBreakerStats> get_all_stats() const;

    [[nodiscard]] size_t size() const;

    /**
     * @brief Observe transitions of every breaker, existing and future
     */
    void set_on_state_change(CircuitBreaker::StateChangeCallback cb);

private:
    [[nodiscard]] std::shared_ptr<CircuitBreaker> create_or_get(
        const std::string& name, const CircuitBreaker::Config& config);
    [[nodiscard]] CircuitBreaker::Config resolve_config(const std::string& name) const;

    CircuitBreaker::Config default_config_;

    // Breaker storage (double-checked locking pattern)
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    mutable std::shared_mutex breakers_mutex_;

    // Per-dependency config overrides
    std::unordered_map<std::string, CircuitBreaker::Config> dependency_configs_;
    mutable std::shared_mutex config_mutex_;

    // Guarded by breakers_mutex_
    CircuitBreaker::StateChangeCallback on_state_change_;
};

} // namespace meshguard
