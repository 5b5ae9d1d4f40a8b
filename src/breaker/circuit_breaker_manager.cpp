#include "breaker/circuit_breaker_manager.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace meshguard {

CircuitBreakerManager::CircuitBreakerManager()
    : CircuitBreakerManager(CircuitBreaker::Config()) {}

CircuitBreakerManager::CircuitBreakerManager(const CircuitBreaker::Config& default_config)
    : default_config_(default_config) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::get_breaker(const std::string& name) {
    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(breakers_mutex_);
        const auto it = breakers_.find(name);
        if (it != breakers_.end()) {
            return it->second;
        }
    }

    // Resolve config BEFORE taking breakers_mutex_ unique lock
    // (avoids nesting config_mutex_ inside breakers_mutex_)
    return create_or_get(name, resolve_config(name));
}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::get_breaker(
    const std::string& name, const CircuitBreaker::Config& config) {
    {
        std::shared_lock lock(breakers_mutex_);
        const auto it = breakers_.find(name);
        if (it != breakers_.end()) {
            return it->second;
        }
    }
    return create_or_get(name, config);
}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::find(const std::string& name) const {
    std::shared_lock lock(breakers_mutex_);
    const auto it = breakers_.find(name);
    return it != breakers_.end() ? it->second : nullptr;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::create_or_get(
    const std::string& name, const CircuitBreaker::Config& config) {
    // Slow path: unique lock + try_emplace (re-checks under the write lock)
    std::unique_lock lock(breakers_mutex_);
    auto [it, inserted] = breakers_.try_emplace(name, nullptr);
    if (inserted) {
        it->second = std::make_shared<CircuitBreaker>(name, config);
        if (on_state_change_) {
            it->second->set_on_state_change(on_state_change_);
        }
        utils::log::info(std::format("Circuit breaker '{}' created", name));
    }
    return it->second;
}

CircuitBreaker::Config CircuitBreakerManager::resolve_config(const std::string& name) const {
    std::shared_lock lock(config_mutex_);
    const auto it = dependency_configs_.find(name);
    return it != dependency_configs_.end() ? it->second : default_config_;
}

void CircuitBreakerManager::set_dependency_config(
    const std::string& name, const CircuitBreaker::Config& config) {
    std::unique_lock lock(config_mutex_);
    dependency_configs_[name] = config;
}

bool CircuitBreakerManager::remove(const std::string& name) {
    std::unique_lock lock(breakers_mutex_);
    const bool removed = breakers_.erase(name) > 0;
    if (removed) {
        utils::log::info(std::format("Circuit breaker '{}' removed", name));
    }
    return removed;
}

Status CircuitBreakerManager::reset(const std::string& name) {
    const auto breaker = find(name);
    if (!breaker) {
        return Status::error(ErrorCategory::NOT_FOUND,
            std::format("circuit breaker '{}' not found", name));
    }
    breaker->reset();
    utils::log::info(std::format("Circuit breaker '{}' reset", name));
    return Status::ok();
}

void CircuitBreakerManager::reset_all() {
    std::vector<std::shared_ptr<CircuitBreaker>> snapshot;
    {
        std::shared_lock lock(breakers_mutex_);
        snapshot.reserve(breakers_.size());
        for (const auto& [name, breaker] : breakers_) {
            snapshot.push_back(breaker);
        }
    }
    // Reset outside the registry lock: reset() may run state-change callbacks
    for (const auto& breaker : snapshot) {
        breaker->reset();
    }
    utils::log::info(std::format("Reset {} circuit breakers", snapshot.size()));
}

std::vector<std::string> CircuitBreakerManager::list() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(breakers_mutex_);
        names.reserve(breakers_.size());
        for (const auto& [name, breaker] : breakers_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<CircuitBreakerStats> CircuitBreakerManager::get_all_stats() const {
    std::shared_lock lock(breakers_mutex_);
    std::vector<CircuitBreakerStats> result;
    result.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
        result.push_back(breaker->get_stats());
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.name < b.name; });
    return result;
}

size_t CircuitBreakerManager::size() const {
    std::shared_lock lock(breakers_mutex_);
    return breakers_.size();
}

void CircuitBreakerManager::set_on_state_change(CircuitBreaker::StateChangeCallback cb) {
    std::unique_lock lock(breakers_mutex_);
    on_state_change_ = std::move(cb);
    for (const auto& [name, breaker] : breakers_) {
        breaker->set_on_state_change(on_state_change_);
    }
}

} // namespace meshguard
