#include "config/config_loader.hpp"
#include "balancer/static_service_registry.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <unordered_set>

namespace meshguard {

// ============================================================================
// Document preparation: ${VAR} expansion, include files, table merging
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Substitute ${NAME} and ${NAME:-fallback} with environment values.
 *        An unset variable without a fallback expands to nothing.
 */
std::string expand_env_vars(const std::string& input) {
    std::string out;
    size_t cursor = 0;
    for (size_t open = input.find("${"); open != std::string::npos;
         open = input.find("${", cursor)) {
        const size_t close = input.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        out.append(input, cursor, open - cursor);

        std::string_view ref(input.data() + open + 2, close - open - 2);
        std::string_view fallback;
        if (const auto sep = ref.find(":-"); sep != std::string_view::npos) {
            fallback = ref.substr(sep + 2);
            ref = ref.substr(0, sep);
        }
        const char* value = std::getenv(std::string(ref).c_str());
        if (value && *value) {
            out += value;
        } else {
            out += fallback;
        }
        cursor = close + 1;
    }
    if (cursor == 0) return input;
    out.append(input, cursor);
    return out;
}

// Walks tables and arrays alike, rewriting every string leaf in place
void expand_env_vars_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        *str = expand_env_vars(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) expand_env_vars_in(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_env_vars_in(child);
    }
}

/**
 * @brief Fold `overlay` into `base`: nested tables merge, arrays of the same
 *        key concatenate (so [[circuit_breaker.dependencies]] accumulate), and
 *        any other value from the overlay replaces the base one.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        toml::node* existing = base.get(key.str());
        if (existing && existing->is_table() && val.is_table()) {
            merge_tables(*existing->as_table(), *val.as_table());
        } else if (existing && existing->is_array() && val.is_array()) {
            for (const auto& elem : *val.as_array()) existing->as_array()->push_back(elem);
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

// `include` may be one path or an array of paths; non-strings are ignored
std::vector<std::string> take_include_paths(toml::table& root) {
    std::vector<std::string> paths;
    if (const auto single = root["include"].value<std::string>()) {
        paths.push_back(*single);
    } else if (const auto* list = root["include"].as_array()) {
        for (const auto& item : *list) {
            if (const auto path = item.value<std::string>()) paths.push_back(*path);
        }
    }
    root.erase("include");
    return paths;
}

/**
 * @brief Replace `root` with its included files merged underneath it.
 *        Included files are resolved relative to the including file and the
 *        including file's own keys win.
 */
void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {}, possible circular include", kMaxIncludeDepth));
    }

    for (const auto& rel_path : take_include_paths(root)) {
        const auto abs_path = std::filesystem::canonical(base_dir / rel_path);
        if (!visited.insert(abs_path.string()).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path.string()));
        }

        auto included = toml::parse_file(abs_path.string());
        resolve_includes(included, abs_path.parent_path(), visited, depth + 1);
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto doc = toml::parse(content);
    expand_env_vars_in(doc);
    return doc;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto doc = toml::parse_file(file_path);

    const auto canonical = std::filesystem::canonical(file_path);
    std::unordered_set<std::string> visited{canonical.string()};
    resolve_includes(doc, canonical.parent_path(), visited, 0);

    expand_env_vars_in(doc);
    return doc;
}

// ---- Extraction helpers ----------------------------------------------------

using ErrorList = std::vector<std::string>;

/**
 * @brief Read a non-negative integer; negative or oversized values are
 *        reported and the fallback is kept.
 */
template<typename T>
T read_unsigned(const toml::table& tbl, std::string_view key, T fallback,
                std::string_view section, ErrorList& errors) {
    const auto raw = tbl[key].value<int64_t>();
    if (!raw) return fallback;
    if (*raw < 0 || static_cast<uint64_t>(*raw) > std::numeric_limits<T>::max()) {
        errors.push_back(std::format("{}.{} out of range: {}", section, key, *raw));
        return fallback;
    }
    return static_cast<T>(*raw);
}

// Array and table elements that land in an `int`; wider values are reported
std::optional<int> narrow_to_int(int64_t raw, std::string_view what, ErrorList& errors) {
    if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
        errors.push_back(std::format("{} out of range: {}", what, raw));
        return std::nullopt;
    }
    return static_cast<int>(raw);
}

std::chrono::milliseconds read_millis(const toml::table& tbl, std::string_view key,
                                      std::chrono::milliseconds fallback,
                                      std::string_view section, ErrorList& errors) {
    const auto raw = tbl[key].value<int64_t>();
    if (!raw) return fallback;
    if (*raw < 0) {
        errors.push_back(std::format("{}.{} must be >= 0, got {}", section, key, *raw));
        return fallback;
    }
    return std::chrono::milliseconds(*raw);
}

/**
 * @brief Breaker keys of one table layered over `base`
 */
CircuitBreaker::Config extract_breaker_settings(const toml::table& tbl,
                                                const CircuitBreaker::Config& base,
                                                std::string_view section, ErrorList& errors) {
    CircuitBreaker::Config cfg = base;
    cfg.failure_threshold = read_unsigned<uint32_t>(tbl, "failure_threshold",
                                                    base.failure_threshold, section, errors);
    cfg.success_threshold = read_unsigned<uint32_t>(tbl, "success_threshold",
                                                    base.success_threshold, section, errors);
    cfg.timeout = read_millis(tbl, "timeout_ms", base.timeout, section, errors);
    cfg.max_requests = read_unsigned<uint32_t>(tbl, "max_requests",
                                               base.max_requests, section, errors);
    cfg.interval = read_millis(tbl, "interval_ms", base.interval, section, errors);
    cfg.min_requests = read_unsigned<uint32_t>(tbl, "min_requests",
                                               base.min_requests, section, errors);
    cfg.failure_ratio = tbl["failure_ratio"].value_or(base.failure_ratio);
    return cfg;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

CircuitBreakerConfig extract_circuit_breaker(const toml::table& root, ErrorList& errors) {
    CircuitBreakerConfig cfg;
    const auto* cb = root["circuit_breaker"].as_table();
    if (!cb) return cfg;

    cfg.enabled = (*cb)["enabled"].value_or(true);
    cfg.defaults = extract_breaker_settings(*cb, cfg.defaults, "circuit_breaker", errors);
    cfg.max_concurrent = read_unsigned<uint32_t>(*cb, "max_concurrent", 0,
                                                 "circuit_breaker", errors);

    if (const auto* codes = (*cb)["failure_status_codes"].as_array()) {
        cfg.failure_status_codes.clear();
        for (const auto& elem : *codes) {
            if (const auto code = elem.value<int64_t>()) {
                if (const auto narrowed = narrow_to_int(
                        *code, "circuit_breaker.failure_status_codes", errors)) {
                    cfg.failure_status_codes.push_back(*narrowed);
                }
            } else {
                errors.emplace_back("circuit_breaker.failure_status_codes must be integers");
            }
        }
    }

    if (const auto* deps = (*cb)["dependencies"].as_array()) {
        for (const auto& elem : *deps) {
            const auto* dep = elem.as_table();
            if (!dep) continue;

            DependencyBreakerConfig override_cfg;
            override_cfg.name = (*dep)["name"].value_or(std::string{});
            if (override_cfg.name.empty()) {
                errors.emplace_back("circuit_breaker.dependencies entry missing 'name'");
                continue;
            }
            const std::string section = std::format("circuit_breaker.dependencies.{}",
                                                    override_cfg.name);
            override_cfg.breaker = extract_breaker_settings(*dep, cfg.defaults, section, errors);
            cfg.dependencies.push_back(std::move(override_cfg));
        }
    }
    return cfg;
}

LoadBalancerManager::Config extract_load_balancer(const toml::table& root, ErrorList& errors) {
    LoadBalancerManager::Config cfg;
    const auto* lb = root["load_balancer"].as_table();
    if (!lb) return cfg;

    cfg.algorithm = (*lb)["algorithm"].value_or(cfg.algorithm);
    cfg.health_check_enabled = (*lb)["health_check_enabled"].value_or(true);
    cfg.stats_enabled = (*lb)["stats_enabled"].value_or(true);
    cfg.healthy_status = (*lb)["healthy_status"].value_or(cfg.healthy_status);

    if (const auto* weights = (*lb)["weights"].as_table()) {
        for (auto&& [id, node] : *weights) {
            const auto weight = node.value<int64_t>();
            if (!weight) {
                errors.push_back(std::format("load_balancer.weights.{} must be an integer",
                                             id.str()));
                continue;
            }
            const std::string what = std::format("load_balancer.weights.{}", id.str());
            if (const auto narrowed = narrow_to_int(*weight, what, errors)) {
                cfg.weights[std::string(id.str())] = *narrowed;
            }
        }
    }
    return cfg;
}

std::map<std::string, std::string> extract_services(const toml::table& root, ErrorList& errors) {
    std::map<std::string, std::string> services;
    const auto* tbl = root["services"].as_table();
    if (!tbl) return services;

    for (auto&& [name, node] : *tbl) {
        if (const auto* addresses = node.as_string()) {
            services[std::string(name.str())] = addresses->get();
        } else {
            errors.push_back(std::format("services.{} must be an address list string",
                                         name.str()));
        }
    }
    return services;
}

ConfigLoader::LoadResult extract_and_validate(const toml::table& tbl) {
    ErrorList errors;

    MeshConfig config;
    config.logging = extract_logging(tbl);
    config.circuit_breaker = extract_circuit_breaker(tbl, errors);
    config.load_balancer = extract_load_balancer(tbl, errors);
    config.services = extract_services(tbl, errors);

    for (auto& e : ConfigLoader::validate_config(config)) {
        errors.push_back(std::move(e));
    }

    if (!errors.empty()) {
        std::string joined;
        for (const auto& e : errors) {
            utils::log::error(std::format("Config: {}", e));
            if (!joined.empty()) joined += "; ";
            joined += e;
        }
        return ConfigLoader::LoadResult::error(
            std::format("Config validation failed: {}", joined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

void validate_breaker(const CircuitBreaker::Config& cfg, std::string_view section,
                      std::vector<std::string>& errors) {
    if (cfg.failure_threshold < 1) {
        errors.push_back(std::format("{}.failure_threshold must be >= 1", section));
    }
    if (cfg.success_threshold < 1) {
        errors.push_back(std::format("{}.success_threshold must be >= 1", section));
    }
    if (cfg.max_requests < 1) {
        errors.push_back(std::format("{}.max_requests must be >= 1", section));
    }
    if (!(cfg.failure_ratio > 0.0 && cfg.failure_ratio <= 1.0)) {
        errors.push_back(std::format("{}.failure_ratio must be in (0, 1], got {}",
                                     section, cfg.failure_ratio));
    }
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const MeshConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level unknown: '{}'", config.logging.level));
    }

    validate_breaker(config.circuit_breaker.defaults, "circuit_breaker", errors);
    for (const auto& dep : config.circuit_breaker.dependencies) {
        validate_breaker(dep.breaker, std::format("circuit_breaker.dependencies.{}", dep.name),
                         errors);
    }
    for (const int code : config.circuit_breaker.failure_status_codes) {
        if (code < 100 || code > 599) {
            errors.push_back(std::format(
                "circuit_breaker.failure_status_codes: {} is not a status code", code));
        }
    }

    if (!parse_algorithm(config.load_balancer.algorithm)) {
        errors.push_back(std::format("load_balancer.algorithm unknown: '{}'",
                                     config.load_balancer.algorithm));
    }
    for (const auto& [id, weight] : config.load_balancer.weights) {
        if (weight <= 0) {
            errors.push_back(std::format("load_balancer.weights.{} must be > 0, got {}",
                                         id, weight));
        }
    }

    if (!config.services.empty()) {
        const auto registry = StaticServiceRegistry::from_addresses(config.services);
        if (registry.is_error()) {
            errors.push_back(std::format("services: {}", registry.error_message()));
        } else {
            for (const auto& [name, addresses] : config.services) {
                if (registry.value().list_instances(name).empty()) {
                    errors.push_back(std::format("services.{} lists no addresses", name));
                }
            }
        }
    }

    return errors;
}

} // namespace meshguard
