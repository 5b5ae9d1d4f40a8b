#include "balancer/load_balancer_manager.hpp"
#include "balancer/static_service_registry.hpp"
#include "breaker/bulkhead_circuit_breaker.hpp"
#include "breaker/circuit_breaker_manager.hpp"
#include "breaker/result_code_circuit_breaker.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "observability/status_report.hpp"

#include <charconv>
#include <cstdio>
#include <format>
#include <memory>
#include <random>
#include <unordered_map>

using namespace meshguard;

namespace {

// In-memory registry used when the config names no services
StaticServiceRegistry seeded_registry() {
    StaticServiceRegistry registry;
    const char* ids[] = {"orders-0", "orders-1", "orders-2", "orders-3"};
    for (int i = 0; i < 4; ++i) {
        ServiceInstance inst;
        inst.id = ids[i];
        inst.service_name = "orders";
        inst.address = std::format("10.0.0.{}", i + 1);
        inst.port = 8080;
        inst.tags = {"sim"};
        inst.weight = i + 1;
        // Last instance reports critical and is filtered out by health checks
        inst.health.status = (i == 3) ? "critical" : std::string(kHealthPassing);
        registry.add_instance(std::move(inst));
    }
    return registry;
}

// Simulated upstream: the first instance of every service returns 503 during
// the middle third of the run, everything else answers 200.
Result<int> simulate_call(const ServiceInstance& inst, int request, int total) {
    const bool degraded = inst.id.ends_with("-0") && request >= total / 3 && request < 2 * total / 3;
    return Result<int>::ok(degraded ? 503 : 200);
}

// Per-instance guard: result-code classification, optionally behind a bulkhead
struct InstanceGuard {
    std::unique_ptr<ResultCodeCircuitBreaker> codes;
    std::unique_ptr<BulkheadCircuitBreaker> bulkhead;

    Result<int> run(const ResultCodeCircuitBreaker::CodeFn& fn) {
        if (!bulkhead) return codes->execute(fn);

        // The bulkhead owns admission; failure codes become breaker failures
        auto outcome = bulkhead->execute([&]() -> Result<int> {
            auto r = fn();
            if (r.is_ok() && codes->is_failure_code(r.value())) {
                return Result<int>::error(ErrorCategory::UPSTREAM_ERROR,
                                          std::format("upstream returned {}", r.value()));
            }
            return r;
        });
        return outcome;
    }
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/meshguard.toml";
        if (argc > 1) {
            config_file = argv[1];
        }
        int total_requests = 300;
        if (argc > 2) {
            const std::string_view arg(argv[2]);
            const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), total_requests);
            if (ec != std::errc{} || ptr != arg.data() + arg.size() || total_requests <= 0) {
                utils::log::error(std::format("Invalid request count '{}'", arg));
                return 1;
            }
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        MeshConfig config;
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (config_result.success) {
            config = std::move(config_result.config);
        } else {
            utils::log::warn(std::format("{} - using defaults", config_result.error_message));
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info("[2/4] Circuit breakers initializing...");
        CircuitBreakerManager breakers(config.circuit_breaker.defaults);
        for (const auto& dep : config.circuit_breaker.dependencies) {
            breakers.set_dependency_config(dep.name, dep.breaker);
        }

        utils::log::info(std::format("[3/4] Load balancer: {}", config.load_balancer.algorithm));
        LoadBalancerManager balancer(config.load_balancer);

        StaticServiceRegistry registry;
        if (config.services.empty()) {
            registry = seeded_registry();
        } else {
            auto parsed = StaticServiceRegistry::from_addresses(config.services);
            if (parsed.is_error()) {
                utils::log::error(parsed.error_message());
                return 1;
            }
            registry = std::move(parsed.value());
        }
        const auto services = registry.service_names();
        if (services.empty()) {
            utils::log::error("No services to route to");
            return 1;
        }

        utils::log::info(std::format("[4/4] Routing {} requests across {} service(s)",
                                     total_requests, services.size()));

        // One guard per instance, sharing the manager's breakers
        std::unordered_map<std::string, InstanceGuard> guards;
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> latency_us(200, 5000);

        uint64_t served = 0, rejected = 0, failed = 0, unroutable = 0;
        utils::Timer timer;
        for (int i = 0; i < total_requests; ++i) {
            const std::string& service = services[static_cast<size_t>(i) % services.size()];
            const std::string key = std::format("client-{}", i % 17);

            auto selected = balancer.select_service(registry, service, key);
            if (selected.is_error()) {
                ++unroutable;
                continue;
            }
            const ServiceInstance& inst = *selected.value();

            auto call = [&]() { return simulate_call(inst, i, total_requests); };
            Result<int> outcome = Result<int>::ok(0);
            balancer.connection_started(inst.id);
            if (config.circuit_breaker.enabled) {
                auto& guard = guards[inst.id];
                if (!guard.codes) {
                    auto breaker = breakers.get_breaker(inst.id);
                    guard.codes = std::make_unique<ResultCodeCircuitBreaker>(
                        breaker, config.circuit_breaker.failure_status_codes);
                    if (config.circuit_breaker.max_concurrent > 0) {
                        guard.bulkhead = std::make_unique<BulkheadCircuitBreaker>(
                            breaker, config.circuit_breaker.max_concurrent);
                    }
                }
                outcome = guard.run(call);
            } else {
                outcome = call();
            }

            const bool ok = outcome.is_ok() && outcome.value() < 500;
            balancer.connection_finished(inst.id, ok, std::chrono::microseconds(latency_us(rng)));

            if (outcome.is_error() &&
                (outcome.error_category() == ErrorCategory::CIRCUIT_OPEN ||
                 outcome.error_category() == ErrorCategory::TOO_MANY_REQUESTS)) {
                ++rejected;
                utils::log::debug(std::format("{} -> {}: {} ({})", key, inst.id,
                    outcome.error_message(), error_category_to_string(outcome.error_category())));
            } else if (!ok) {
                ++failed;
            } else {
                ++served;
            }
        }

        utils::log::info(std::format("Done in {}ms: served={} failed={} rejected={} unroutable={}",
                                     timer.elapsed_ms().count(), served, failed, rejected, unroutable));

        const StatusReport report(breakers, balancer);
        std::printf("%s\n", report.to_json().c_str());

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
