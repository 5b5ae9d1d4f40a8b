#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace meshguard;

namespace {

struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "meshguard_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.circuit_breaker.enabled);
    CHECK(cfg.circuit_breaker.defaults.failure_threshold == 5);
    CHECK(cfg.circuit_breaker.defaults.success_threshold == 3);
    CHECK(cfg.circuit_breaker.defaults.timeout == std::chrono::milliseconds(60000));
    CHECK(cfg.circuit_breaker.defaults.max_requests == 1);
    CHECK(cfg.circuit_breaker.defaults.min_requests == 3);
    CHECK(cfg.circuit_breaker.failure_status_codes == std::vector<int>{500, 502, 503, 504});
    CHECK(cfg.load_balancer.algorithm == "round_robin");
    CHECK(cfg.load_balancer.health_check_enabled);
    CHECK(cfg.load_balancer.stats_enabled);
    CHECK(cfg.load_balancer.healthy_status == "passing");
    CHECK(cfg.services.empty());
}

TEST_CASE("ConfigLoader: full document", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "debug"

[circuit_breaker]
enabled = true
failure_threshold = 4
success_threshold = 2
timeout_ms = 1500
max_requests = 3
interval_ms = 0
min_requests = 10
failure_ratio = 0.5
failure_status_codes = [502, 503]
max_concurrent = 16

[[circuit_breaker.dependencies]]
name = "payments"
failure_threshold = 2
timeout_ms = 500

[load_balancer]
algorithm = "weighted_random"
health_check_enabled = false
stats_enabled = false
healthy_status = "warning"

[load_balancer.weights]
"orders-0" = 3
"orders-1" = 1

[services]
orders = "10.0.0.1:8080,10.0.0.2:8080"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");

    const auto& cb = cfg.circuit_breaker;
    CHECK(cb.defaults.failure_threshold == 4);
    CHECK(cb.defaults.success_threshold == 2);
    CHECK(cb.defaults.timeout == std::chrono::milliseconds(1500));
    CHECK(cb.defaults.max_requests == 3);
    CHECK(cb.defaults.interval == std::chrono::milliseconds(0));
    CHECK(cb.defaults.min_requests == 10);
    CHECK(cb.defaults.failure_ratio == 0.5);
    CHECK(cb.failure_status_codes == std::vector<int>{502, 503});
    CHECK(cb.max_concurrent == 16);

    REQUIRE(cb.dependencies.size() == 1);
    const auto& dep = cb.dependencies[0];
    CHECK(dep.name == "payments");
    CHECK(dep.breaker.failure_threshold == 2);
    CHECK(dep.breaker.timeout == std::chrono::milliseconds(500));
    // Unset keys inherit the section defaults
    CHECK(dep.breaker.success_threshold == 2);
    CHECK(dep.breaker.min_requests == 10);

    const auto& lb = cfg.load_balancer;
    CHECK(lb.algorithm == "weighted_random");
    CHECK_FALSE(lb.health_check_enabled);
    CHECK_FALSE(lb.stats_enabled);
    CHECK(lb.healthy_status == "warning");
    CHECK(lb.weights.at("orders-0") == 3);
    CHECK(lb.weights.at("orders-1") == 1);

    CHECK(cfg.services.at("orders") == "10.0.0.1:8080,10.0.0.2:8080");
}

TEST_CASE("ConfigLoader: validation failures are reported together", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "loud"

[circuit_breaker]
failure_threshold = 0
failure_ratio = 1.5

[load_balancer]
algorithm = "best_effort"

[load_balancer.weights]
a = -1
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("logging.level") != std::string::npos);
    CHECK(msg.find("failure_threshold") != std::string::npos);
    CHECK(msg.find("failure_ratio") != std::string::npos);
    CHECK(msg.find("best_effort") != std::string::npos);
    CHECK(msg.find("weights.a") != std::string::npos);
}

TEST_CASE("ConfigLoader: negative durations are rejected", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[circuit_breaker]
timeout_ms = -5
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("timeout_ms") != std::string::npos);
}

TEST_CASE("ConfigLoader: dependency without name is rejected", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[[circuit_breaker.dependencies]]
failure_threshold = 2
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("name") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed service addresses are rejected", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[services]
orders = "10.0.0.1"
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("services") != std::string::npos);
}

TEST_CASE("ConfigLoader: service without addresses is rejected", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[services]
orders = "10.0.0.1:8080"
search = " , "
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("services.search") != std::string::npos);
    CHECK(result.error_message.find("services.orders") == std::string::npos);
}

TEST_CASE("ConfigLoader: integers wider than int are rejected", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[circuit_breaker]
failure_status_codes = [503, 4294967799]

[load_balancer.weights]
wide = 4294967297
narrow = 2
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("failure_status_codes out of range: 4294967799") != std::string::npos);
    CHECK(msg.find("load_balancer.weights.wide out of range: 4294967297") != std::string::npos);
    CHECK(msg.find("weights.narrow") == std::string::npos);
}

TEST_CASE("ConfigLoader: env references with fallbacks", "[config][env]") {
    ::unsetenv("MESHGUARD_TEST_UNSET");
    auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "${MESHGUARD_TEST_UNSET:-warn}"

[load_balancer]
healthy_status = "${MESHGUARD_TEST_UNSET}passing"
)");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "warn");
    CHECK(result.config.load_balancer.healthy_status == "passing");
}

TEST_CASE("ConfigLoader: TOML syntax errors", "[config]") {
    auto result = ConfigLoader::load_from_string("[circuit_breaker\nfailure_threshold = ");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: environment variable expansion", "[config][env]") {
    ::setenv("MESHGUARD_TEST_ALGORITHM", "least_connections", 1);
    auto result = ConfigLoader::load_from_string(R"(
[load_balancer]
algorithm = "${MESHGUARD_TEST_ALGORITHM}"
)");
    ::unsetenv("MESHGUARD_TEST_ALGORITHM");

    REQUIRE(result.success);
    CHECK(result.config.load_balancer.algorithm == "least_connections");
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/meshguard.toml");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigLoader: include merges and main file wins", "[config][include]") {
    TmpDir tmp;

    tmp.file("breakers.toml", R"(
[circuit_breaker]
failure_threshold = 9
timeout_ms = 2000

[[circuit_breaker.dependencies]]
name = "search"
)");

    auto main_path = tmp.file("main.toml", R"(
include = "breakers.toml"

[circuit_breaker]
failure_threshold = 6

[load_balancer]
algorithm = "ip_hash"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.circuit_breaker.defaults.failure_threshold == 6);
    CHECK(result.config.circuit_breaker.defaults.timeout == std::chrono::milliseconds(2000));
    REQUIRE(result.config.circuit_breaker.dependencies.size() == 1);
    CHECK(result.config.circuit_breaker.dependencies[0].name == "search");
    CHECK(result.config.load_balancer.algorithm == "ip_hash");
}

TEST_CASE("ConfigLoader: circular include is detected", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    auto b = tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file(b);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}
