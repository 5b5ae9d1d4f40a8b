#include <catch2/catch_test_macros.hpp>
#include "breaker/circuit_breaker_manager.hpp"
#include <atomic>
#include <thread>

using namespace meshguard;

TEST_CASE("CircuitBreakerManager: get_breaker creates once and reuses", "[breaker_manager]") {
    CircuitBreakerManager manager;

    auto a = manager.get_breaker("payments");
    auto b = manager.get_breaker("payments");
    REQUIRE(a != nullptr);
    CHECK(a.get() == b.get());
    CHECK(manager.size() == 1);
    CHECK(a->name() == "payments");
}

TEST_CASE("CircuitBreakerManager: find does not create", "[breaker_manager]") {
    CircuitBreakerManager manager;
    CHECK(manager.find("ghost") == nullptr);
    CHECK(manager.size() == 0);

    auto created = manager.get_breaker("ghost");
    CHECK(manager.find("ghost") == created);
}

TEST_CASE("CircuitBreakerManager: config resolution order", "[breaker_manager]") {
    CircuitBreaker::Config defaults;
    defaults.failure_threshold = 7;
    CircuitBreakerManager manager(defaults);

    CircuitBreaker::Config override_cfg;
    override_cfg.failure_threshold = 2;
    manager.set_dependency_config("inventory", override_cfg);

    CircuitBreaker::Config explicit_cfg;
    explicit_cfg.failure_threshold = 11;

    CHECK(manager.get_breaker("users")->config().failure_threshold == 7);
    CHECK(manager.get_breaker("inventory")->config().failure_threshold == 2);
    CHECK(manager.get_breaker("search", explicit_cfg)->config().failure_threshold == 11);

    // Explicit config only applies on creation
    CHECK(manager.get_breaker("users", explicit_cfg)->config().failure_threshold == 7);
}

TEST_CASE("CircuitBreakerManager: concurrent get_breaker yields one instance", "[breaker_manager][concurrency]") {
    CircuitBreakerManager manager;
    constexpr int kThreads = 16;

    std::vector<std::shared_ptr<CircuitBreaker>> results(kThreads);
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) std::this_thread::yield();
            results[i] = manager.get_breaker("contended");
        });
    }
    go.store(true);
    for (auto& t : threads) t.join();

    CHECK(manager.size() == 1);
    for (const auto& r : results) {
        CHECK(r.get() == results[0].get());
    }
}

TEST_CASE("CircuitBreakerManager: remove detaches existing holders", "[breaker_manager]") {
    CircuitBreakerManager manager;
    auto original = manager.get_breaker("catalog");

    CHECK(manager.remove("catalog"));
    CHECK_FALSE(manager.remove("catalog"));
    CHECK(manager.size() == 0);

    // The old handle still works
    CHECK(original->call([] { return Status::ok(); }).is_ok());

    auto fresh = manager.get_breaker("catalog");
    CHECK(fresh.get() != original.get());
}

TEST_CASE("CircuitBreakerManager: reset by name", "[breaker_manager]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    cfg.timeout = std::chrono::milliseconds(5000);
    CircuitBreakerManager manager(cfg);

    auto cb = manager.get_breaker("billing");
    (void)cb->call([] { return Status::error(ErrorCategory::UPSTREAM_ERROR, "down"); });
    REQUIRE(cb->state() == CircuitState::OPEN);

    CHECK(manager.reset("billing").is_ok());
    CHECK(cb->state() == CircuitState::CLOSED);

    auto missing = manager.reset("unknown");
    CHECK(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::NOT_FOUND);
}

TEST_CASE("CircuitBreakerManager: reset_all closes every breaker", "[breaker_manager]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    cfg.timeout = std::chrono::milliseconds(5000);
    CircuitBreakerManager manager(cfg);

    for (const char* name : {"a", "b", "c"}) {
        (void)manager.get_breaker(name)->call(
            [] { return Status::error(ErrorCategory::UPSTREAM_ERROR, "down"); });
    }
    manager.reset_all();

    for (const auto& stats : manager.get_all_stats()) {
        CHECK(stats.state == CircuitState::CLOSED);
    }
}

TEST_CASE("CircuitBreakerManager: list and stats are sorted by name", "[breaker_manager]") {
    CircuitBreakerManager manager;
    (void)manager.get_breaker("zeta");
    (void)manager.get_breaker("alpha");
    (void)manager.get_breaker("mu");

    const auto names = manager.list();
    REQUIRE(names.size() == 3);
    CHECK(names[0] == "alpha");
    CHECK(names[1] == "mu");
    CHECK(names[2] == "zeta");

    const auto stats = manager.get_all_stats();
    REQUIRE(stats.size() == 3);
    CHECK(stats[0].name == "alpha");
    CHECK(stats[2].name == "zeta");
}

TEST_CASE("CircuitBreakerManager: state change callback covers existing and new breakers", "[breaker_manager][events]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    cfg.timeout = std::chrono::milliseconds(5000);
    CircuitBreakerManager manager(cfg);

    auto early = manager.get_breaker("early");

    std::vector<std::string> opened;
    manager.set_on_state_change([&](const StateChangeEvent& e) {
        if (e.to == CircuitState::OPEN) opened.push_back(e.breaker_name);
    });

    auto late = manager.get_breaker("late");
    const auto fail = [] { return Status::error(ErrorCategory::UPSTREAM_ERROR, "down"); };
    (void)early->call(fail);
    (void)late->call(fail);

    REQUIRE(opened.size() == 2);
    CHECK(opened[0] == "early");
    CHECK(opened[1] == "late");
}
