#include <catch2/catch_test_macros.hpp>
#include "balancer/instance_filter.hpp"
#include "balancer/instance_stats_store.hpp"
#include "balancer/strategies.hpp"
#include "mocks/instance_builders.hpp"
#include <map>

using namespace meshguard;
using meshguard::testing::make_instance;
using meshguard::testing::make_instances;

namespace {

std::string pick(LoadBalancerStrategy& strategy, const std::vector<ServiceInstancePtr>& candidates,
                 std::string_view key = {}) {
    auto result = strategy.select(candidates, key);
    REQUIRE(result.is_ok());
    return result.value()->id;
}

} // namespace

// ============================================================================
// Round Robin
// ============================================================================

TEST_CASE("RoundRobin: cycles through candidates in order", "[lb][round_robin]") {
    RoundRobinStrategy rr;
    const auto candidates = make_instances({"a", "b", "c"});

    CHECK(pick(rr, candidates) == "a");
    CHECK(pick(rr, candidates) == "b");
    CHECK(pick(rr, candidates) == "c");
    CHECK(pick(rr, candidates) == "a");
    CHECK(rr.get_stats().selections == 4);
}

TEST_CASE("RoundRobin: empty candidate list", "[lb][round_robin]") {
    RoundRobinStrategy rr;
    auto result = rr.select({}, "");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::NO_HEALTHY_INSTANCES);
}

// ============================================================================
// Weighted Round Robin
// ============================================================================

TEST_CASE("WeightedRoundRobin: follows the weight-expanded sequence", "[lb][weighted_round_robin]") {
    WeightedRoundRobinStrategy wrr;
    const std::vector<ServiceInstancePtr> candidates = {make_instance("A", 3), make_instance("B", 1)};

    std::string sequence;
    for (int i = 0; i < 8; ++i) sequence += pick(wrr, candidates);
    CHECK(sequence == "AAABAAAB");
}

TEST_CASE("WeightedRoundRobin: configured weights override instance weights", "[lb][weighted_round_robin]") {
    WeightedRoundRobinStrategy wrr(WeightMap{{"B", 2}});
    const std::vector<ServiceInstancePtr> candidates = {make_instance("A", 5), make_instance("B", 9)};

    std::map<std::string, int> counts;
    for (int i = 0; i < 70; ++i) ++counts[pick(wrr, candidates)];
    CHECK(counts["A"] == 50);
    CHECK(counts["B"] == 20);
}

TEST_CASE("WeightedRoundRobin: unset weights behave as plain round robin", "[lb][weighted_round_robin]") {
    WeightedRoundRobinStrategy wrr;
    const auto candidates = make_instances({"x", "y"});

    CHECK(pick(wrr, candidates) == "x");
    CHECK(pick(wrr, candidates) == "y");
    CHECK(pick(wrr, candidates) == "x");
}

// ============================================================================
// Least Connections
// ============================================================================

TEST_CASE("LeastConnections: picks the minimum active count", "[lb][least_connections]") {
    InstanceStatsStore stats;
    LeastConnectionsStrategy lc(stats);
    const auto candidates = make_instances({"a", "b", "c"});

    InstanceStats s;
    s.active_connections = 5;
    stats.update("a", s);
    s.active_connections = 1;
    stats.update("b", s);
    s.active_connections = 3;
    stats.update("c", s);

    CHECK(pick(lc, candidates) == "b");

    stats.connection_started("b");
    stats.connection_started("b");
    stats.connection_started("b");
    CHECK(pick(lc, candidates) == "c");
}

TEST_CASE("LeastConnections: ties go to the first candidate", "[lb][least_connections]") {
    InstanceStatsStore stats;
    LeastConnectionsStrategy lc(stats);
    const auto candidates = make_instances({"p", "q", "r"});

    // No stats at all: every candidate reads as zero
    CHECK(pick(lc, candidates) == "p");

    stats.connection_started("p");
    CHECK(pick(lc, candidates) == "q");
}

// ============================================================================
// Random / Weighted Random
// ============================================================================

TEST_CASE("Random: only returns supplied candidates and reaches all", "[lb][random]") {
    RandomStrategy random(12345);
    const auto candidates = make_instances({"a", "b", "c"});

    std::map<std::string, int> counts;
    for (int i = 0; i < 600; ++i) ++counts[pick(random, candidates)];
    CHECK(counts.size() == 3);
    for (const auto& [id, n] : counts) {
        CHECK(n > 100);
    }
}

TEST_CASE("WeightedRandom: 3:1 weights select roughly 3:1", "[lb][weighted_random]") {
    WeightedRandomStrategy wr(WeightMap{{"A", 3}, {"B", 1}}, 7);
    const auto candidates = make_instances({"A", "B"});

    constexpr int kTrials = 20000;
    int a = 0;
    for (int i = 0; i < kTrials; ++i) {
        if (pick(wr, candidates) == "A") ++a;
    }
    const double share = static_cast<double>(a) / kTrials;
    CHECK(share > 0.72);
    CHECK(share < 0.78);
}

TEST_CASE("WeightedRandom: single candidate always wins", "[lb][weighted_random]") {
    WeightedRandomStrategy wr;
    const auto candidates = make_instances({"solo"});
    for (int i = 0; i < 10; ++i) CHECK(pick(wr, candidates) == "solo");
}

// ============================================================================
// Source-key Hash
// ============================================================================

TEST_CASE("IpHash: same key maps to the same instance", "[lb][ip_hash]") {
    IpHashStrategy hash;
    const auto candidates = make_instances({"a", "b", "c", "d"});

    const auto first = pick(hash, candidates, "10.1.2.3");
    for (int i = 0; i < 20; ++i) {
        CHECK(pick(hash, candidates, "10.1.2.3") == first);
    }
}

TEST_CASE("IpHash: keys spread over candidates", "[lb][ip_hash]") {
    IpHashStrategy hash;
    const auto candidates = make_instances({"a", "b", "c", "d"});

    std::map<std::string, int> counts;
    for (int i = 0; i < 400; ++i) {
        ++counts[pick(hash, candidates, "client-" + std::to_string(i))];
    }
    CHECK(counts.size() == 4);
}

// ============================================================================
// Health filter and stats store
// ============================================================================

TEST_CASE("InstanceFilter: drops unhealthy and preserves order", "[lb][filter]") {
    const std::vector<ServiceInstancePtr> candidates = {
        make_instance("a"), make_instance("b", 0, "critical"), nullptr,
        make_instance("c"), make_instance("d", 0, "warning")};

    InstanceFilter filter;
    const auto healthy = filter.apply(candidates);
    REQUIRE(healthy.size() == 2);
    CHECK(healthy[0]->id == "a");
    CHECK(healthy[1]->id == "c");

    InstanceFilter permissive(false);
    CHECK(permissive.apply(candidates).size() == 4);

    InstanceFilter warning_ok(true, "warning");
    const auto warned = warning_ok.apply(candidates);
    REQUIRE(warned.size() == 1);
    CHECK(warned[0]->id == "d");
}

TEST_CASE("InstanceStatsStore: update overwrites measured values only", "[lb][stats]") {
    InstanceStatsStore store;
    store.record_selection("a");
    store.record_selection("a");

    InstanceStats measured;
    measured.active_connections = 4;
    measured.failed_requests = 2;
    measured.total_requests = 999;
    measured.response_time = std::chrono::microseconds(1500);
    store.update("a", measured);

    const auto s = store.get("a");
    CHECK(s.active_connections == 4);
    CHECK(s.failed_requests == 2);
    CHECK(s.total_requests == 2);
    CHECK(s.response_time == std::chrono::microseconds(1500));
    CHECK(s.last_used.time_since_epoch().count() > 0);
}

TEST_CASE("InstanceStatsStore: connection lifecycle", "[lb][stats]") {
    InstanceStatsStore store;
    store.connection_started("a");
    store.connection_started("a");
    store.connection_finished("a", false, std::chrono::microseconds(800));

    auto s = store.get("a");
    CHECK(s.active_connections == 1);
    CHECK(s.failed_requests == 1);
    CHECK(s.response_time == std::chrono::microseconds(800));

    store.connection_finished("a", true, std::chrono::microseconds(100));
    store.connection_finished("a", true, std::chrono::microseconds(100));
    CHECK(store.get("a").active_connections == 0);

    CHECK_FALSE(store.find("missing").has_value());
    CHECK(store.get("missing").total_requests == 0);
}
