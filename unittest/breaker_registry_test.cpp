// ============================================================================
// CIRCUIT BREAKER REGISTRY TEST SUITE
// ============================================================================
// Tests for registration, open/critical listing and health summaries
// ============================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include <reliability/core/breaker/breaker_registry.hpp>

using namespace Reliability;
using namespace std::chrono_literals;

namespace {
constexpr uint64_t T0 = 1'700'000'000'000ULL;
}

class BreakerRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(T0);
    CircuitBreakerRegistry registry{clock};

    std::shared_ptr<CircuitBreaker> add(const std::string& name, uint32_t threshold,
                                        std::chrono::milliseconds timeout) {
        auto breaker = std::make_shared<CircuitBreaker>(BreakerConfig{name, threshold, timeout}, clock);
        EXPECT_TRUE(registry.registerBreaker(breaker));
        return breaker;
    }

    static void trip(CircuitBreaker& breaker, uint32_t times) {
        for (uint32_t i = 0; i < times; ++i) {
            try {
                breaker.call([]() -> int { throw std::runtime_error("down"); });
            } catch (const std::runtime_error&) {
            }
        }
    }
};

// ============================================================================
// REGISTRATION
// ============================================================================

TEST_F(BreakerRegistryTest, EmptyRegistryIsHealthy) {
    auto health = registry.summarize();
    EXPECT_EQ(health.status, HealthStatus::HEALTHY);
    EXPECT_EQ(health.total(), 0u);
    EXPECT_TRUE(health.open_circuits.empty());
    EXPECT_TRUE(health.critical_circuits.empty());
}

TEST_F(BreakerRegistryTest, DuplicateNameRejected) {
    auto first = add("database", 3, 30s);
    auto second = std::make_shared<CircuitBreaker>(BreakerConfig{"database", 10, 5s}, clock);

    EXPECT_FALSE(registry.registerBreaker(second));
    EXPECT_FALSE(registry.registerBreaker(nullptr));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("database"), first);
    EXPECT_EQ(registry.find("database")->config().failure_threshold, 3u);
}

TEST_F(BreakerRegistryTest, FindUnknownReturnsNull) {
    add("database", 3, 30s);
    EXPECT_EQ(registry.find("cache"), nullptr);
}

TEST_F(BreakerRegistryTest, SnapshotAllCoversEveryBreaker) {
    add("database", 3, 30s);
    add("external_notifications", 5, 60s);

    auto snaps = registry.snapshotAll();
    ASSERT_EQ(snaps.size(), 2u);
    EXPECT_EQ(snaps.at("database").failure_threshold, 3u);
    EXPECT_EQ(snaps.at("external_notifications").recovery_timeout, 60s);
}

// ============================================================================
// OPEN / CRITICAL
// ============================================================================

TEST_F(BreakerRegistryTest, ListOpenReportsOnlyOpenBreakers) {
    auto db = add("database", 3, 30s);
    add("external_notifications", 5, 60s);

    trip(*db, 3);

    auto open = registry.listOpen();
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0], "database");
    EXPECT_TRUE(registry.listCritical().empty());
}

TEST_F(BreakerRegistryTest, CriticalOnlyAfterTwiceRecoveryTimeout) {
    auto db = add("database", 3, 30s);
    trip(*db, 3);

    clock->set_ms(T0 + 60'000);
    EXPECT_TRUE(registry.listCritical().empty());

    clock->set_ms(T0 + 60'001);
    auto critical = registry.listCritical();
    ASSERT_EQ(critical.size(), 1u);
    EXPECT_EQ(critical[0], "database");
}

TEST_F(BreakerRegistryTest, CriticalJudgedAtGivenTime) {
    auto db = add("database", 3, 30s);
    trip(*db, 3);

    // Registry clock has not moved
    EXPECT_TRUE(registry.listCritical().empty());
    EXPECT_EQ(registry.listCritical(T0 + 60'001), std::vector<std::string>{"database"});

    auto health = registry.summarize(T0 + MS_PER_HOUR);
    EXPECT_EQ(health.status, HealthStatus::CRITICAL);
    EXPECT_EQ(health.critical_circuits, std::vector<std::string>{"database"});
    EXPECT_EQ(registry.summarize(T0 + 1'000).status, HealthStatus::DEGRADED);
}

TEST_F(BreakerRegistryTest, SummaryStatusFollowsBreakers) {
    auto db = add("database", 3, 30s);
    add("external_notifications", 5, 60s);

    trip(*db, 3);
    auto degraded = registry.summarize();
    EXPECT_EQ(degraded.status, HealthStatus::DEGRADED);
    EXPECT_EQ(degraded.total(), 2u);
    EXPECT_EQ(degraded.open_circuits, std::vector<std::string>{"database"});
    EXPECT_EQ(degraded.states.at("database").state, BreakerState::OPEN);
    EXPECT_EQ(degraded.states.at("external_notifications").state, BreakerState::CLOSED);

    clock->advance(61s);
    auto critical = registry.summarize();
    EXPECT_EQ(critical.status, HealthStatus::CRITICAL);
    EXPECT_EQ(critical.critical_circuits, std::vector<std::string>{"database"});
}

TEST_F(BreakerRegistryTest, RecoveredBreakerLeavesOpenList) {
    auto db = add("database", 3, 30s);
    trip(*db, 3);
    ASSERT_EQ(registry.listOpen().size(), 1u);

    clock->advance(30s);
    db->call([]() { return 0; });

    EXPECT_TRUE(registry.listOpen().empty());
    EXPECT_EQ(registry.summarize().status, HealthStatus::HEALTHY);
}

TEST(BreakerRegistry, RequiresClock) {
    EXPECT_THROW(CircuitBreakerRegistry(nullptr), std::invalid_argument);
}
