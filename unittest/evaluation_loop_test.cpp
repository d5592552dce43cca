// ============================================================================
// EVALUATION LOOP TEST SUITE
// ============================================================================
// Background evaluation thread: cycles, alert dispatch and shutdown
// ============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <reliability/core/admin/evaluation_loop.hpp>

using namespace Reliability;
using namespace std::chrono_literals;

namespace {

AppConfig::AppConfiguration loopConfig() {
    AppConfig::AppConfiguration config;
    config.app_name = "ReliabilityCoreTest";
    config.version = "0.0.1";
    config.slos = {SLODefinition{"availability", "Availability", "availability_sli",
                                 SliKind::AVAILABILITY, 99.0, 30}};
    return config;
}

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

TEST(EvaluationLoop, RejectsNonPositiveInterval) {
    ReliabilityContext ctx(loopConfig(), std::make_shared<ManualClock>(0),
                           std::make_shared<NullAlertHandler>());
    EXPECT_THROW(EvaluationLoop(ctx, 0ms), std::invalid_argument);
}

TEST(EvaluationLoop, RunsCyclesUntilStopped) {
    ReliabilityContext ctx(loopConfig(), std::make_shared<ManualClock>(1'700'000'000'000ULL),
                           std::make_shared<NullAlertHandler>());
    EvaluationLoop loop(ctx, 10ms);

    EXPECT_FALSE(loop.isRunning());
    EXPECT_FALSE(loop.lastReport().has_value());

    loop.start();
    loop.start();  // no second thread
    EXPECT_TRUE(loop.isRunning());
    ASSERT_TRUE(waitFor([&loop]() { return loop.cycles() >= 2; }));

    loop.stop();
    EXPECT_FALSE(loop.isRunning());

    auto last = loop.lastReport();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->overall_status, HealthStatus::HEALTHY);

    uint64_t cycles_at_stop = loop.cycles();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(loop.cycles(), cycles_at_stop);
}

TEST(EvaluationLoop, EachCycleDispatchesAlerts) {
    std::atomic<int> alerts{0};
    auto handler = std::make_shared<CallbackAlertHandler>(
        [&alerts](const Alert&) { alerts.fetch_add(1); });
    ReliabilityContext ctx(loopConfig(), std::make_shared<ManualClock>(1'700'000'000'000ULL), handler);
    ctx.recorder().record("/api/orders", 500, 20.0);

    EvaluationLoop loop(ctx, 10ms);
    loop.start();
    ASSERT_TRUE(waitFor([&alerts]() { return alerts.load() >= 4; }));
    loop.stop();

    auto last = loop.lastReport();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->overall_status, HealthStatus::CRITICAL);
}

TEST(EvaluationLoop, StopWakesSleepingThread) {
    ReliabilityContext ctx(loopConfig(), std::make_shared<ManualClock>(1'700'000'000'000ULL),
                           std::make_shared<NullAlertHandler>());
    EvaluationLoop loop(ctx, std::chrono::hours(1));
    loop.start();
    ASSERT_TRUE(waitFor([&loop]() { return loop.cycles() >= 1; }));

    auto begin = std::chrono::steady_clock::now();
    loop.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
}
