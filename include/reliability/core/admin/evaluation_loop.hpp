#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <spdlog/spdlog.h>

#include <reliability/core/context/reliability_context.hpp>
#include <reliability/core/report/reliability_report.hpp>

namespace Reliability {

/**
 * @class EvaluationLoop
 * @brief Background thread that evaluates the report on a fixed interval
 *
 * Each cycle evaluates the context (which dispatches alerts) and logs a
 * health summary. stop() wakes the thread immediately.
 */
class EvaluationLoop {
public:
    EvaluationLoop(ReliabilityContext& context, std::chrono::milliseconds interval);
    ~EvaluationLoop() noexcept;

    EvaluationLoop(const EvaluationLoop&) = delete;
    EvaluationLoop& operator=(const EvaluationLoop&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    uint64_t cycles() const { return cycles_.load(std::memory_order_acquire); }

    /**
     * @brief Most recent report, if any cycle has completed
     */
    std::optional<ReportPayload> lastReport() const;

private:
    void loop();
    void runCycle();
    void reportHealth(const ReportPayload& payload);

    ReliabilityContext& context_;
    const std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};
    std::thread worker_thread_;

    mutable std::mutex report_mutex_;
    std::optional<ReportPayload> last_report_;

    // For interruptible sleep during shutdown
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;

    // Consecutive non-HEALTHY cycles, for escalation
    int consecutive_unhealthy_ = 0;
};

} // namespace Reliability
