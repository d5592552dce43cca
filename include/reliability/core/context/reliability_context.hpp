#pragma once

#include <memory>
#include <string>
#include <vector>

#include <reliability/core/breaker/breaker_registry.hpp>
#include <reliability/core/breaker/circuit_breaker.hpp>
#include <reliability/core/config/app_config.hpp>
#include <reliability/core/metrics/request_recorder.hpp>
#include <reliability/core/report/alert_handler.hpp>
#include <reliability/core/report/reliability_report.hpp>
#include <reliability/core/slo/error_budget.hpp>
#include <reliability/core/slo/sli_evaluator.hpp>
#include <reliability/core/utils/clock.hpp>

namespace Reliability {

/**
 * @class ReliabilityContext
 * @brief Owns every engine component for the lifetime of the process
 *
 * Built once at startup and passed by reference to whatever records requests,
 * guards calls or serves reports. Nothing in the engine is a process-wide
 * singleton, so tests build as many independent contexts as they need.
 *
 * Breakers listed in the configuration are created and registered here;
 * components may add more with createBreaker().
 */
class ReliabilityContext {
public:
    explicit ReliabilityContext(const AppConfig::AppConfiguration& config,
                                ClockPtr clock = std::make_shared<SystemClock>(),
                                AlertHandlerPtr alert_handler = std::make_shared<LoggingAlertHandler>());
    ~ReliabilityContext() = default;

    ReliabilityContext(const ReliabilityContext&) = delete;
    ReliabilityContext& operator=(const ReliabilityContext&) = delete;

    /**
     * @brief Create and register a breaker
     * @throws std::invalid_argument if the name is taken or the config is invalid
     */
    std::shared_ptr<CircuitBreaker> createBreaker(const BreakerConfig& config);

    /**
     * @return registered breaker, or nullptr
     */
    std::shared_ptr<CircuitBreaker> breaker(const std::string& name) const;

    /**
     * @brief Evaluate the report at the current clock time and dispatch its alerts
     */
    ReportPayload evaluate();

    Clock& clock() { return *clock_; }
    RequestRecorder& recorder() { return recorder_; }
    CircuitBreakerRegistry& breakers() { return registry_; }
    const SLIEvaluator& sli() const { return evaluator_; }
    ErrorBudgetTracker& budgets() { return budgets_; }
    ReliabilityReport& report() { return report_; }
    AlertHandler& alerts() { return *alert_handler_; }

private:
    static std::chrono::hours retentionFor(const AppConfig::AppConfiguration& config);

    ClockPtr clock_;
    AlertHandlerPtr alert_handler_;
    RequestRecorder recorder_;
    CircuitBreakerRegistry registry_;
    SLIEvaluator evaluator_;
    ErrorBudgetTracker budgets_;
    ReliabilityReport report_;
};

} // namespace Reliability
