#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <reliability/core/breaker/breaker_registry.hpp>
#include <reliability/core/health/health_status.hpp>
#include <reliability/core/report/alert_handler.hpp>
#include <reliability/core/slo/error_budget.hpp>
#include <reliability/core/slo/sli_evaluator.hpp>
#include <reliability/core/slo/slo_definition.hpp>

namespace Reliability {

enum class SloStatus : uint8_t {
    PASS = 0,
    FAIL = 1
};

inline const char* sloStatusString(SloStatus status) {
    return status == SloStatus::PASS ? "PASS" : "FAIL";
}

struct SloResult {
    std::string key;
    SliKind kind = SliKind::AVAILABILITY;
    double target = 0.0;
    double sli_value = 0.0;
    SloStatus status = SloStatus::PASS;
    double budget_consumed = 0.0;   // consumed by this evaluation only
    double budget_remaining = 0.0;
    bool is_critical = false;
};

struct BreakerCounts {
    size_t total = 0;
    size_t open = 0;
    size_t critical = 0;
};

/**
 * @struct ReportPayload
 * @brief Output of one evaluation; serialized by toJson() for status endpoints
 */
struct ReportPayload {
    uint64_t timestamp_ms = 0;
    uint32_t window_days = 0;                   // longest SLO window
    std::vector<SloResult> slos;                // configuration order
    std::vector<std::string> alerts;
    std::vector<Alert> alert_events;            // same alerts, structured
    HealthStatus overall_status = HealthStatus::HEALTHY;
    std::vector<std::string> recommendations;
    BreakerCounts breakers;

    const SloResult* find(const std::string& key) const;
};

/**
 * @class ReliabilityReport
 * @brief Evaluates every SLO, charges error budgets and folds in breaker health
 *
 * Overall status:
 *   CRITICAL  - a breaker is stuck open, or an SLO's budget is critical
 *   DEGRADED  - a breaker is open, or an SLO fails
 *   HEALTHY   - otherwise
 *
 * Each evaluate() call charges the budgets again; consumption accumulates.
 */
class ReliabilityReport {
public:
    ReliabilityReport(std::vector<SLODefinition> slos,
                      const SLIEvaluator& evaluator,
                      ErrorBudgetTracker& budgets,
                      const CircuitBreakerRegistry& registry);

    ReportPayload evaluate(uint64_t now_ms);

    const std::vector<SLODefinition>& slos() const { return slos_; }

    static const char* recommendationFor(SliKind kind);

private:
    SloResult evaluateSlo(const SLODefinition& slo, uint64_t now_ms);

    const std::vector<SLODefinition> slos_;
    const SLIEvaluator& evaluator_;
    ErrorBudgetTracker& budgets_;
    const CircuitBreakerRegistry& registry_;
};

} // namespace Reliability
