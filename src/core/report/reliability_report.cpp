#include <reliability/core/report/reliability_report.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace Reliability {

const SloResult* ReportPayload::find(const std::string& key) const {
    auto it = std::find_if(slos.begin(), slos.end(),
                           [&key](const SloResult& r) { return r.key == key; });
    return it == slos.end() ? nullptr : &*it;
}

ReliabilityReport::ReliabilityReport(std::vector<SLODefinition> slos,
                                     const SLIEvaluator& evaluator,
                                     ErrorBudgetTracker& budgets,
                                     const CircuitBreakerRegistry& registry)
    : slos_(std::move(slos)),
      evaluator_(evaluator),
      budgets_(budgets),
      registry_(registry) {
    spdlog::info("[Report] Initialized with {} SLOs", slos_.size());
    for (const auto& slo : slos_) {
        spdlog::debug("[Report]   {} ({}) -> {}", slo.key, sliKindString(slo.kind),
                      slo.description());
    }
}

SloResult ReliabilityReport::evaluateSlo(const SLODefinition& slo, uint64_t now_ms) {
    const uint64_t window_ms = static_cast<uint64_t>(slo.window_days) * MS_PER_DAY;
    const uint64_t start_ms = now_ms > window_ms ? now_ms - window_ms : 0;

    SloResult result;
    result.key = slo.key;
    result.kind = slo.kind;
    result.target = slo.target;
    result.sli_value = evaluator_.evaluate(slo.kind, start_ms, now_ms);
    result.status = result.sli_value >= slo.target ? SloStatus::PASS : SloStatus::FAIL;

    if (auto update = budgets_.consume(slo.key, result.sli_value)) {
        result.budget_consumed = update->consumed;
        result.budget_remaining = update->remaining;
        result.is_critical = update->is_critical;
    } else {
        spdlog::warn("[Report] No error budget tracked for SLO '{}'", slo.key);
    }
    return result;
}

ReportPayload ReliabilityReport::evaluate(uint64_t now_ms) {
    ReportPayload payload;
    payload.timestamp_ms = now_ms;
    payload.window_days = longestWindowDays(slos_);

    bool any_fail = false;
    bool any_budget_critical = false;

    for (const auto& slo : slos_) {
        SloResult result = evaluateSlo(slo, now_ms);

        if (result.status == SloStatus::FAIL) {
            any_fail = true;
            std::string msg = fmt::format("SLO VIOLATION: {} - {:.2f}% < {:.2f}%",
                                          result.key, result.sli_value, result.target);
            payload.alerts.push_back(msg);
            payload.alert_events.push_back({AlertLevel::WARNING, std::move(msg), result.key, now_ms});
            payload.recommendations.emplace_back(recommendationFor(result.kind));
        }
        if (result.is_critical) {
            any_budget_critical = true;
            std::string msg = fmt::format("ERROR BUDGET CRITICAL: {} - {:.2f}% remaining",
                                          result.key, result.budget_remaining);
            payload.alerts.push_back(msg);
            payload.alert_events.push_back({AlertLevel::CRITICAL, std::move(msg), result.key, now_ms});
        }

        payload.slos.push_back(std::move(result));
    }

    BreakerHealth breakers = registry_.summarize(now_ms);
    payload.breakers.total = breakers.total();
    payload.breakers.open = breakers.open_circuits.size();
    payload.breakers.critical = breakers.critical_circuits.size();

    payload.overall_status = classifyHealth(
        payload.breakers.critical > 0 || any_budget_critical,
        payload.breakers.open > 0 || any_fail);

    if (payload.overall_status != HealthStatus::HEALTHY) {
        spdlog::warn("[Report] Overall status {} ({} alerts, {} open breakers)",
                     healthStatusString(payload.overall_status),
                     payload.alerts.size(), payload.breakers.open);
    } else {
        spdlog::debug("[Report] Overall status HEALTHY");
    }
    return payload;
}

const char* ReliabilityReport::recommendationFor(SliKind kind) {
    switch (kind) {
        case SliKind::AVAILABILITY:
            return "Investigate infrastructure issues and implement redundancy";
        case SliKind::LATENCY:
            return "Optimize database queries and implement caching";
        case SliKind::ERROR_RATE:
            return "Review error logs and implement better error handling";
        case SliKind::FRESHNESS:
        default:
            return "Check database replication lag and query performance";
    }
}

} // namespace Reliability
