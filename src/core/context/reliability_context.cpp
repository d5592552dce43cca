#include <reliability/core/context/reliability_context.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace Reliability {

ReliabilityContext::ReliabilityContext(const AppConfig::AppConfiguration& config,
                                       ClockPtr clock,
                                       AlertHandlerPtr alert_handler)
    : clock_(std::move(clock)),
      alert_handler_(alert_handler ? std::move(alert_handler)
                                   : std::make_shared<NullAlertHandler>()),
      recorder_(clock_, retentionFor(config)),
      registry_(clock_),
      evaluator_(recorder_),
      budgets_(config.slos, config.evaluation.budget_critical_threshold),
      report_(config.slos, evaluator_, budgets_, registry_) {
    for (const auto& breaker_config : config.breakers) {
        createBreaker(breaker_config);
    }
    spdlog::info("[Context] {} {} ready: {} breakers, {} SLOs, alerts -> {}",
                 config.app_name, config.version, registry_.size(),
                 config.slos.size(), alert_handler_->name());
}

std::chrono::hours ReliabilityContext::retentionFor(const AppConfig::AppConfiguration& config) {
    uint32_t days = config.recorder.retention_days > 0
        ? config.recorder.retention_days
        : longestWindowDays(config.slos);
    return std::chrono::hours(static_cast<int64_t>(days) * 24);
}

std::shared_ptr<CircuitBreaker> ReliabilityContext::createBreaker(const BreakerConfig& config) {
    auto breaker = std::make_shared<CircuitBreaker>(config, clock_);
    if (!registry_.registerBreaker(breaker)) {
        throw std::invalid_argument("Circuit breaker already registered: " + config.name);
    }
    return breaker;
}

std::shared_ptr<CircuitBreaker> ReliabilityContext::breaker(const std::string& name) const {
    return registry_.find(name);
}

ReportPayload ReliabilityContext::evaluate() {
    ReportPayload payload = report_.evaluate(clock_->now_ms());
    for (const auto& alert : payload.alert_events) {
        alert_handler_->onAlert(alert);
    }
    return payload;
}

} // namespace Reliability
