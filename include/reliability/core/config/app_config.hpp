#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <reliability/core/breaker/circuit_breaker.hpp>
#include <reliability/core/slo/slo_definition.hpp>

namespace Reliability {
namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
};

struct RecorderConfig {
    // 0 = keep as long as the longest SLO window
    uint32_t retention_days = 0;
};

struct EvaluationConfig {
    uint32_t interval_seconds = 60;
    double budget_critical_threshold = 0.5;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    RecorderConfig recorder;
    EvaluationConfig evaluation;
    std::vector<BreakerConfig> breakers;
    std::vector<SLODefinition> slos = defaultSloDefinitions();
};

} // namespace AppConfig
} // namespace Reliability
