#pragma once

#include <cstdint>

namespace Reliability {

/**
 * @brief Overall health verdict shared by breaker summaries and reports
 */
enum class HealthStatus : uint8_t {
    HEALTHY = 0,
    DEGRADED = 1,
    CRITICAL = 2
};

inline const char* healthStatusString(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY:  return "HEALTHY";
        case HealthStatus::DEGRADED: return "DEGRADED";
        case HealthStatus::CRITICAL: return "CRITICAL";
        default:                     return "UNKNOWN";
    }
}

// Breakers stuck open take precedence over merely open ones
inline HealthStatus classifyHealth(bool any_critical, bool any_degraded) {
    if (any_critical) return HealthStatus::CRITICAL;
    if (any_degraded) return HealthStatus::DEGRADED;
    return HealthStatus::HEALTHY;
}

} // namespace Reliability
