#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Reliability {

enum class SliKind : uint8_t {
    AVAILABILITY = 0,
    LATENCY = 1,
    ERROR_RATE = 2,
    FRESHNESS = 3
};

/**
 * @struct SLODefinition
 * @brief Target percentage for one SLI over a window of days
 *
 * key identifies the SLO in reports and budget lookups ("availability").
 * Immutable once the context is built.
 */
struct SLODefinition {
    std::string key;
    std::string name;
    std::string sli_name;
    SliKind kind = SliKind::AVAILABILITY;
    double target = 99.9;
    uint32_t window_days = 30;

    std::string description() const;
};

/**
 * @brief Map a configured SLI name ("availability_sli", "latency_p95_sli", ...) to its kind
 */
std::optional<SliKind> parseSliName(const std::string& sli_name);

const char* sliKindString(SliKind kind);

/**
 * @brief Availability 99.9/30d, latency_p95 95.0/30d, error_rate 99.0/30d, freshness 99.5/7d
 */
std::vector<SLODefinition> defaultSloDefinitions();

uint32_t longestWindowDays(const std::vector<SLODefinition>& slos);

} // namespace Reliability
