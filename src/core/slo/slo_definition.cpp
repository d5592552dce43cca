#include <reliability/core/slo/slo_definition.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace Reliability {

std::string SLODefinition::description() const {
    return fmt::format("{}: {:.1f}% over {} days", name, target, window_days);
}

std::optional<SliKind> parseSliName(const std::string& sli_name) {
    if (sli_name == "availability_sli" || sli_name == "availability") {
        return SliKind::AVAILABILITY;
    }
    if (sli_name == "latency_p95_sli" || sli_name == "latency_sli" || sli_name == "latency") {
        return SliKind::LATENCY;
    }
    if (sli_name == "error_rate_sli" || sli_name == "error_rate") {
        return SliKind::ERROR_RATE;
    }
    if (sli_name == "freshness_sli" || sli_name == "freshness") {
        return SliKind::FRESHNESS;
    }
    return std::nullopt;
}

const char* sliKindString(SliKind kind) {
    switch (kind) {
        case SliKind::AVAILABILITY: return "availability";
        case SliKind::LATENCY:      return "latency";
        case SliKind::ERROR_RATE:   return "error_rate";
        case SliKind::FRESHNESS:    return "freshness";
        default:                    return "unknown";
    }
}

std::vector<SLODefinition> defaultSloDefinitions() {
    return {
        {"availability", "Availability", "availability_sli", SliKind::AVAILABILITY, 99.9, 30},
        {"latency_p95", "Latency P95", "latency_p95_sli", SliKind::LATENCY, 95.0, 30},
        {"error_rate", "Error Rate", "error_rate_sli", SliKind::ERROR_RATE, 99.0, 30},
        {"freshness", "Data Freshness", "freshness_sli", SliKind::FRESHNESS, 99.5, 7},
    };
}

uint32_t longestWindowDays(const std::vector<SLODefinition>& slos) {
    uint32_t longest = 0;
    for (const auto& slo : slos) {
        longest = std::max(longest, slo.window_days);
    }
    return longest;
}

} // namespace Reliability
