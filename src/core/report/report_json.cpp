#include <reliability/core/report/report_json.hpp>
#include <cstdio>
#include <ctime>

using json = nlohmann::json;

namespace Reliability {

std::string formatIsoTimestamp(uint64_t ts_ms) {
    std::time_t secs = static_cast<std::time_t>(ts_ms / MS_PER_SECOND);
    unsigned millis = static_cast<unsigned>(ts_ms % MS_PER_SECOND);

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03uZ", date, millis);
    return out;
}

json toJson(const BreakerSnapshot& snap) {
    json j = {
        {"name", snap.name},
        {"state", CircuitBreaker::stateName(snap.state)},
        {"failure_count", snap.failure_count},
        {"threshold", snap.failure_threshold},
        {"timeout", snap.recovery_timeout.count() / 1000.0}
    };
    if (snap.last_failure_ms) {
        j["last_failure_time"] = *snap.last_failure_ms;
    } else {
        j["last_failure_time"] = nullptr;
    }
    return j;
}

json toJson(const BreakerHealth& health) {
    json states = json::object();
    for (const auto& [name, snap] : health.states) {
        states[name] = toJson(snap);
    }

    return {
        {"status", healthStatusString(health.status)},
        {"circuit_breakers", states},
        {"open_circuits", health.open_circuits},
        {"critical_circuits", health.critical_circuits},
        {"summary", {
            {"total", health.total()},
            {"open", health.open_circuits.size()},
            {"critical", health.critical_circuits.size()}
        }}
    };
}

json toJson(const SloResult& result) {
    return {
        {"slo_target", result.target},
        {"sli_value", result.sli_value},
        {"status", sloStatusString(result.status)},
        {"budget_consumed", result.budget_consumed},
        {"budget_remaining", result.budget_remaining},
        {"is_critical", result.is_critical}
    };
}

json toJson(const ReportPayload& payload) {
    json slos = json::object();
    for (const auto& result : payload.slos) {
        slos[result.key] = toJson(result);
    }

    return {
        {"timestamp", formatIsoTimestamp(payload.timestamp_ms)},
        {"window", std::to_string(payload.window_days) + " days"},
        {"slos", slos},
        {"alerts", payload.alerts},
        {"overall_status", healthStatusString(payload.overall_status)},
        {"recommendations", payload.recommendations},
        {"circuit_breakers", {
            {"total", payload.breakers.total},
            {"open", payload.breakers.open},
            {"critical", payload.breakers.critical}
        }}
    };
}

} // namespace Reliability
