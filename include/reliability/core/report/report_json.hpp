#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include <reliability/core/breaker/breaker_registry.hpp>
#include <reliability/core/breaker/circuit_breaker.hpp>
#include <reliability/core/report/reliability_report.hpp>

namespace Reliability {

// Wire format consumed by status/dashboard endpoints. Field names are a
// contract with those consumers.

// "2026-10-19T12:00:00.000Z"
std::string formatIsoTimestamp(uint64_t ts_ms);

nlohmann::json toJson(const BreakerSnapshot& snap);
nlohmann::json toJson(const BreakerHealth& health);
nlohmann::json toJson(const SloResult& result);
nlohmann::json toJson(const ReportPayload& payload);

} // namespace Reliability
