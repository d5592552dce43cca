#pragma once

#include <cstdint>
#include <string>

#include <reliability/core/metrics/request_recorder.hpp>
#include <reliability/core/slo/slo_definition.hpp>

namespace Reliability {

/**
 * @class SLIEvaluator
 * @brief Turns recorded request outcomes into SLI percentages (0-100)
 *
 * Windows are [start_ms, end_ms] at hour granularity. With no traffic in the
 * window, availability, latency and error-rate all report 100.
 *
 * The latency SLI is threshold compliance (share of samples under 200 ms),
 * not a percentile. Use latencyPercentileMs() for the percentile value.
 */
class SLIEvaluator {
public:
    static constexpr double LATENCY_THRESHOLD_MS = 200.0;
    // Placeholder until staleness is instrumented
    static constexpr double FRESHNESS_SLI = 99.5;

    explicit SLIEvaluator(const RequestRecorder& recorder);

    double availability(uint64_t start_ms, uint64_t end_ms,
                        const std::string& scope = RequestRecorder::ALL_SCOPE) const;

    double latency(uint64_t start_ms, uint64_t end_ms,
                   const std::string& scope = RequestRecorder::ALL_SCOPE) const;

    double errorRate(uint64_t start_ms, uint64_t end_ms,
                     const std::string& scope = RequestRecorder::ALL_SCOPE) const;

    double freshness(uint64_t start_ms, uint64_t end_ms) const;

    double evaluate(SliKind kind, uint64_t start_ms, uint64_t end_ms,
                    const std::string& scope = RequestRecorder::ALL_SCOPE) const;

    /**
     * @brief Nearest-rank latency at percentile (0-100); 0 when no samples
     */
    double latencyPercentileMs(uint64_t start_ms, uint64_t end_ms, double percentile,
                               const std::string& scope = RequestRecorder::ALL_SCOPE) const;

private:
    const RequestRecorder& recorder_;
};

} // namespace Reliability
