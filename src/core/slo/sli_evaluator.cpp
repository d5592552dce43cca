#include <reliability/core/slo/sli_evaluator.hpp>
#include <algorithm>

namespace Reliability {

SLIEvaluator::SLIEvaluator(const RequestRecorder& recorder)
    : recorder_(recorder) {}

double SLIEvaluator::availability(uint64_t start_ms, uint64_t end_ms,
                                  const std::string& scope) const {
    MetricBucket agg = recorder_.aggregate(scope, start_ms, end_ms);
    if (agg.total_requests == 0) {
        return 100.0;
    }
    return (static_cast<double>(agg.successful_requests) / agg.total_requests) * 100.0;
}

double SLIEvaluator::latency(uint64_t start_ms, uint64_t end_ms,
                             const std::string& scope) const {
    MetricBucket agg = recorder_.aggregate(scope, start_ms, end_ms);
    const auto& samples = agg.latency_samples_ms;
    if (samples.empty()) {
        return 100.0;
    }
    auto under = std::count_if(samples.begin(), samples.end(),
                               [](double ms) { return ms < LATENCY_THRESHOLD_MS; });
    return (static_cast<double>(under) / samples.size()) * 100.0;
}

double SLIEvaluator::errorRate(uint64_t start_ms, uint64_t end_ms,
                               const std::string& scope) const {
    MetricBucket agg = recorder_.aggregate(scope, start_ms, end_ms);
    if (agg.total_requests == 0) {
        return 100.0;
    }
    return (static_cast<double>(agg.total_requests - agg.error_count) / agg.total_requests) * 100.0;
}

double SLIEvaluator::freshness(uint64_t /*start_ms*/, uint64_t /*end_ms*/) const {
    return FRESHNESS_SLI;
}

double SLIEvaluator::evaluate(SliKind kind, uint64_t start_ms, uint64_t end_ms,
                              const std::string& scope) const {
    switch (kind) {
        case SliKind::AVAILABILITY: return availability(start_ms, end_ms, scope);
        case SliKind::LATENCY:      return latency(start_ms, end_ms, scope);
        case SliKind::ERROR_RATE:   return errorRate(start_ms, end_ms, scope);
        case SliKind::FRESHNESS:
        default:                    return freshness(start_ms, end_ms);
    }
}

double SLIEvaluator::latencyPercentileMs(uint64_t start_ms, uint64_t end_ms, double percentile,
                                         const std::string& scope) const {
    MetricBucket agg = recorder_.aggregate(scope, start_ms, end_ms);
    auto& samples = agg.latency_samples_ms;
    if (samples.empty()) {
        return 0.0;
    }

    double clamped = std::clamp(percentile, 0.0, 100.0);
    size_t idx = static_cast<size_t>(clamped * samples.size() / 100.0);
    if (idx >= samples.size()) idx = samples.size() - 1;

    std::nth_element(samples.begin(), samples.begin() + idx, samples.end());
    return samples[idx];
}

} // namespace Reliability
