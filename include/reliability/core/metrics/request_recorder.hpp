#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <reliability/core/utils/clock.hpp>

namespace Reliability {

/**
 * @struct MetricBucket
 * @brief Request outcomes for one (scope, hour), also used for window aggregates
 *
 * total_requests == successful_requests + error_count always holds.
 */
struct MetricBucket {
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t error_count = 0;
    std::vector<double> latency_samples_ms;  // append-only, arrival order
};

/**
 * @class RequestRecorder
 * @brief Folds request outcomes into per-hour buckets
 *
 * Every record() updates two buckets: the endpoint's own scope and the
 * aggregate "all" scope. Status codes in [200, 400) count as success.
 *
 * Retention: with a non-zero retention window, buckets older than the window
 * (relative to the clock's current hour) are dropped whenever a new hour bucket
 * is opened. A zero retention keeps everything.
 */
class RequestRecorder {
public:
    static constexpr const char* ALL_SCOPE = "all";

    explicit RequestRecorder(ClockPtr clock,
                             std::chrono::hours retention = std::chrono::hours(0));
    ~RequestRecorder() = default;

    RequestRecorder(const RequestRecorder&) = delete;
    RequestRecorder& operator=(const RequestRecorder&) = delete;

    void record(const std::string& endpoint, int status_code, double latency_ms);
    void record(const std::string& endpoint, int status_code, double latency_ms,
                uint64_t timestamp_ms);

    /**
     * @brief Sum every hour bucket of scope from hourOf(start) to hourOf(end) inclusive
     * @return zeroed bucket if nothing falls in range
     */
    MetricBucket aggregate(const std::string& scope, uint64_t start_ms, uint64_t end_ms) const;

    /**
     * @brief Drop all buckets whose hour starts before cutoff's hour
     * @return number of buckets removed
     */
    size_t evictBefore(uint64_t cutoff_ms);

    size_t bucketCount() const;
    std::vector<std::string> scopes() const;
    std::chrono::hours retention() const { return retention_; }

    static bool isSuccess(int status_code) {
        return status_code >= 200 && status_code < 400;
    }

private:
    using HourMap = std::map<uint64_t, MetricBucket>;

    // Requires mtx_ held
    bool addSample(HourMap& hours, uint64_t hour, bool success, double latency_ms);
    size_t evictHoursBefore(uint64_t hour);

    ClockPtr clock_;
    const std::chrono::hours retention_;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, HourMap> buckets_;
};

} // namespace Reliability
