#include <reliability/core/metrics/request_recorder.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <iterator>

namespace Reliability {

RequestRecorder::RequestRecorder(ClockPtr clock, std::chrono::hours retention)
    : clock_(std::move(clock)), retention_(retention) {
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for RequestRecorder");
    }
    if (retention_.count() > 0) {
        spdlog::info("[RequestRecorder] Initialized (retention: {}h)", retention_.count());
    } else {
        spdlog::info("[RequestRecorder] Initialized (retention: unbounded)");
    }
}

void RequestRecorder::record(const std::string& endpoint, int status_code, double latency_ms) {
    record(endpoint, status_code, latency_ms, clock_->now_ms());
}

void RequestRecorder::record(const std::string& endpoint, int status_code, double latency_ms,
                             uint64_t timestamp_ms) {
    const uint64_t hour = hourOf(timestamp_ms);
    const bool success = isSuccess(status_code);

    std::lock_guard<std::mutex> lock(mtx_);

    bool opened = addSample(buckets_[endpoint], hour, success, latency_ms);
    // An endpoint literally named "all" is already the aggregate scope
    if (endpoint != ALL_SCOPE) {
        opened = addSample(buckets_[ALL_SCOPE], hour, success, latency_ms) || opened;
    }

    // Cutoff is relative to the clock, never to the newest sample
    if (opened && retention_.count() > 0) {
        const uint64_t keep_hours = static_cast<uint64_t>(retention_.count());
        const uint64_t now_hour = hourOf(clock_->now_ms());
        if (now_hour > keep_hours) {
            evictHoursBefore(now_hour - keep_hours);
        }
    }
}

bool RequestRecorder::addSample(HourMap& hours, uint64_t hour, bool success, double latency_ms) {
    auto [it, inserted] = hours.try_emplace(hour);
    MetricBucket& bucket = it->second;

    bucket.total_requests++;
    if (success) {
        bucket.successful_requests++;
    } else {
        bucket.error_count++;
    }
    bucket.latency_samples_ms.push_back(latency_ms);
    return inserted;
}

MetricBucket RequestRecorder::aggregate(const std::string& scope, uint64_t start_ms,
                                        uint64_t end_ms) const {
    MetricBucket result;
    if (end_ms < start_ms) return result;

    std::lock_guard<std::mutex> lock(mtx_);
    auto scope_it = buckets_.find(scope);
    if (scope_it == buckets_.end()) return result;

    const HourMap& hours = scope_it->second;
    auto first = hours.lower_bound(hourOf(start_ms));
    auto last = hours.upper_bound(hourOf(end_ms));
    for (auto it = first; it != last; ++it) {
        const MetricBucket& bucket = it->second;
        result.total_requests += bucket.total_requests;
        result.successful_requests += bucket.successful_requests;
        result.error_count += bucket.error_count;
        result.latency_samples_ms.insert(result.latency_samples_ms.end(),
                                         bucket.latency_samples_ms.begin(),
                                         bucket.latency_samples_ms.end());
    }
    return result;
}

size_t RequestRecorder::evictBefore(uint64_t cutoff_ms) {
    std::lock_guard<std::mutex> lock(mtx_);
    return evictHoursBefore(hourOf(cutoff_ms));
}

size_t RequestRecorder::evictHoursBefore(uint64_t hour) {
    size_t removed = 0;
    for (auto it = buckets_.begin(); it != buckets_.end(); ) {
        HourMap& hours = it->second;
        auto keep_from = hours.lower_bound(hour);
        removed += static_cast<size_t>(std::distance(hours.begin(), keep_from));
        hours.erase(hours.begin(), keep_from);

        if (hours.empty()) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("[RequestRecorder] Evicted {} buckets older than hour {}", removed, hour);
    }
    return removed;
}

size_t RequestRecorder::bucketCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t count = 0;
    for (const auto& [scope, hours] : buckets_) {
        count += hours.size();
    }
    return count;
}

std::vector<std::string> RequestRecorder::scopes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> names;
    names.reserve(buckets_.size());
    for (const auto& [scope, hours] : buckets_) {
        names.push_back(scope);
    }
    return names;
}

} // namespace Reliability
