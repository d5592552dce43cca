#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <spdlog/spdlog.h>

#include <reliability/core/utils/clock.hpp>

namespace Reliability {

/**
 * Breaker state machine:
 *   CLOSED    -> normal operation, calls pass through
 *   OPEN      -> fail fast until the recovery timeout elapses
 *   HALF_OPEN -> exactly one trial call decides CLOSED or OPEN
 */
enum class BreakerState : uint8_t {
    CLOSED = 0,
    OPEN = 1,
    HALF_OPEN = 2
};

/**
 * @class CircuitOpenError
 * @brief Thrown when a call is rejected without invoking the guarded operation
 */
class CircuitOpenError : public std::runtime_error {
public:
    explicit CircuitOpenError(const std::string& breaker_name)
        : std::runtime_error("Circuit breaker '" + breaker_name + "' is OPEN"),
          breaker_name_(breaker_name) {}

    const std::string& breakerName() const noexcept { return breaker_name_; }

private:
    std::string breaker_name_;
};

struct BreakerConfig {
    std::string name = "default";
    uint32_t failure_threshold = 5;
    std::chrono::milliseconds recovery_timeout{std::chrono::seconds(60)};
};

/**
 * @struct BreakerSnapshot
 * @brief Read-only copy of a breaker's state for reporting
 */
struct BreakerSnapshot {
    std::string name;
    BreakerState state = BreakerState::CLOSED;
    uint32_t failure_count = 0;
    std::optional<uint64_t> last_failure_ms;
    uint32_t failure_threshold = 0;
    std::chrono::milliseconds recovery_timeout{0};
};

/**
 * @class CircuitBreaker
 * @brief Fault isolation for one risky operation (database call, remote service)
 *
 * The mutex covers the admission decision and the outcome bookkeeping only;
 * the guarded operation itself runs unlocked. While HALF_OPEN a single trial
 * is admitted; concurrent attempts are rejected until it completes.
 *
 * Any exception escaping the operation counts as a failure and is rethrown
 * unchanged.
 */
class CircuitBreaker {
public:
    CircuitBreaker(BreakerConfig config, ClockPtr clock);
    ~CircuitBreaker() = default;

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Run fn under breaker protection
     * @throws CircuitOpenError if rejected (fn not invoked)
     * @throws whatever fn throws, after recording the failure
     */
    template <typename Fn>
    auto call(Fn&& fn) -> std::invoke_result_t<Fn&>;

    /**
     * @brief Like call(), but returns fallback() when the breaker rejects
     *
     * Failures of fn itself still propagate.
     */
    template <typename Fn, typename Fallback>
    auto callWithFallback(Fn&& fn, Fallback&& fallback) -> std::invoke_result_t<Fn&>;

    BreakerSnapshot getState() const;
    BreakerState currentState() const;

    const std::string& name() const { return config_.name; }
    const BreakerConfig& config() const { return config_; }

    static const char* stateName(BreakerState state);

private:
    enum class Permit : uint8_t {
        NORMAL,
        TRIAL
    };

    Permit acquire();
    void onSuccess(Permit permit);
    void onFailure(Permit permit);
    bool recoveryElapsed(uint64_t now_ms) const;

    template <typename Fn>
    decltype(auto) invokeRecordingFailure(Fn& fn, Permit permit) {
        try {
            return fn();
        } catch (...) {
            onFailure(permit);
            throw;
        }
    }

    const BreakerConfig config_;
    ClockPtr clock_;

    mutable std::mutex mtx_;
    BreakerState state_{BreakerState::CLOSED};
    uint32_t failure_count_{0};
    std::optional<uint64_t> last_failure_ms_;
    bool trial_in_flight_{false};
};

template <typename Fn>
auto CircuitBreaker::call(Fn&& fn) -> std::invoke_result_t<Fn&> {
    using Result = std::invoke_result_t<Fn&>;

    const Permit permit = acquire();
    if constexpr (std::is_void_v<Result>) {
        invokeRecordingFailure(fn, permit);
        onSuccess(permit);
    } else {
        Result result = invokeRecordingFailure(fn, permit);
        onSuccess(permit);
        return result;
    }
}

template <typename Fn, typename Fallback>
auto CircuitBreaker::callWithFallback(Fn&& fn, Fallback&& fallback) -> std::invoke_result_t<Fn&> {
    try {
        return call(std::forward<Fn>(fn));
    } catch (const CircuitOpenError& e) {
        spdlog::warn("[CircuitBreaker] {} - serving fallback", e.what());
        return fallback();
    }
}

} // namespace Reliability
