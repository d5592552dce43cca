#include <reliability/core/breaker/circuit_breaker.hpp>

namespace Reliability {

CircuitBreaker::CircuitBreaker(BreakerConfig config, ClockPtr clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for CircuitBreaker");
    }
    if (config_.failure_threshold == 0) {
        throw std::invalid_argument("Circuit breaker '" + config_.name +
                                    "': failure_threshold must be > 0");
    }
    if (config_.recovery_timeout.count() <= 0) {
        throw std::invalid_argument("Circuit breaker '" + config_.name +
                                    "': recovery_timeout must be > 0");
    }
    spdlog::info("[CircuitBreaker] '{}' initialized with threshold={}, timeout={}ms",
                 config_.name, config_.failure_threshold, config_.recovery_timeout.count());
}

CircuitBreaker::Permit CircuitBreaker::acquire() {
    std::lock_guard<std::mutex> lock(mtx_);

    switch (state_) {
        case BreakerState::CLOSED:
            return Permit::NORMAL;

        case BreakerState::OPEN:
            if (!recoveryElapsed(clock_->now_ms())) {
                spdlog::debug("[CircuitBreaker] '{}' rejected call (OPEN)", config_.name);
                throw CircuitOpenError(config_.name);
            }
            state_ = BreakerState::HALF_OPEN;
            trial_in_flight_ = true;
            spdlog::info("[CircuitBreaker] '{}' moved to HALF_OPEN state", config_.name);
            return Permit::TRIAL;

        case BreakerState::HALF_OPEN:
        default:
            if (trial_in_flight_) {
                spdlog::debug("[CircuitBreaker] '{}' rejected call (trial in flight)", config_.name);
                throw CircuitOpenError(config_.name);
            }
            trial_in_flight_ = true;
            return Permit::TRIAL;
    }
}

void CircuitBreaker::onSuccess(Permit permit) {
    std::lock_guard<std::mutex> lock(mtx_);

    if (permit == Permit::TRIAL) {
        trial_in_flight_ = false;
        if (state_ == BreakerState::HALF_OPEN) {
            state_ = BreakerState::CLOSED;
            failure_count_ = 0;
            spdlog::info("[CircuitBreaker] '{}' reset to CLOSED state", config_.name);
        }
        return;
    }

    // Calls admitted before the circuit opened do not decide recovery
    if (state_ == BreakerState::CLOSED) {
        failure_count_ = 0;
    }
}

void CircuitBreaker::onFailure(Permit permit) {
    std::lock_guard<std::mutex> lock(mtx_);

    ++failure_count_;
    last_failure_ms_ = clock_->now_ms();

    if (permit == Permit::TRIAL) {
        trial_in_flight_ = false;
        state_ = BreakerState::OPEN;
        spdlog::warn("[CircuitBreaker] '{}' trial call failed, re-opened", config_.name);
        return;
    }

    if (state_ == BreakerState::CLOSED && failure_count_ >= config_.failure_threshold) {
        state_ = BreakerState::OPEN;
        spdlog::warn("[CircuitBreaker] '{}' opened after {} failures",
                     config_.name, failure_count_);
    } else {
        spdlog::debug("[CircuitBreaker] '{}' failure {}/{}",
                      config_.name, failure_count_, config_.failure_threshold);
    }
}

bool CircuitBreaker::recoveryElapsed(uint64_t now_ms) const {
    if (!last_failure_ms_) {
        return true;
    }
    if (now_ms < *last_failure_ms_) {
        return false;
    }
    return now_ms - *last_failure_ms_ >= static_cast<uint64_t>(config_.recovery_timeout.count());
}

BreakerSnapshot CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(mtx_);

    BreakerSnapshot snap;
    snap.name = config_.name;
    snap.state = state_;
    snap.failure_count = failure_count_;
    snap.last_failure_ms = last_failure_ms_;
    snap.failure_threshold = config_.failure_threshold;
    snap.recovery_timeout = config_.recovery_timeout;
    return snap;
}

BreakerState CircuitBreaker::currentState() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

const char* CircuitBreaker::stateName(BreakerState state) {
    switch (state) {
        case BreakerState::CLOSED:    return "closed";
        case BreakerState::OPEN:      return "open";
        case BreakerState::HALF_OPEN: return "half_open";
        default:                      return "unknown";
    }
}

} // namespace Reliability
