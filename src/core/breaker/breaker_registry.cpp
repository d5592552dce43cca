#include <reliability/core/breaker/breaker_registry.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace Reliability {

CircuitBreakerRegistry::CircuitBreakerRegistry(ClockPtr clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for CircuitBreakerRegistry");
    }
}

bool CircuitBreakerRegistry::registerBreaker(std::shared_ptr<CircuitBreaker> breaker) {
    if (!breaker) return false;

    std::lock_guard<std::mutex> lock(mtx_);
    const std::string name = breaker->name();
    auto [it, inserted] = breakers_.try_emplace(name, std::move(breaker));
    if (!inserted) {
        spdlog::warn("[BreakerRegistry] Breaker '{}' already registered, ignoring duplicate", name);
        return false;
    }
    spdlog::debug("[BreakerRegistry] Registered breaker '{}' ({} total)", name, breakers_.size());
    return true;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = breakers_.find(name);
    if (it == breakers_.end()) return nullptr;
    return it->second;
}

std::map<std::string, BreakerSnapshot> CircuitBreakerRegistry::snapshotAll() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::map<std::string, BreakerSnapshot> snaps;
    for (const auto& [name, breaker] : breakers_) {
        snaps.emplace(name, breaker->getState());
    }
    return snaps;
}

std::vector<std::string> CircuitBreakerRegistry::listOpen() const {
    std::vector<std::string> open;
    for (const auto& [name, snap] : snapshotAll()) {
        if (snap.state == BreakerState::OPEN) {
            open.push_back(name);
        }
    }
    return open;
}

std::vector<std::string> CircuitBreakerRegistry::listCritical() const {
    return listCritical(clock_->now_ms());
}

std::vector<std::string> CircuitBreakerRegistry::listCritical(uint64_t now_ms) const {
    std::vector<std::string> critical;
    for (const auto& [name, snap] : snapshotAll()) {
        if (isStuckOpen(snap, now_ms)) {
            critical.push_back(name);
        }
    }
    return critical;
}

BreakerHealth CircuitBreakerRegistry::summarize() const {
    return summarize(clock_->now_ms());
}

BreakerHealth CircuitBreakerRegistry::summarize(uint64_t now_ms) const {
    BreakerHealth health;
    health.states = snapshotAll();
    for (const auto& [name, snap] : health.states) {
        if (snap.state == BreakerState::OPEN) {
            health.open_circuits.push_back(name);
        }
        if (isStuckOpen(snap, now_ms)) {
            health.critical_circuits.push_back(name);
        }
    }
    health.status = classifyHealth(!health.critical_circuits.empty(),
                                   !health.open_circuits.empty());
    return health;
}

size_t CircuitBreakerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return breakers_.size();
}

bool CircuitBreakerRegistry::isStuckOpen(const BreakerSnapshot& snap, uint64_t now_ms) const {
    if (snap.state != BreakerState::OPEN || !snap.last_failure_ms) {
        return false;
    }
    if (now_ms <= *snap.last_failure_ms) {
        return false;
    }
    const uint64_t open_for = now_ms - *snap.last_failure_ms;
    return open_for > 2 * static_cast<uint64_t>(snap.recovery_timeout.count());
}

} // namespace Reliability
