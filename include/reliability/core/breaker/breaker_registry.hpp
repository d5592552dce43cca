#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <reliability/core/breaker/circuit_breaker.hpp>
#include <reliability/core/health/health_status.hpp>
#include <reliability/core/utils/clock.hpp>

namespace Reliability {

/**
 * @struct BreakerHealth
 * @brief Aggregate breaker status served by the breaker-status endpoint
 */
struct BreakerHealth {
    HealthStatus status = HealthStatus::HEALTHY;
    std::map<std::string, BreakerSnapshot> states;
    std::vector<std::string> open_circuits;
    std::vector<std::string> critical_circuits;

    size_t total() const { return states.size(); }
};

/**
 * @class CircuitBreakerRegistry
 * @brief Read-side view over every live breaker
 *
 * Breakers are owned by the components that guard calls; the registry keeps
 * shared references for reporting and never mutates breaker state.
 * A breaker is "critical" when it has been OPEN for longer than twice its
 * recovery timeout since the last failure.
 */
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(ClockPtr clock);
    ~CircuitBreakerRegistry() = default;

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    /**
     * @return false if a breaker with the same name is already registered
     */
    bool registerBreaker(std::shared_ptr<CircuitBreaker> breaker);

    std::shared_ptr<CircuitBreaker> find(const std::string& name) const;

    std::map<std::string, BreakerSnapshot> snapshotAll() const;
    std::vector<std::string> listOpen() const;
    std::vector<std::string> listCritical() const;
    BreakerHealth summarize() const;

    // Same as above, judged at now_ms instead of the registry clock
    std::vector<std::string> listCritical(uint64_t now_ms) const;
    BreakerHealth summarize(uint64_t now_ms) const;

    size_t size() const;

private:
    bool isStuckOpen(const BreakerSnapshot& snap, uint64_t now_ms) const;

    ClockPtr clock_;
    mutable std::mutex mtx_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace Reliability
