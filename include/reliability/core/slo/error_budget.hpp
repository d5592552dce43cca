#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <reliability/core/slo/slo_definition.hpp>

namespace Reliability {

/**
 * @class ErrorBudget
 * @brief Allowed SLI shortfall for one SLO, in percentage points
 *
 * total = 100 - target. Every evaluation below target consumes
 * (target - sli). Consumption accumulates for the lifetime of the object
 * and never decreases.
 */
class ErrorBudget {
public:
    static constexpr double DEFAULT_CRITICAL_THRESHOLD = 0.5;

    explicit ErrorBudget(SLODefinition slo);

    /**
     * @return points consumed by this evaluation (0 when sli_value >= target)
     */
    double consume(double sli_value);

    double remaining() const;

    /**
     * @brief Days of budget left at daily_budget points per day; 0 if daily_budget <= 0
     */
    double remainingDays(double daily_budget) const;

    bool isCritical(double threshold = DEFAULT_CRITICAL_THRESHOLD) const;

    double total() const { return budget_total_; }
    double consumed() const { return budget_consumed_; }
    const SLODefinition& slo() const { return slo_; }

private:
    SLODefinition slo_;
    double budget_total_;
    double budget_consumed_ = 0.0;
};

/**
 * @struct BudgetUpdate
 * @brief Result of one consume() taken under the tracker lock
 */
struct BudgetUpdate {
    double consumed = 0.0;
    double remaining = 0.0;
    bool is_critical = false;
};

/**
 * @class ErrorBudgetTracker
 * @brief Owns one ErrorBudget per SLO key; thread-safe
 */
class ErrorBudgetTracker {
public:
    explicit ErrorBudgetTracker(const std::vector<SLODefinition>& slos,
                                double critical_threshold = ErrorBudget::DEFAULT_CRITICAL_THRESHOLD);

    ErrorBudgetTracker(const ErrorBudgetTracker&) = delete;
    ErrorBudgetTracker& operator=(const ErrorBudgetTracker&) = delete;

    /**
     * @return nullopt if key names no tracked SLO
     */
    std::optional<BudgetUpdate> consume(const std::string& key, double sli_value);

    std::optional<double> remaining(const std::string& key) const;
    std::optional<double> consumed(const std::string& key) const;
    bool isCritical(const std::string& key) const;

    double criticalThreshold() const { return critical_threshold_; }
    size_t size() const;

private:
    const double critical_threshold_;
    mutable std::mutex mtx_;
    std::map<std::string, ErrorBudget> budgets_;
};

} // namespace Reliability
