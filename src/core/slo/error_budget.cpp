#include <reliability/core/slo/error_budget.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace Reliability {

ErrorBudget::ErrorBudget(SLODefinition slo)
    : slo_(std::move(slo)), budget_total_(100.0 - slo_.target) {}

double ErrorBudget::consume(double sli_value) {
    if (sli_value < slo_.target) {
        double delta = slo_.target - sli_value;
        budget_consumed_ += delta;
        return delta;
    }
    return 0.0;
}

double ErrorBudget::remaining() const {
    return std::max(0.0, budget_total_ - budget_consumed_);
}

double ErrorBudget::remainingDays(double daily_budget) const {
    if (daily_budget <= 0.0) {
        return 0.0;
    }
    return remaining() / daily_budget;
}

bool ErrorBudget::isCritical(double threshold) const {
    return remaining() < budget_total_ * threshold;
}

ErrorBudgetTracker::ErrorBudgetTracker(const std::vector<SLODefinition>& slos,
                                       double critical_threshold)
    : critical_threshold_(critical_threshold) {
    for (const auto& slo : slos) {
        auto [it, inserted] = budgets_.try_emplace(slo.key, slo);
        if (!inserted) {
            spdlog::warn("[ErrorBudget] Duplicate SLO key '{}', keeping first definition", slo.key);
            continue;
        }
        spdlog::debug("[ErrorBudget] Tracking '{}' (budget {:.3f} points)",
                      slo.key, it->second.total());
    }
}

std::optional<BudgetUpdate> ErrorBudgetTracker::consume(const std::string& key, double sli_value) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = budgets_.find(key);
    if (it == budgets_.end()) return std::nullopt;

    ErrorBudget& budget = it->second;
    BudgetUpdate update;
    update.consumed = budget.consume(sli_value);
    update.remaining = budget.remaining();
    update.is_critical = budget.isCritical(critical_threshold_);
    return update;
}

std::optional<double> ErrorBudgetTracker::remaining(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = budgets_.find(key);
    if (it == budgets_.end()) return std::nullopt;
    return it->second.remaining();
}

std::optional<double> ErrorBudgetTracker::consumed(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = budgets_.find(key);
    if (it == budgets_.end()) return std::nullopt;
    return it->second.consumed();
}

bool ErrorBudgetTracker::isCritical(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = budgets_.find(key);
    return it != budgets_.end() && it->second.isCritical(critical_threshold_);
}

size_t ErrorBudgetTracker::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return budgets_.size();
}

} // namespace Reliability
