#include <reliability/core/admin/evaluation_loop.hpp>
#include <stdexcept>

using namespace Reliability;

EvaluationLoop::EvaluationLoop(ReliabilityContext& context, std::chrono::milliseconds interval)
    : context_(context), interval_(interval) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("EvaluationLoop interval must be > 0");
    }
    spdlog::info("[EvaluationLoop] Initialized (interval: {}ms)", interval_.count());
}

EvaluationLoop::~EvaluationLoop() noexcept {
    stop();
}

void EvaluationLoop::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        spdlog::debug("[EvaluationLoop] Already running");
        return;
    }
    worker_thread_ = std::thread(&EvaluationLoop::loop, this);
    spdlog::info("[EvaluationLoop] Started");
}

void EvaluationLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();  // Wake up sleeping thread immediately
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::info("[EvaluationLoop] Stopped after {} cycles", cycles());
    }
}

std::optional<ReportPayload> EvaluationLoop::lastReport() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}

void EvaluationLoop::loop() {
    while (running_.load(std::memory_order_acquire)) {
        runCycle();

        // Interruptible sleep: wait for the interval OR until stop() is called
        std::unique_lock<std::mutex> lock(sleep_mutex_);
        sleep_cv_.wait_for(lock, interval_, [this]() {
            return !running_.load(std::memory_order_acquire);
        });
    }
}

void EvaluationLoop::runCycle() {
    try {
        ReportPayload payload = context_.evaluate();
        reportHealth(payload);
        {
            std::lock_guard<std::mutex> lock(report_mutex_);
            last_report_ = std::move(payload);
        }
    } catch (const std::exception& e) {
        spdlog::error("[EvaluationLoop] Evaluation failed: {}", e.what());
    }
    cycles_.fetch_add(1, std::memory_order_acq_rel);
}

void EvaluationLoop::reportHealth(const ReportPayload& payload) {
    if (payload.overall_status != HealthStatus::HEALTHY) {
        consecutive_unhealthy_++;
        if (consecutive_unhealthy_ >= 3) {
            spdlog::error("[EvaluationLoop] System unhealthy for {} consecutive cycles!",
                          consecutive_unhealthy_);
        }
    } else {
        if (consecutive_unhealthy_ > 0) {
            spdlog::info("[EvaluationLoop] System recovered after {} unhealthy cycles",
                         consecutive_unhealthy_);
        }
        consecutive_unhealthy_ = 0;
    }

    auto log_level = (payload.overall_status == HealthStatus::HEALTHY)
        ? spdlog::level::info
        : spdlog::level::warn;

    spdlog::log(log_level, "╔════════════════════════════════════════════════════════════╗");
    spdlog::log(log_level, "║              RELIABILITY REPORT                            ║");
    spdlog::log(log_level, "╠════════════════════════════════════════════════════════════╣");

    for (const auto& slo : payload.slos) {
        const char* mark = (slo.status == SloStatus::PASS) ? "✓" : "✗";
        spdlog::log(log_level, "║ [{}] {:14} │ SLI: {:7.3f}% │ Target: {:6.2f}% │ Budget: {:6.3f} ║",
                    mark, slo.key, slo.sli_value, slo.target, slo.budget_remaining);
    }

    spdlog::log(log_level, "╠════════════════════════════════════════════════════════════╣");
    spdlog::log(log_level, "║ Breakers: {:3} total │ {:3} open │ {:3} critical              ║",
                payload.breakers.total, payload.breakers.open, payload.breakers.critical);
    spdlog::log(log_level, "║ Overall: {:8} │ Alerts: {:3}                             ║",
                healthStatusString(payload.overall_status), payload.alerts.size());
    spdlog::log(log_level, "╚════════════════════════════════════════════════════════════╝");

    for (const auto& rec : payload.recommendations) {
        spdlog::log(log_level, "[EvaluationLoop] Recommendation: {}", rec);
    }
}
