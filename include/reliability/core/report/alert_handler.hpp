#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace Reliability {

/**
 * @enum AlertLevel
 * @brief Severity level of alerts
 */
enum class AlertLevel {
    INFO = 0,       // Informational, no action needed
    WARNING = 1,    // SLO violated, budget still available
    CRITICAL = 2    // Error budget or breaker exhausted, act now
};

inline const char* alertLevelString(AlertLevel level) {
    switch (level) {
        case AlertLevel::INFO:     return "INFO";
        case AlertLevel::WARNING:  return "WARNING";
        case AlertLevel::CRITICAL: return "CRITICAL";
        default:                   return "UNKNOWN";
    }
}

/**
 * @struct Alert
 * @brief Alert raised by a report evaluation
 */
struct Alert {
    AlertLevel level = AlertLevel::INFO;
    std::string message;
    std::string source;         // SLO key or breaker name
    uint64_t timestamp_ms = 0;  // Evaluation time
};

/**
 * @class AlertHandler
 * @brief Sink for alerts produced by ReliabilityContext::evaluate()
 *
 * Implementations must not block; they may be called from the
 * evaluation loop thread.
 */
class AlertHandler {
public:
    virtual ~AlertHandler() = default;

    virtual void onAlert(const Alert& alert) = 0;

    virtual const char* name() const = 0;
};

using AlertHandlerPtr = std::shared_ptr<AlertHandler>;

/**
 * @class LoggingAlertHandler
 * @brief Logs alerts via spdlog
 */
class LoggingAlertHandler : public AlertHandler {
public:
    void onAlert(const Alert& alert) override {
        switch (alert.level) {
            case AlertLevel::INFO:
                spdlog::info("[ALERT][{}] {} - {}", alertLevelString(alert.level),
                             alert.source, alert.message);
                break;
            case AlertLevel::WARNING:
                spdlog::warn("[ALERT][{}] {} - {}", alertLevelString(alert.level),
                             alert.source, alert.message);
                break;
            case AlertLevel::CRITICAL:
                spdlog::critical("[ALERT][{}] {} - {}", alertLevelString(alert.level),
                                 alert.source, alert.message);
                break;
        }
    }

    const char* name() const override { return "LoggingAlertHandler"; }
};

class CallbackAlertHandler : public AlertHandler {
public:
    using Callback = std::function<void(const Alert&)>;

    explicit CallbackAlertHandler(Callback cb, const char* name = "CallbackAlertHandler")
        : callback_(std::move(cb)), name_(name) {}

    void onAlert(const Alert& alert) override {
        if (callback_) {
            callback_(alert);
        }
    }

    const char* name() const override { return name_; }

private:
    Callback callback_;
    const char* name_;
};

/**
 * @class CompositeAlertHandler
 * @brief Fan-out to multiple alert handlers; one failing handler does not stop the rest
 */
class CompositeAlertHandler : public AlertHandler {
public:
    void addHandler(AlertHandlerPtr handler) {
        handlers_.push_back(std::move(handler));
    }

    void onAlert(const Alert& alert) override {
        for (auto& handler : handlers_) {
            try {
                handler->onAlert(alert);
            } catch (const std::exception& e) {
                spdlog::error("AlertHandler {} threw exception: {}",
                              handler->name(), e.what());
            }
        }
    }

    const char* name() const override { return "CompositeAlertHandler"; }

private:
    std::vector<AlertHandlerPtr> handlers_;
};

class NullAlertHandler : public AlertHandler {
public:
    void onAlert(const Alert&) override {}
    const char* name() const override { return "NullAlertHandler"; }
};

} // namespace Reliability
