#include <reliability/core/config/loader.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <limits>
#include <set>
#include <stdexcept>

namespace Reliability {

namespace {

constexpr double MAX_RECOVERY_TIMEOUT_SECONDS = 365.0 * 24 * 3600;

template <typename T>
T readAs(const YAML::Node& value, const std::string& path) {
    try {
        return value.as<T>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error("Invalid type for field: " + path);
    }
}

template <typename T>
T requiredField(const YAML::Node& parent, const char* field, const std::string& scope) {
    const std::string path = scope.empty() ? field : scope + "." + field;
    YAML::Node value = parent[field];
    if (!value || value.IsNull()) {
        throw std::runtime_error("Missing required field: " + path);
    }
    return readAs<T>(value, path);
}

template <typename T>
T optionalField(const YAML::Node& parent, const char* field, const std::string& scope, T fallback) {
    YAML::Node value = parent[field];
    if (!value || value.IsNull()) {
        return fallback;
    }
    return readAs<T>(value, scope.empty() ? field : scope + "." + field);
}

[[noreturn]] void invalidValue(const std::string& path, const std::string& why) {
    throw std::runtime_error("Invalid value for field " + path + ": " + why);
}

AppConfig::LoggingConfig parseLogging(const YAML::Node& node) {
    AppConfig::LoggingConfig cfg;
    if (!node) return cfg;

    cfg.level = optionalField<std::string>(node, "level", "logging", cfg.level);
    static const std::set<std::string> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"
    };
    if (levels.count(cfg.level) == 0) {
        invalidValue("logging.level", "unknown level '" + cfg.level + "'");
    }
    return cfg;
}

AppConfig::RecorderConfig parseRecorder(const YAML::Node& node) {
    AppConfig::RecorderConfig cfg;
    if (!node) return cfg;

    int64_t days = optionalField<int64_t>(node, "retention_days", "recorder", 0);
    if (days < 0) {
        invalidValue("recorder.retention_days", "must be >= 0");
    }
    cfg.retention_days = static_cast<uint32_t>(days);
    return cfg;
}

AppConfig::EvaluationConfig parseEvaluation(const YAML::Node& node) {
    AppConfig::EvaluationConfig cfg;
    if (!node) return cfg;

    int64_t interval = optionalField<int64_t>(node, "interval_seconds", "evaluation",
                                         static_cast<int64_t>(cfg.interval_seconds));
    if (interval <= 0) {
        invalidValue("evaluation.interval_seconds", "must be > 0");
    }
    cfg.interval_seconds = static_cast<uint32_t>(interval);

    cfg.budget_critical_threshold = optionalField<double>(node, "budget_critical_threshold",
                                                     "evaluation", cfg.budget_critical_threshold);
    if (cfg.budget_critical_threshold < 0.0 || cfg.budget_critical_threshold > 1.0) {
        invalidValue("evaluation.budget_critical_threshold", "must be within [0, 1]");
    }
    return cfg;
}

std::vector<BreakerConfig> parseBreakers(const YAML::Node& node) {
    std::vector<BreakerConfig> breakers;
    if (!node) return breakers;
    if (!node.IsSequence()) {
        throw std::runtime_error("Invalid type for field: breakers (expected a list)");
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < node.size(); ++i) {
        const YAML::Node entry = node[i];
        const std::string scope = "breakers[" + std::to_string(i) + "]";

        BreakerConfig cfg;
        cfg.name = requiredField<std::string>(entry, "name", scope);
        if (cfg.name.empty()) {
            invalidValue(scope + ".name", "must not be empty");
        }
        if (!seen.insert(cfg.name).second) {
            invalidValue(scope + ".name", "duplicate breaker '" + cfg.name + "'");
        }

        int64_t threshold = requiredField<int64_t>(entry, "failure_threshold", scope);
        if (threshold <= 0) {
            invalidValue(scope + ".failure_threshold", "must be > 0");
        }
        if (threshold > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
            invalidValue(scope + ".failure_threshold", "exceeds " +
                         std::to_string(std::numeric_limits<uint32_t>::max()));
        }
        cfg.failure_threshold = static_cast<uint32_t>(threshold);

        double timeout_s = requiredField<double>(entry, "recovery_timeout_seconds", scope);
        if (!(timeout_s >= 0.001)) {
            invalidValue(scope + ".recovery_timeout_seconds", "must be at least 0.001 (1 ms)");
        }
        if (timeout_s > MAX_RECOVERY_TIMEOUT_SECONDS) {
            invalidValue(scope + ".recovery_timeout_seconds", "must be at most one year");
        }
        cfg.recovery_timeout = std::chrono::milliseconds(static_cast<int64_t>(timeout_s * 1000.0));

        breakers.push_back(std::move(cfg));
    }
    return breakers;
}

std::vector<SLODefinition> parseSlos(const YAML::Node& node) {
    if (!node) return defaultSloDefinitions();
    if (!node.IsSequence() || node.size() == 0) {
        throw std::runtime_error("Invalid type for field: slos (expected a non-empty list)");
    }

    std::vector<SLODefinition> slos;
    std::set<std::string> seen;
    for (size_t i = 0; i < node.size(); ++i) {
        const YAML::Node entry = node[i];
        const std::string scope = "slos[" + std::to_string(i) + "]";

        SLODefinition slo;
        slo.key = requiredField<std::string>(entry, "key", scope);
        if (!seen.insert(slo.key).second) {
            invalidValue(scope + ".key", "duplicate SLO '" + slo.key + "'");
        }
        slo.name = optionalField<std::string>(entry, "name", scope, slo.key);

        slo.sli_name = requiredField<std::string>(entry, "sli", scope);
        auto kind = parseSliName(slo.sli_name);
        if (!kind) {
            invalidValue(scope + ".sli", "unknown SLI '" + slo.sli_name + "'");
        }
        slo.kind = *kind;

        slo.target = requiredField<double>(entry, "target", scope);
        if (slo.target < 0.0 || slo.target > 100.0) {
            invalidValue(scope + ".target", "must be within [0, 100]");
        }

        int64_t window = optionalField<int64_t>(entry, "window_days", scope, 30);
        if (window <= 0) {
            invalidValue(scope + ".window_days", "must be > 0");
        }
        slo.window_days = static_cast<uint32_t>(window);

        slos.push_back(std::move(slo));
    }
    return slos;
}

AppConfig::AppConfiguration parseRoot(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping");
    }

    AppConfig::AppConfiguration config;
    config.app_name = requiredField<std::string>(root, "app_name", "");
    config.version = requiredField<std::string>(root, "version", "");
    config.logging = parseLogging(root["logging"]);
    config.recorder = parseRecorder(root["recorder"]);
    config.evaluation = parseEvaluation(root["evaluation"]);
    config.breakers = parseBreakers(root["breakers"]);
    config.slos = parseSlos(root["slos"]);
    return config;
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error("Configuration file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + filepath + ": " + e.what());
    }

    auto config = parseRoot(root);
    spdlog::debug("[ConfigLoader] Loaded {} ({} breakers, {} SLOs)",
                  filepath, config.breakers.size(), config.slos.size());
    return config;
}

AppConfig::AppConfiguration ConfigLoader::loadFromString(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse configuration: ") + e.what());
    }
    return parseRoot(root);
}

} // namespace Reliability
