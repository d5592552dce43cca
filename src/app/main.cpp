#include <spdlog/spdlog.h>
#include <reliability/core/admin/evaluation_loop.hpp>
#include <reliability/core/config/loader.hpp>
#include <reliability/core/context/reliability_context.hpp>
#include <reliability/core/report/report_json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <thread>

using namespace Reliability;

// Global flag for graceful shutdown
static std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("ReliabilityCore monitor starting up...");
    spdlog::info("Build date: {} {}", __DATE__, __TIME__);

    const std::string config_path = argc > 1 ? argv[1] : "config/config.yaml";
    spdlog::info("Config file: {}", config_path);

    AppConfig::AppConfiguration config;
    try {
        config = ConfigLoader::loadConfig(config_path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    spdlog::info("Configuration loaded: {} {}", config.app_name, config.version);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        ReliabilityContext context(config);
        EvaluationLoop loop(context, std::chrono::seconds(config.evaluation.interval_seconds));

        loop.start();
        spdlog::info("Press Ctrl+C to shutdown");

        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        spdlog::info("Shutdown requested, stopping evaluation loop...");
        loop.stop();

        if (auto last = loop.lastReport()) {
            spdlog::info("Last report: {}", toJson(*last).dump());
        }
        spdlog::info("Breakers: {}", toJson(context.breakers().summarize()).dump());
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("ReliabilityCore monitor shutdown complete");
    return EXIT_SUCCESS;
}
