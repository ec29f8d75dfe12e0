#include "IngestCoordinator.hpp"
#include "IngestErrors.hpp"
#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "SignalManager.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
    int result = 0;

    try {
        // 1. Create parameter context and initialize
        ParameterContext context;
        if (!context.init(argc, argv)) {
            return 0;
        }
        const AppConfig& config = context.get_config();

        LogUtils::Level level = LogUtils::parse_level(config.log.level);
        if (config.verbose) {
            level = LogUtils::Level::Debug;
        }
        LogUtils::init(level, config.log_path(), config.log.max_file_size, config.log.max_files);

        // 2. A first signal stops after the next checkpoint, a second one exits at once
        IngestCoordinator coordinator(config.run);
        auto on_signal = [&coordinator](int signum) {
            if (SignalManager::received_count() > 1) {
                std::_Exit(128 + signum);
            }
            coordinator.request_stop();
        };
        SignalManager::register_signal(SIGINT, on_signal);
        SignalManager::register_signal(SIGTERM, on_signal);
        SignalManager::setup();

        // 3. Run the ingest
        try {
            const IngestResult outcome = coordinator.run();
            if (outcome.interrupted) {
                LogUtils::warn("Interrupted; rerun with the same configuration to resume");
                result = 130;
            } else if (outcome.skipped) {
                LogUtils::info("Output already complete: {} records in {}", outcome.pages_total,
                               config.run.output_path());
            } else {
                LogUtils::info("Ingest completed: {} records in {}", outcome.pages_total,
                               config.run.output_path());
            }
        } catch (const IngestError& e) {
            LogUtils::error("Ingest failed: {}", e.what());
            LogUtils::error("Progress up to the last checkpoint is kept; rerun to resume");
            result = 1;
        }
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);

    } catch (const ConfigError& e) {
        LogUtils::error("Error: {}", e.what());
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        result = 1;
    }

    LogUtils::shutdown();
    return result;
}
