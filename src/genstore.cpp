#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "ExportRunner.hpp"
#include "BuiltinGenerators.hpp"
#include "WorkloadStorage.hpp"
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>

void signal_handler(int signum) {
    LogUtils::info("Interrupt signal ({}) received. Shutting down...", signum);
    LogUtils::shutdown();
    std::_Exit(128 + signum);
}

int main(int argc, char* argv[]) {
    int result = 0;

    // Console only until the config names a log directory
    LogUtils::init(LogUtils::Level::Info, "");

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    register_builtin_generators();
    register_workload_storage_provider();

    try {
        // 1. Create parameter context and initialize
        ParameterContext context;

        if (!context.init(argc, argv)) {
            LogUtils::shutdown();
            return 0;
        }

        // 2. Restart logging with the configured destination and level
        const GlobalConfig& global = context.get_global_config();
        LogUtils::Level level = LogUtils::level_from_string(global.log_level);
        if (global.verbose) {
            level = LogUtils::Level::Debug;
        }
        const std::string log_file = global.log_dir.empty()
            ? std::string()
            : (std::filesystem::path(global.log_dir) / "genstore.log").string();
        LogUtils::init(level, log_file);

        // 3. Run exports
        try {
            ExportRunner runner(context.get_config_data());

            if (!runner.run()) {
                result = 1;
            } else {
                LogUtils::info("All exports completed successfully!");
            }
        } catch (const std::exception& e) {
            LogUtils::error("Error during export: {}", e.what());
            result = 1;
        }

    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    }

    LogUtils::shutdown();
    return result;
}
