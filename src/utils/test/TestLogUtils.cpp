#include "LogUtils.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <stdexcept>
#include <string>

bool log_file_contains(const std::string& log_file, const std::string& keyword) {
    std::ifstream fin(log_file);
    if (!fin.is_open()) return false;
    std::string line;
    while (std::getline(fin, line)) {
        if (line.find(keyword) != std::string::npos) return true;
    }
    return false;
}

void test_init_and_info_log() {
    std::string log_file = "testlog/test_info.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);

    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    assert(LogUtils::is_initialized());
    LogUtils::info("Opened workload storage for {}", "bank.accounts");
    LogUtils::debug("Debug message should not appear");
    LogUtils::shutdown();
    assert(!LogUtils::is_initialized());

    assert(std::filesystem::exists(log_file));
    assert(log_file_contains(log_file, "Opened workload storage for bank.accounts"));
    assert(log_file_contains(log_file, "INFO"));
    assert(!log_file_contains(log_file, "Debug message should not appear"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_init_and_info_log passed" << std::endl;
}

void test_set_level_runtime() {
    std::string log_file = "testlog/test_set_level.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);

    LogUtils::init(LogUtils::Level::Warn, log_file, 1024 * 1024, 1);
    LogUtils::info("Info should not appear");
    LogUtils::warn("Warn should appear");

    LogUtils::set_level(LogUtils::Level::Debug);
    LogUtils::debug("Debug {} appear now", "should");

    LogUtils::shutdown();
    assert(!log_file_contains(log_file, "Info should not appear"));
    assert(log_file_contains(log_file, "Warn should appear"));
    assert(log_file_contains(log_file, "Debug should appear now"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_set_level_runtime passed" << std::endl;
}

void test_console_only_logger() {
    std::filesystem::remove_all("testlog");

    LogUtils::init(LogUtils::Level::Info, "", 1024 * 1024, 1);
    assert(LogUtils::is_initialized());
    LogUtils::error("Console only error {}", 7);
    LogUtils::shutdown();

    assert(!std::filesystem::exists("testlog"));
    std::cout << "test_console_only_logger passed" << std::endl;
}

void test_level_from_string() {
    assert(LogUtils::level_from_string("debug") == LogUtils::Level::Debug);
    assert(LogUtils::level_from_string("INFO") == LogUtils::Level::Info);
    assert(LogUtils::level_from_string("Warning") == LogUtils::Level::Warn);
    assert(LogUtils::level_from_string("error") == LogUtils::Level::Error);
    assert(LogUtils::level_from_string("fatal") == LogUtils::Level::Fatal);
    assert(std::string(LogUtils::level_to_string(LogUtils::Level::Warn)) == "warn");

    try {
        LogUtils::level_from_string("loud");
        assert(false && "Expected exception for unknown level");
    } catch (const std::invalid_argument& e) {
        assert(std::string(e.what()).find("loud") != std::string::npos);
    }
    std::cout << "test_level_from_string passed" << std::endl;
}

void test_logger_guard_set_level() {
    std::string log_file = "testlog/test_logger_guard_level.log";

    {
        LogUtils::LoggerGuard guard(LogUtils::Level::Warn, log_file, 1024 * 1024, 1);
        LogUtils::info("Should not appear");
        guard.set_level(LogUtils::Level::Info);
        LogUtils::info("Should appear after set_level");
    }

    assert(!LogUtils::is_initialized());
    assert(!log_file_contains(log_file, "Should not appear"));
    assert(log_file_contains(log_file, "Should appear after set_level"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_logger_guard_set_level passed" << std::endl;
}

void test_stderr_fallback_without_logger() {
    assert(!LogUtils::is_initialized());
    std::ostringstream captured;
    std::streambuf* saved = std::cerr.rdbuf(captured.rdbuf());
    LogUtils::warn("Fallback row {} of {}", 3, "bank.accounts");
    LogUtils::debug("Hidden {}", 1);
    LogUtils::error("Plain failure");
    std::cerr.rdbuf(saved);

    const std::string text = captured.str();
    assert(text.find("[WARN] Fallback row 3 of bank.accounts\n") != std::string::npos);
    assert(text.find("[ERROR] Plain failure\n") != std::string::npos);
    assert(text.find("Hidden") == std::string::npos);
    std::cout << "test_stderr_fallback_without_logger passed" << std::endl;
}

int main() {
    test_stderr_fallback_without_logger();
    test_init_and_info_log();
    test_set_level_runtime();
    test_console_only_logger();
    test_level_from_string();
    test_logger_guard_set_level();

    std::cout << "All LogUtils tests passed!" << std::endl;
    return 0;
}
