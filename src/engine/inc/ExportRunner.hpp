#pragma once

#include "ConfigData.hpp"
#include "ExportMetrics.hpp"

#include <atomic>
#include <ostream>
#include <vector>

// Runs every configured export, concurrency of them at a time.
class ExportRunner {
public:
    static constexpr size_t copy_chunk_bytes = 64 * 1024;

    explicit ExportRunner(const ConfigData& config);

    // False when any export failed; the remaining ones are not started
    bool run();

    bool has_failure() const { return stop_execution_.load(); }

    // Per export, in configuration order; valid after run()
    const std::vector<ExportMetrics>& metrics() const { return metrics_; }

    // Opens the export's storage and copies its CSV into out
    static ExportMetrics export_to(const ExportConfig& export_config, std::ostream& out);

    // Same, writing to the configured output file or stdout
    static ExportMetrics export_one(const ExportConfig& export_config);

private:
    void worker_loop();

    const ConfigData& config_;
    std::vector<ExportMetrics> metrics_;
    std::atomic<size_t> next_export_{0};
    std::atomic<bool> stop_execution_{false};
};
