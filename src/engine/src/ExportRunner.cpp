#include "ExportRunner.hpp"
#include "CsvEncoder.hpp"
#include "ExternalStorageFactory.hpp"
#include "LogUtils.hpp"
#include "TimeRecorder.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

ExportRunner::ExportRunner(const ConfigData& config)
    : config_(config) {
}

ExportMetrics ExportRunner::export_to(const ExportConfig& export_config, std::ostream& out) {
    TimeRecorder total;
    ExportMetrics metrics;

    auto storage = ExternalStorageFactory::make_storage_from_uri(export_config.uri);

    if (export_config.header) {
        const auto columns = storage->column_names();
        if (columns.empty()) {
            throw std::runtime_error("Header requested but storage has no column names: " + export_config.uri);
        }
        fmt::memory_buffer header;
        CsvEncoder::append_header(header, columns);

        TimeRecorder timer;
        out.write(header.data(), static_cast<std::streamsize>(header.size()));
        metrics.add_chunk(header.size(), timer.elapsed());
    }

    auto in = storage->read_file("");
    // Let row generation failures surface instead of reading as a short file
    in->exceptions(std::ios::badbit);

    std::vector<char> buffer(copy_chunk_bytes);
    int64_t lines = 0;
    while (true) {
        in->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize n = in->gcount();
        if (n <= 0) {
            break;
        }

        TimeRecorder timer;
        out.write(buffer.data(), n);
        if (!out) {
            throw std::runtime_error("Failed to write exported data for " + export_config.uri);
        }
        metrics.add_chunk(static_cast<size_t>(n), timer.elapsed());
        lines += std::count(buffer.data(), buffer.data() + n, '\n');
    }

    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to flush exported data for " + export_config.uri);
    }

    // Generated text fields never hold a line break, so lines are rows
    metrics.set_rows(lines);
    storage->close();

    metrics.set_total_ms(total.elapsed());
    metrics.calculate();
    return metrics;
}

ExportMetrics ExportRunner::export_one(const ExportConfig& export_config) {
    if (export_config.to_stdout()) {
        LogUtils::info("Exporting {} to stdout", export_config.uri);
        return export_to(export_config, std::cout);
    }

    const std::filesystem::path path(export_config.output);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open output file: " + export_config.output);
    }

    LogUtils::info("Exporting {} to {}", export_config.uri, export_config.output);
    return export_to(export_config, out);
}

bool ExportRunner::run() {
    const auto& exports = config_.exports;
    metrics_.assign(exports.size(), ExportMetrics());
    next_export_ = 0;
    stop_execution_ = false;

    // Create thread pool
    const size_t concurrency = std::max<size_t>(1, std::min(config_.global.concurrency, exports.size()));
    std::vector<std::thread> workers;
    for (size_t i = 0; i < concurrency; ++i) {
        workers.emplace_back([this] { worker_loop(); });
    }

    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }

    return !stop_execution_.load();
}

void ExportRunner::worker_loop() {
    const auto& exports = config_.exports;

    while (!stop_execution_.load()) {
        const size_t index = next_export_.fetch_add(1);
        if (index >= exports.size()) return;

        const auto& export_config = exports[index];
        try {
            metrics_[index] = export_one(export_config);
            LogUtils::info("Export completed (uri: {}): {}", export_config.uri, metrics_[index].get_summary());
        } catch (const std::exception& e) {
            stop_execution_.store(true);
            LogUtils::error("Export failed, exiting (uri: {}): {}", export_config.uri, e.what());
            return;
        }
    }
}
