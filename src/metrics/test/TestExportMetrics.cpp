#include "ExportMetrics.hpp"
#include "TimeRecorder.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

void test_chunk_statistics() {
    ExportMetrics metrics;

    metrics.add_chunk(100, 10.5);  // min
    metrics.add_chunk(100, 15.2);
    metrics.add_chunk(100, 12.8);
    metrics.add_chunk(100, 20.9);  // max
    metrics.add_chunk(100, 14.7);
    metrics.calculate();

    assert(metrics.get_samples().size() == 5);
    assert(metrics.get_bytes() == 500);
    assert(std::abs(metrics.get_min() - 10.5) < 0.0001);
    assert(std::abs(metrics.get_max() - 20.9) < 0.0001);
    assert(std::abs(metrics.get_avg() - 14.82) < 0.0001);
    assert(std::abs(metrics.get_p90() - 18.62) < 0.0001);
    assert(std::abs(metrics.get_p95() - 19.76) < 0.0001);
    assert(std::abs(metrics.get_p99() - 20.672) < 0.0001);

    std::cout << "test_chunk_statistics passed.\n";
}

void test_merge_from_threads() {
    std::vector<ExportMetrics> per_thread(3);
    std::vector<std::thread> threads;

    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([i, &per_thread]() {
            for (int j = 0; j < 5; ++j) {
                per_thread[i].add_chunk(10, 10.0 * i + j);
            }
            per_thread[i].set_rows(5);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    ExportMetrics combined;
    for (const auto& m : per_thread) {
        combined.merge_from(m);
    }
    combined.calculate();

    assert(combined.get_samples().size() == 15);
    assert(combined.get_bytes() == 150);
    assert(combined.get_rows() == 15);
    assert(std::abs(combined.get_min() - 0.0) < 0.0001);
    assert(std::abs(combined.get_max() - 24.0) < 0.0001);

    std::cout << "test_merge_from_threads passed.\n";
}

void test_throughput_and_summary() {
    ExportMetrics metrics;
    assert(metrics.get_throughput() == 0.0);

    metrics.add_chunk(2048, 1.0);
    metrics.set_rows(20);
    metrics.set_total_ms(500.0);
    metrics.calculate();

    assert(std::abs(metrics.get_throughput() - 4096.0) < 0.0001);

    const std::string summary = metrics.get_summary();
    assert(summary.find("rows: 20") != std::string::npos);
    assert(summary.find("bytes: 2048") != std::string::npos);
    assert(summary.find("chunks: 1") != std::string::npos);

    std::cout << "test_throughput_and_summary passed.\n";
}

void test_reset() {
    ExportMetrics metrics;
    metrics.add_chunk(10, 10.0);
    metrics.add_chunk(10, 20.0);
    metrics.set_rows(2);
    metrics.calculate();

    metrics.reset();
    assert(metrics.get_samples().empty());
    assert(metrics.get_bytes() == 0);
    assert(metrics.get_rows() == 0);
    assert(std::abs(metrics.get_max()) < 0.0001);

    // Calculating with no samples leaves zeros
    metrics.calculate();
    assert(std::abs(metrics.get_avg()) < 0.0001);

    std::cout << "test_reset passed.\n";
}

void test_time_recorder() {
    TimeRecorder timer;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    const double first = timer.restart();
    assert(first >= 5.0);
    assert(timer.elapsed() < first + 1000.0);

    std::cout << "test_time_recorder passed.\n";
}

int main() {
    test_chunk_statistics();
    test_merge_from_threads();
    test_throughput_and_summary();
    test_reset();
    test_time_recorder();

    std::cout << "All ExportMetrics tests passed.\n";
    return 0;
}
