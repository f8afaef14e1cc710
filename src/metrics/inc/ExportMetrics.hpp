#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Per-export counters plus latency samples of each chunk copied to the sink.
class ExportMetrics {
public:
    explicit ExportMetrics(size_t sample_count = 1024);

    void add_chunk(size_t bytes, double duration_ms);

    // Rows are counted by the caller, usually from the row stream
    void set_rows(int64_t rows) { rows_ = rows; }
    void set_total_ms(double total_ms) { total_ms_ = total_ms; }

    void merge_from(const ExportMetrics& other);

    // Sorts samples and fills the percentile fields
    void calculate();

    std::string get_summary() const;
    void reset();

    const std::vector<double>& get_samples() const { return samples_; }

    uint64_t get_bytes() const { return bytes_; }
    int64_t get_rows() const { return rows_; }
    double get_total_ms() const { return total_ms_; }

    // Bytes per second over total_ms, 0 when nothing was timed
    double get_throughput() const;

    double get_min() const { return stats_.min; }
    double get_max() const { return stats_.max; }
    double get_avg() const { return stats_.avg; }
    double get_p90() const { return stats_.p90; }
    double get_p95() const { return stats_.p95; }
    double get_p99() const { return stats_.p99; }

private:
    double percentile(double pct) const;

    std::vector<double> samples_;
    uint64_t bytes_ = 0;
    int64_t rows_ = 0;
    double total_ms_ = 0.0;

    struct {
        double min = 0.0;
        double max = 0.0;
        double avg = 0.0;
        double p90 = 0.0;
        double p95 = 0.0;
        double p99 = 0.0;
    } stats_;
};
