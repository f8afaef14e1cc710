#include "ExportMetrics.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <numeric>

ExportMetrics::ExportMetrics(size_t sample_count) {
    samples_.reserve(sample_count);
}

void ExportMetrics::add_chunk(size_t bytes, double duration_ms) {
    bytes_ += bytes;
    samples_.push_back(duration_ms);
}

void ExportMetrics::merge_from(const ExportMetrics& other) {
    samples_.insert(samples_.end(), other.samples_.begin(), other.samples_.end());
    bytes_ += other.bytes_;
    rows_ += other.rows_;
    total_ms_ += other.total_ms_;
}

void ExportMetrics::calculate() {
    if (samples_.empty()) {
        return;
    }

    std::sort(samples_.begin(), samples_.end());

    stats_.min = samples_.front();
    stats_.max = samples_.back();
    stats_.avg = std::accumulate(samples_.begin(), samples_.end(), 0.0) / samples_.size();
    stats_.p90 = percentile(90.0);
    stats_.p95 = percentile(95.0);
    stats_.p99 = percentile(99.0);
}

// Linear interpolation between closest ranks; samples_ must be sorted
double ExportMetrics::percentile(double pct) const {
    if (samples_.empty()) {
        return 0.0;
    }

    double index = (pct / 100.0) * (samples_.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(index));
    size_t upper = static_cast<size_t>(std::ceil(index));

    if (lower == upper) {
        return samples_[lower];
    }
    double weight = index - lower;
    return samples_[lower] * (1 - weight) + samples_[upper] * weight;
}

double ExportMetrics::get_throughput() const {
    if (total_ms_ <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes_) * 1000.0 / total_ms_;
}

std::string ExportMetrics::get_summary() const {
    return fmt::format(
        "rows: {}, bytes: {}, total: {:.3f}ms, throughput: {:.2f} MiB/s, "
        "chunks: {}, write min: {:.4f}ms, avg: {:.4f}ms, p90: {:.4f}ms, p95: {:.4f}ms, p99: {:.4f}ms, max: {:.4f}ms",
        rows_, bytes_, total_ms_, get_throughput() / (1024.0 * 1024.0),
        samples_.size(), stats_.min, stats_.avg, stats_.p90, stats_.p95, stats_.p99, stats_.max);
}

void ExportMetrics::reset() {
    samples_.clear();
    bytes_ = 0;
    rows_ = 0;
    total_ms_ = 0.0;
    stats_ = {};
}
