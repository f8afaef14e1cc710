#pragma once
#include <chrono>

class TimeRecorder {
public:
    TimeRecorder() : start_(std::chrono::steady_clock::now()) {}

    // Milliseconds since construction or the last restart()
    double elapsed() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

    double restart() {
        auto now = std::chrono::steady_clock::now();
        double ms = std::chrono::duration<double, std::milli>(now - start_).count();
        start_ = now;
        return ms;
    }

private:
    std::chrono::steady_clock::time_point start_;
};
