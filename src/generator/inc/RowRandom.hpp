#pragma once

#include <pcg_random.hpp>
#include <cmath>
#include <cstdint>
#include <string>

// Per-row random source: the state depends only on (seed, stream), so any
// row can be regenerated independently and in any order.
class RowRandom {
public:
    RowRandom(int64_t seed, int64_t stream)
        : engine_(static_cast<uint64_t>(seed), static_cast<uint64_t>(stream)) {}

    // Uniform in [0, bound)
    uint32_t next(uint32_t bound) { return engine_(bound); }

    // Uniform in [0, 1)
    double next_double() { return std::ldexp(static_cast<double>(engine_()), -32); }

    std::string letters(size_t count) {
        std::string out(count, 'a');
        for (auto& ch : out) {
            ch = static_cast<char>('a' + engine_(26));
        }
        return out;
    }

private:
    pcg32 engine_;
};
