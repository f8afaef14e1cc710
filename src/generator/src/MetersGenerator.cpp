#include "MetersGenerator.hpp"
#include "RowRandom.hpp"
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

constexpr std::array<const char*, 10> locations = {
    "California.SanFrancisco", "California.LosAngeles", "California.SanDiego",
    "California.SanJose", "California.PaloAlto", "California.Campbell",
    "California.MountainView", "California.Sunnyvale", "California.SantaClara",
    "California.Cupertino"
};

// Device attributes use their own stream space, apart from reading rows
constexpr int64_t device_seed_salt = 0x5eed;

double round_to(double value, double scale) {
    return std::round(value * scale) / scale;
}

}

const GeneratorMeta& MetersGenerator::metadata() {
    static const GeneratorMeta meta{
        "meters",
        "0.5.0",
        "Smart meter readings (current, voltage, phase) per device",
        []() -> std::unique_ptr<Generator> { return std::make_unique<MetersGenerator>(); }
    };
    return meta;
}

MetersGenerator::MetersGenerator() : flags_("meters") {
    flags_.add_int("devices", 10, "Number of meter devices", 1);
    flags_.add_int("start-ts", 1700000000000, "Timestamp of the first reading, in ms");
    flags_.add_int("interval", 1000, "Milliseconds between two readings of one device", 1);
    flags_.add_int("seed", 1, "Random seed");
}

MetersGenerator::DeviceInfo MetersGenerator::device_info(int64_t seed, int64_t device) {
    RowRandom rng(seed ^ device_seed_salt, device);
    DeviceInfo info;
    info.tbname = "d" + std::to_string(device);
    info.groupid = static_cast<int64_t>(rng.next(10)) + 1;
    info.location = locations[rng.next(static_cast<uint32_t>(locations.size()))];
    return info;
}

std::vector<Table> MetersGenerator::tables() const {
    const int64_t devices = flags_.get_int("devices");
    const int64_t start_ts = flags_.get_int("start-ts");
    const int64_t interval = flags_.get_int("interval");
    const int64_t seed = flags_.get_int("seed");

    Table meters;
    meters.name = "meters";
    meters.columns = {"tbname", "ts", "current", "voltage", "phase", "groupid", "location"};
    meters.row_count = Table::unbounded;
    meters.row = [devices, start_ts, interval, seed](int64_t index) -> Row {
        const int64_t device = index % devices;
        const int64_t tick = index / devices;
        const auto info = device_info(seed, device);

        RowRandom rng(seed, index);
        const double current = round_to(8.0 + 8.0 * rng.next_double(), 100.0);
        const int64_t voltage = 200 + static_cast<int64_t>(rng.next(41));
        const double phase = round_to(0.2 + 0.2 * rng.next_double(), 1000.0);

        int64_t offset = 0;
        int64_t ts = 0;
        if (__builtin_mul_overflow(tick, interval, &offset) || __builtin_add_overflow(start_ts, offset, &ts)) {
            throw std::out_of_range("meters timestamp overflows int64 at row " + std::to_string(index));
        }

        return Row{info.tbname, ts, current, voltage, phase, info.groupid, info.location};
    };

    Table device_table;
    device_table.name = "devices";
    device_table.columns = {"tbname", "groupid", "location"};
    device_table.row_count = devices;
    device_table.row = [seed](int64_t index) -> Row {
        const auto info = device_info(seed, index);
        return Row{info.tbname, info.groupid, info.location};
    };

    return {std::move(meters), std::move(device_table)};
}
