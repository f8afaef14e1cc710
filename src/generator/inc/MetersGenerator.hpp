#pragma once

#include "Generator.hpp"
#include <string>

/**
 * Smart-meter readings.
 *
 * Table "meters" is unbounded: row i is a reading of device (i % devices)
 * taken at start-ts + (i / devices) * interval. Table "devices" holds one row
 * per device with the same groupid and location the readings carry.
 */
class MetersGenerator : public Generator {
public:
    static const GeneratorMeta& metadata();

    MetersGenerator();
    ~MetersGenerator() override = default;

    const GeneratorMeta& meta() const override { return metadata(); }
    std::vector<Table> tables() const override;
    FlagSet* flags() override { return &flags_; }

    struct DeviceInfo {
        std::string tbname;
        int64_t groupid;
        std::string location;
    };

    static DeviceInfo device_info(int64_t seed, int64_t device);

private:
    FlagSet flags_;
};
