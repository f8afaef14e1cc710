#pragma once

#include "WorkloadConfig.hpp"
#include <optional>
#include <string>

enum class StorageProvider {
    Workload
};

const char* storage_provider_to_string(StorageProvider provider);

struct ExternalStorageConfig {
    StorageProvider provider = StorageProvider::Workload;
    std::optional<WorkloadConfig> workload;
};
