#include "WorkloadStorage.hpp"
#include "CSVRowsReader.hpp"
#include "ExternalStorageFactory.hpp"
#include "WorkloadConfigParser.hpp"
#include "StorageError.hpp"
#include "LogUtils.hpp"

// Configs may come straight from ExternalStorageFactory::make_storage, not the parser
static WorkloadConfig checked(WorkloadConfig config) {
    config.format = string_to_data_format(config.format_name);

    if (config.row_begin < 0 || config.row_end < 0) {
        throw StorageError(StorageErrorCode::BadRowBound,
                           "row bounds must not be negative: " + config.describe());
    }
    if (config.row_end != 0 && config.row_end < config.row_begin) {
        throw StorageError(StorageErrorCode::BadRowBound,
                           "row-end " + std::to_string(config.row_end) +
                           " is before row-start " + std::to_string(config.row_begin));
    }
    return config;
}

WorkloadStorage::WorkloadStorage(WorkloadConfig config)
    : config_(checked(std::move(config)))
    , generator_(GeneratorBinding::bind(config_)) {
    LogUtils::debug("Opened workload storage for {}", config_.describe());
}

ExternalStorageConfig WorkloadStorage::conf() const {
    ExternalStorageConfig conf;
    conf.provider = StorageProvider::Workload;
    conf.workload = config_;
    return conf;
}

std::vector<std::string> WorkloadStorage::column_names() const {
    return generator_->table().columns;
}

std::unique_ptr<std::istream> WorkloadStorage::read_file(const std::string& basename) {
    if (!basename.empty()) {
        throw StorageError(StorageErrorCode::UnexpectedBasename,
                           "basenames are not supported by workload storage: " + basename);
    }
    return std::make_unique<CSVRowsReader>(generator_, config_.row_begin, config_.row_end);
}

std::unique_ptr<std::istream> WorkloadStorage::read_file_at(const std::string&, int64_t offset, int64_t*) {
    throw StorageError(StorageErrorCode::NotImplemented,
                       "workload storage does not support reading at byte offset " + std::to_string(offset));
}

void WorkloadStorage::write_file(const std::string&, std::istream&) {
    throw OperationNotSupportedError("write");
}

std::vector<std::string> WorkloadStorage::list_files(const std::string&) {
    throw OperationNotSupportedError("list");
}

void WorkloadStorage::remove(const std::string&) {
    throw OperationNotSupportedError("delete");
}

int64_t WorkloadStorage::size(const std::string&) {
    throw OperationNotSupportedError("size");
}

void WorkloadStorage::close() {}

void register_workload_storage_provider() {
    ExternalStorageFactory::register_provider(
        StorageProvider::Workload,
        WorkloadConfig::default_scheme,
        [](const ParsedUrl& url) {
            ExternalStorageConfig conf;
            conf.provider = StorageProvider::Workload;
            conf.workload = WorkloadConfigParser::parse(url);
            return conf;
        },
        [](const ExternalStorageConfig& conf) -> std::unique_ptr<ExternalStorage> {
            if (!conf.workload) {
                throw StorageError(StorageErrorCode::MalformedPath,
                                   "workload storage requested but its config is missing");
            }
            return std::make_unique<WorkloadStorage>(*conf.workload);
        },
        true);
}
