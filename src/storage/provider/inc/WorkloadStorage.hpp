#pragma once

#include "ExternalStorage.hpp"
#include "GeneratorBinding.hpp"
#include "WorkloadConfig.hpp"
#include <memory>

/**
 * Read-only view of one generated table as a single CSV object.
 *
 * Binding happens in the constructor, so a WorkloadStorage that exists has a
 * known generator, a matching version and a valid table. Every read opens an
 * independent stream; there is no state shared between reads.
 */
class WorkloadStorage : public ExternalStorage {
public:
    explicit WorkloadStorage(WorkloadConfig config);
    ~WorkloadStorage() override = default;

    ExternalStorageConfig conf() const override;
    std::vector<std::string> column_names() const override;

    std::unique_ptr<std::istream> read_file(const std::string& basename) override;
    std::unique_ptr<std::istream> read_file_at(const std::string& basename,
                                               int64_t offset,
                                               int64_t* size = nullptr) override;

    void write_file(const std::string& basename, std::istream& content) override;
    std::vector<std::string> list_files(const std::string& pattern) override;
    void remove(const std::string& basename) override;
    int64_t size(const std::string& basename) override;

    void close() override;

    const WorkloadConfig& config() const { return config_; }
    const ResolvedGenerator& generator() const { return *generator_; }

private:
    const WorkloadConfig config_;
    std::shared_ptr<const ResolvedGenerator> generator_;
};

// Registers the "workload" scheme with ExternalStorageFactory
void register_workload_storage_provider();
