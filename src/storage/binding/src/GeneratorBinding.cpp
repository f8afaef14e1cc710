#include "GeneratorBinding.hpp"
#include "GeneratorRegistry.hpp"
#include "StorageError.hpp"
#include "StringUtils.hpp"
#include "LogUtils.hpp"
#include <stdexcept>

ResolvedGenerator::ResolvedGenerator(GeneratorMeta meta, std::unique_ptr<Generator> generator, Table table)
    : meta_(std::move(meta))
    , generator_(std::move(generator))
    , table_(std::move(table)) {}

std::shared_ptr<const ResolvedGenerator> GeneratorBinding::bind(const WorkloadConfig& config) {
    // 1. Registry lookup
    auto meta = GeneratorRegistry::find(config.generator);
    if (!meta) {
        throw StorageError(StorageErrorCode::UnknownGenerator,
                           "unknown generator " + config.generator +
                           " (registered: " + StringUtils::join(GeneratorRegistry::names(), ", ") + ")");
    }

    // 2. Different versions may generate different data
    if (meta->version != config.version) {
        throw VersionMismatchError(meta->name, config.version, meta->version);
    }

    // 3. Instantiate and configure
    if (!meta->create) {
        throw StorageError(StorageErrorCode::UnknownGenerator,
                           "generator " + meta->name + " has no constructor registered");
    }
    std::unique_ptr<Generator> generator = meta->create();

    if (FlagSet* flags = generator->flags()) {
        try {
            flags->parse(config.flags);
        } catch (const std::invalid_argument& e) {
            throw InvalidFlagsError(config.flags, e.what());
        }
    } else if (!config.flags.empty()) {
        throw InvalidFlagsError(config.flags, "generator " + meta->name + " does not accept flags");
    }

    // 4. Table lookup by exact name
    for (auto& table : generator->tables()) {
        if (table.name == config.table) {
            LogUtils::debug("Bound generator {}@{} table {} ({} flags)",
                            meta->name, meta->version, table.name, config.flags.size());
            return std::make_shared<const ResolvedGenerator>(*meta, std::move(generator), std::move(table));
        }
    }

    throw StorageError(StorageErrorCode::UnknownTable,
                       "unknown table " + config.table + " for generator " + meta->name);
}
