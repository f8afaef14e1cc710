#pragma once

#include "Generator.hpp"
#include "WorkloadConfig.hpp"
#include <memory>
#include <string>

// A configured generator and the table a request selected from it.
// Never mutated after binding, so streams may share it across threads.
class ResolvedGenerator {
public:
    ResolvedGenerator(GeneratorMeta meta, std::unique_ptr<Generator> generator, Table table);

    const GeneratorMeta& meta() const { return meta_; }
    const Table& table() const { return table_; }
    const Generator& generator() const { return *generator_; }

private:
    GeneratorMeta meta_;
    std::unique_ptr<Generator> generator_;
    Table table_;
};

class GeneratorBinding {
public:
    /**
     * Resolve config.generator in GeneratorRegistry and select config.table.
     * @throws StorageError UnknownGenerator, VersionMismatch (VersionMismatchError),
     *         InvalidFlags (InvalidFlagsError) or UnknownTable
     */
    static std::shared_ptr<const ResolvedGenerator> bind(const WorkloadConfig& config);
};
