#pragma once

#include "Table.hpp"
#include "FlagSet.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

class Generator;

struct GeneratorMeta {
    std::string name;
    std::string version;        // Bumped whenever row content changes
    std::string description;
    std::function<std::unique_ptr<Generator>()> create;
};

/**
 * A named, versioned source of deterministic table data.
 *
 * Every generator is constructible through its GeneratorMeta. A generator that
 * takes configuration also exposes the flag-configurable capability by
 * returning its FlagSet from flags(); the default is "not configurable".
 */
class Generator {
public:
    virtual ~Generator() = default;

    virtual const GeneratorMeta& meta() const = 0;

    // Tables reflect the flags parsed so far; call after flags()->parse()
    virtual std::vector<Table> tables() const = 0;

    virtual FlagSet* flags() { return nullptr; }
};
