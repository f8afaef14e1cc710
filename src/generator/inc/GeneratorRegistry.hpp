#pragma once

#include "Generator.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class GeneratorRegistry {
public:
    static GeneratorRegistry& instance();

    // Replaces an existing registration with the same name
    static void register_generator(const GeneratorMeta& meta);
    static bool unregister_generator(const std::string& name);

    static std::optional<GeneratorMeta> find(const std::string& name);

    // Sorted by name
    static std::vector<GeneratorMeta> list();
    static std::vector<std::string> names();

    // Name, version, flags with defaults and tables of every registration
    static nlohmann::ordered_json describe();

private:
    std::unordered_map<std::string, GeneratorMeta> generators_;
    std::mutex mutex_;
};
