#include "GeneratorRegistry.hpp"
#include <algorithm>

GeneratorRegistry& GeneratorRegistry::instance() {
    static GeneratorRegistry inst;
    return inst;
}

void GeneratorRegistry::register_generator(const GeneratorMeta& meta) {
    auto& inst = instance();
    std::lock_guard<std::mutex> lock(inst.mutex_);
    inst.generators_[meta.name] = meta;
}

bool GeneratorRegistry::unregister_generator(const std::string& name) {
    auto& inst = instance();
    std::lock_guard<std::mutex> lock(inst.mutex_);
    return inst.generators_.erase(name) > 0;
}

std::optional<GeneratorMeta> GeneratorRegistry::find(const std::string& name) {
    auto& inst = instance();
    std::lock_guard<std::mutex> lock(inst.mutex_);
    if (auto it = inst.generators_.find(name); it != inst.generators_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<GeneratorMeta> GeneratorRegistry::list() {
    std::vector<GeneratorMeta> result;
    {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        result.reserve(inst.generators_.size());
        for (const auto& [_, meta] : inst.generators_) {
            result.push_back(meta);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const GeneratorMeta& a, const GeneratorMeta& b) { return a.name < b.name; });
    return result;
}

std::vector<std::string> GeneratorRegistry::names() {
    std::vector<std::string> result;
    for (const auto& meta : list()) {
        result.push_back(meta.name);
    }
    return result;
}

nlohmann::ordered_json GeneratorRegistry::describe() {
    nlohmann::ordered_json out = nlohmann::ordered_json::array();

    for (const auto& meta : list()) {
        nlohmann::ordered_json entry;
        entry["name"] = meta.name;
        entry["version"] = meta.version;
        entry["description"] = meta.description;

        auto gen = meta.create();
        entry["flags"] = nlohmann::ordered_json::array();
        if (FlagSet* flags = gen->flags()) {
            for (const auto& spec : flags->specs()) {
                entry["flags"].push_back({
                    {"name", spec.name},
                    {"type", flag_kind_to_string(spec.kind)},
                    {"default", FlagSet::value_to_string(spec.default_value)},
                    {"usage", spec.usage}
                });
            }
        }

        entry["tables"] = nlohmann::ordered_json::array();
        for (const auto& table : gen->tables()) {
            nlohmann::ordered_json t;
            t["name"] = table.name;
            t["columns"] = table.columns;
            if (table.bounded()) {
                t["row_count"] = table.row_count;
            } else {
                t["row_count"] = nullptr;
            }
            entry["tables"].push_back(std::move(t));
        }
        out.push_back(std::move(entry));
    }
    return out;
}
