#pragma once

#include "GlobalConfig.hpp"
#include "ExportConfig.hpp"
#include "LogUtils.hpp"

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<>
    struct convert<GlobalConfig> {
        static bool decode(const Node& node, GlobalConfig& rhs) {
            if (!node.IsMap()) {
                throw std::runtime_error("global must be a map");
            }

            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {
                "verbose", "log_dir", "log_level", "concurrency"
            };
            check_unknown_keys(node, valid_keys, "global");

            if (node["verbose"]) {
                rhs.verbose = node["verbose"].as<bool>();
            }
            if (node["log_dir"]) {
                rhs.log_dir = node["log_dir"].as<std::string>();
            }
            if (node["log_level"]) {
                rhs.log_level = node["log_level"].as<std::string>();
                // Reject typos here rather than at logger start-up
                (void)LogUtils::level_from_string(rhs.log_level);
            }
            if (node["concurrency"]) {
                const int64_t concurrency = node["concurrency"].as<int64_t>();
                if (concurrency < 1) {
                    throw std::runtime_error("global::concurrency must be at least 1");
                }
                rhs.concurrency = static_cast<size_t>(concurrency);
            }
            return true;
        }
    };

    template<>
    struct convert<ExportConfig> {
        static bool decode(const Node& node, ExportConfig& rhs) {
            if (!node.IsMap()) {
                throw std::runtime_error("each entry of exports must be a map");
            }

            static const std::set<std::string> valid_keys = {
                "uri", "output", "header"
            };
            check_unknown_keys(node, valid_keys, "exports");

            if (!node["uri"]) {
                throw std::runtime_error("Missing required field 'uri' in exports");
            }
            rhs.uri = node["uri"].as<std::string>();
            if (rhs.uri.empty()) {
                throw std::runtime_error("Field 'uri' in exports must not be empty");
            }

            if (node["output"]) {
                rhs.output = node["output"].as<std::string>();
            }
            if (node["header"]) {
                rhs.header = node["header"].as<bool>();
            }
            return true;
        }
    };

}
