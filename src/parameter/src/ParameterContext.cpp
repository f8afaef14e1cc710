#include "ParameterContext.hpp"
#include "GeneratorRegistry.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#ifndef GENSTORE_VERSION
#define GENSTORE_VERSION "0.1.0"
#endif
#ifndef GENSTORE_BUILD_GIT
#define GENSTORE_BUILD_GIT "unknown"
#endif
#ifndef GENSTORE_BUILD_TARGET
#define GENSTORE_BUILD_TARGET "unknown"
#endif
#ifndef GENSTORE_BUILD_DATE
#define GENSTORE_BUILD_DATE "unknown"
#endif

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--uri", 'u', "Workload URI to export (repeatable)", true},
    {"--output", 'o', "Output file for the preceding --uri, \"-\" for stdout", true},
    {"--header", 'H', "Write a CSV header line for command line exports", false},
    {"--config-file", 'c', "Specify config file path", true},
    {"--list", 'l', "List registered generators as JSON", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: genstore [OPTIONS]...\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nURI format:\n"
              << "  workload:///<format>/<generator>/<table>?version=<v>[&row-start=<n>][&row-end=<m>][&<flag>=<value>...]\n"
              << "\nExamples:\n"
              << "  genstore -u 'workload:///csv/bank/accounts?version=1.0.0&row-end=10'\n"
              << "  genstore -u '/csv/meters/meters?version=0.5.0&row-end=1000&devices=4' -o meters.csv -H\n"
              << "  genstore --config-file=genstore-bank.yaml\n"
              << "  genstore --list\n\n";
}

void ParameterContext::show_version() {
    std::cout << "genstore version: " << GENSTORE_VERSION << std::endl;
    std::cout << "git: " << GENSTORE_BUILD_GIT << std::endl;
    std::cout << "build: " << GENSTORE_BUILD_TARGET << " " << GENSTORE_BUILD_DATE << std::endl;
}

void ParameterContext::show_generators() {
    std::cout << GeneratorRegistry::describe().dump(2) << std::endl;
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        return;
    }
    if (!config.IsMap()) {
        throw std::runtime_error("Config root must be a map");
    }

    static const std::set<std::string> valid_keys = {
        "global", "exports"
    };
    YAML::check_unknown_keys(config, valid_keys, "root");

    if (config["global"]) {
        config_data.global = config["global"].as<GlobalConfig>();
    }

    if (config["exports"]) {
        const auto& exports = config["exports"];
        if (!exports.IsSequence()) {
            throw std::runtime_error("exports must be a list");
        }
        for (const auto& node : exports) {
            config_data.exports.push_back(node.as<ExportConfig>());
        }
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(file_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file " + file_path + ": " + e.what());
    }
    merge_yaml(config);
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    // Try to get value from next argv
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw std::runtime_error("Option does not take a value: " + key);
            }

            cli_params.emplace_back(key, value);
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params.emplace_back(key, value);
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& exports = config_data.exports;
    const size_t first_cli_export = exports.size();
    bool last_has_output = false;

    for (const auto& [key, value] : cli_params) {
        if (key == "--uri") {
            if (value.empty()) {
                throw std::runtime_error("Option --uri requires a non-empty value");
            }
            ExportConfig export_config;
            export_config.uri = value;
            exports.push_back(export_config);
            last_has_output = false;
        } else if (key == "--output") {
            if (exports.size() == first_cli_export) {
                throw std::runtime_error("Option --output must follow a --uri");
            }
            if (last_has_output) {
                throw std::runtime_error("Option --output given twice for " + exports.back().uri);
            }
            exports.back().output = value;
            last_has_output = true;
        } else if (key == "--verbose") {
            config_data.global.verbose = true;
        } else if (key == "--list") {
            config_data.list_generators = true;
        }
    }

    if (has_option("--header")) {
        for (size_t i = first_cli_export; i < exports.size(); ++i) {
            exports[i].header = true;
        }
    }
}

void ParameterContext::merge_environment_vars() {
    if (const char* env_value = std::getenv("GENSTORE_LOG_DIR")) {
        config_data.global.log_dir = env_value;
    }
    if (const char* env_value = std::getenv("GENSTORE_LOG_LEVEL")) {
        (void)LogUtils::level_from_string(env_value);
        config_data.global.log_level = env_value;
    }
}

void ParameterContext::validate() const {
    if (config_data.exports.empty() && !config_data.list_generators) {
        throw std::runtime_error("Nothing to export: give at least one --uri or an exports list in --config-file");
    }

    // Two exports writing to stdout would interleave into one unparseable stream
    const auto to_stdout = std::count_if(config_data.exports.begin(), config_data.exports.end(),
        [](const ExportConfig& e) { return e.to_stdout(); });
    if (to_stdout > 1) {
        throw std::runtime_error("At most one export may write to stdout");
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (has_option("--help")) {
        show_help();
        return false;
    } else if (has_option("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    for (const auto& [key, value] : cli_params) {
        if (key == "--config-file") {
            merge_yaml(value);
        }
    }
    merge_environment_vars();
    merge_commandline();

    if (config_data.list_generators) {
        show_generators();
        return false;
    }

    validate();
    return true;
}

bool ParameterContext::has_option(const std::string& long_opt) const {
    return std::any_of(cli_params.begin(), cli_params.end(),
        [&long_opt](const auto& param) { return param.first == long_opt; });
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_data.global;
}

const std::vector<ExportConfig>& ParameterContext::get_exports() const {
    return config_data.exports;
}
