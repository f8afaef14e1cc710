#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <string>
#include <utility>
#include <vector>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when the run should stop after help, version or listing output
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();
    void show_generators();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);

    // Throws if there is nothing to do
    void validate() const;

    const ConfigData& get_config_data() const;
    const GlobalConfig& get_global_config() const;
    const std::vector<ExportConfig>& get_exports() const;

    bool has_option(const std::string& long_opt) const;

private:
    ConfigData config_data;

    // Command line options in the order given; --uri may repeat
    std::vector<std::pair<std::string, std::string>> cli_params;

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--uri")
        char short_opt;          // Short option (e.g. 'u')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
