#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class FlagKind {
    Int,
    Double,
    Bool,
    String
};

const char* flag_kind_to_string(FlagKind kind);

using FlagValue = std::variant<int64_t, double, bool, std::string>;

struct FlagSpec {
    std::string name;
    FlagKind kind;
    FlagValue default_value;
    std::string usage;
    std::optional<int64_t> min_value;   // Int flags only
};

/**
 * Typed "--name=value" options declared by a generator.
 * parse() throws std::invalid_argument describing the first bad argument.
 */
class FlagSet {
public:
    explicit FlagSet(std::string owner);

    void add_int(const std::string& name, int64_t default_value, const std::string& usage,
                 std::optional<int64_t> min_value = std::nullopt);
    void add_double(const std::string& name, double default_value, const std::string& usage);
    void add_bool(const std::string& name, bool default_value, const std::string& usage);
    void add_string(const std::string& name, const std::string& default_value, const std::string& usage);

    // Accepts "--name=value", "-name=value", and "--name" for bool flags
    void parse(const std::vector<std::string>& args);

    int64_t get_int(const std::string& name) const;
    double get_double(const std::string& name) const;
    bool get_bool(const std::string& name) const;
    const std::string& get_string(const std::string& name) const;

    bool is_set(const std::string& name) const;
    std::vector<FlagSpec> specs() const;
    const std::string& owner() const { return owner_; }

    static std::string value_to_string(const FlagValue& value);

private:
    struct Entry {
        FlagSpec spec;
        FlagValue value;
        bool set = false;
    };

    void add(FlagSpec spec);
    Entry* find(const std::string& name);
    const Entry& lookup(const std::string& name, FlagKind kind) const;
    FlagValue parse_value(const Entry& entry, const std::string& text) const;

    std::string owner_;
    std::vector<Entry> entries_;
};
