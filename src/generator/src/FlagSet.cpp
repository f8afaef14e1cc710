#include "FlagSet.hpp"
#include "StringUtils.hpp"
#include <charconv>
#include <cstdlib>
#include <cerrno>
#include <fmt/format.h>
#include <stdexcept>
#include <type_traits>
#include <variant>

const char* flag_kind_to_string(FlagKind kind) {
    switch (kind) {
        case FlagKind::Int:    return "int";
        case FlagKind::Double: return "float";
        case FlagKind::Bool:   return "bool";
        case FlagKind::String: return "string";
        default:               return "unknown";
    }
}

FlagSet::FlagSet(std::string owner) : owner_(std::move(owner)) {}

void FlagSet::add(FlagSpec spec) {
    if (find(spec.name)) {
        throw std::logic_error(owner_ + ": flag redefined: " + spec.name);
    }
    FlagValue value = spec.default_value;
    entries_.push_back(Entry{std::move(spec), std::move(value), false});
}

void FlagSet::add_int(const std::string& name, int64_t default_value, const std::string& usage,
                      std::optional<int64_t> min_value) {
    add(FlagSpec{name, FlagKind::Int, default_value, usage, min_value});
}

void FlagSet::add_double(const std::string& name, double default_value, const std::string& usage) {
    add(FlagSpec{name, FlagKind::Double, default_value, usage, std::nullopt});
}

void FlagSet::add_bool(const std::string& name, bool default_value, const std::string& usage) {
    add(FlagSpec{name, FlagKind::Bool, default_value, usage, std::nullopt});
}

void FlagSet::add_string(const std::string& name, const std::string& default_value, const std::string& usage) {
    add(FlagSpec{name, FlagKind::String, default_value, usage, std::nullopt});
}

FlagSet::Entry* FlagSet::find(const std::string& name) {
    for (auto& entry : entries_) {
        if (entry.spec.name == name) return &entry;
    }
    return nullptr;
}

const FlagSet::Entry& FlagSet::lookup(const std::string& name, FlagKind kind) const {
    for (const auto& entry : entries_) {
        if (entry.spec.name == name) {
            if (entry.spec.kind != kind) {
                throw std::logic_error(fmt::format("{}: flag {} is {}, not {}", owner_, name,
                    flag_kind_to_string(entry.spec.kind), flag_kind_to_string(kind)));
            }
            return entry;
        }
    }
    throw std::out_of_range(owner_ + ": flag not defined: " + name);
}

FlagValue FlagSet::parse_value(const Entry& entry, const std::string& text) const {
    const auto& spec = entry.spec;
    auto invalid = [&](const std::string& why) {
        return std::invalid_argument(fmt::format("invalid value \"{}\" for flag -{}: {}", text, spec.name, why));
    };

    switch (spec.kind) {
        case FlagKind::Int: {
            int64_t value = 0;
            const char* last = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(text.data(), last, value, 10);
            if (text.empty() || ec != std::errc() || ptr != last) {
                throw invalid("parse error");
            }
            if (spec.min_value && value < *spec.min_value) {
                throw invalid("must be >= " + std::to_string(*spec.min_value));
            }
            return value;
        }
        case FlagKind::Double: {
            errno = 0;
            char* end = nullptr;
            const double value = std::strtod(text.c_str(), &end);
            if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
                throw invalid("parse error");
            }
            return value;
        }
        case FlagKind::Bool: {
            const std::string s = StringUtils::to_lower(text);
            if (s == "1" || s == "t" || s == "true") return true;
            if (s == "0" || s == "f" || s == "false") return false;
            throw invalid("parse error");
        }
        case FlagKind::String:
            return text;
        default:
            throw invalid("unsupported flag kind");
    }
}

void FlagSet::parse(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (arg.size() < 2 || arg[0] != '-') {
            throw std::invalid_argument(owner_ + ": unexpected argument: " + arg);
        }

        std::string body = arg.substr(StringUtils::starts_with(arg, "--") ? 2 : 1);
        if (body.empty() || body[0] == '-' || body[0] == '=') {
            throw std::invalid_argument(owner_ + ": bad flag syntax: " + arg);
        }

        const size_t eq_pos = body.find('=');
        const std::string name = body.substr(0, eq_pos);

        Entry* entry = find(name);
        if (!entry) {
            throw std::invalid_argument(owner_ + ": flag provided but not defined: -" + name);
        }

        if (eq_pos == std::string::npos) {
            if (entry->spec.kind != FlagKind::Bool) {
                throw std::invalid_argument(owner_ + ": flag needs an argument: -" + name);
            }
            entry->value = true;
        } else {
            entry->value = parse_value(*entry, body.substr(eq_pos + 1));
        }
        entry->set = true;
    }
}

int64_t FlagSet::get_int(const std::string& name) const {
    return std::get<int64_t>(lookup(name, FlagKind::Int).value);
}

double FlagSet::get_double(const std::string& name) const {
    return std::get<double>(lookup(name, FlagKind::Double).value);
}

bool FlagSet::get_bool(const std::string& name) const {
    return std::get<bool>(lookup(name, FlagKind::Bool).value);
}

const std::string& FlagSet::get_string(const std::string& name) const {
    return std::get<std::string>(lookup(name, FlagKind::String).value);
}

bool FlagSet::is_set(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.spec.name == name) return entry.set;
    }
    return false;
}

std::vector<FlagSpec> FlagSet::specs() const {
    std::vector<FlagSpec> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.spec);
    }
    return result;
}

std::string FlagSet::value_to_string(const FlagValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return fmt::format("{}", v);
        }
    }, value);
}
