#pragma once

#include "config.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace chunkup::core {

class CommandLineParser {
public:
    enum class ValueKind {
        FLAG,
        TEXT,
        NUMBER
    };

    struct Option {
        char short_name;            // '\0' for long-only options
        std::string long_name;
        std::string description;
        ValueKind kind;
        std::string config_key;     // configuration key the option overrides, if any
        std::string default_value;
    };

    explicit CommandLineParser(std::string program_name);

    void add_option(Option option);

    // Accepts --name value, --name=value, -x value, -xvalue and bundled flags
    // (-vh). Everything after "--" is positional.
    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& long_name) const;
    std::string get_option(const std::string& long_name, const std::string& default_value = "") const;
    std::optional<std::uint64_t> get_number_option(const std::string& long_name) const;

    // Writes every given option that has a config key into config; returns how many.
    size_t apply_to(Config& config) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    std::string program_name_;
    std::vector<Option> options_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;

    const Option* find_long(const std::string& long_name) const;
    const Option* find_short(char short_name) const;
    bool store(const Option& option, const std::string& value);
};

} // namespace chunkup::core
