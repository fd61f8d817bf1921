#include "chunkup/core/cli.hpp"
#include <charconv>
#include <iostream>
#include <iomanip>

namespace chunkup::core {

namespace {
    std::optional<std::uint64_t> parse_number(const std::string& value) {
        std::uint64_t result = 0;
        auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
        if (value.empty() || ec != std::errc() || end != value.data() + value.size()) {
            return std::nullopt;
        }
        return result;
    }
}

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {

    add_option({'h', "help", "Show this help message", ValueKind::FLAG, "", ""});
    add_option({'v', "version", "Show version information", ValueKind::FLAG, "", ""});
    add_option({'c', "config", "Configuration file path", ValueKind::TEXT, "", "~/.chunkup.conf"});
    add_option({'\0', "verbose", "Enable debug logging", ValueKind::FLAG, "", ""});
    add_option({'\0', "host", "Upload server address", ValueKind::TEXT, "server.host", ""});
    add_option({'p', "port", "Upload server port", ValueKind::NUMBER, "server.port", ""});
    add_option({'j', "concurrency", "Chunks in flight per upload", ValueKind::NUMBER, "upload.concurrency", ""});
    add_option({'\0', "chunk-size", "Chunk size in bytes for new uploads", ValueKind::NUMBER, "upload.chunk_size", ""});
    add_option({'\0', "store", "Session database path", ValueKind::TEXT, "store.path", ""});
    add_option({'t', "type", "MIME type of the uploaded file", ValueKind::TEXT, "upload.type", ""});
    add_option({'m', "mode", "Processing mode (fast, balanced, precision)", ValueKind::TEXT, "upload.mode", ""});
}

void CommandLineParser::add_option(Option option) {
    for (auto& existing : options_) {
        if (existing.long_name == option.long_name) {
            existing = std::move(option);
            return;
        }
    }
    options_.push_back(std::move(option));
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    positional_args_.clear();
    error_.clear();

    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

            const Option* option = find_long(name);
            if (!option) {
                error_ = "Unknown option: --" + name;
                return false;
            }

            if (option->kind == ValueKind::FLAG) {
                if (eq_pos != std::string::npos) {
                    error_ = "Option --" + name + " does not take a value";
                    return false;
                }
                values_[name] = "true";
            } else if (eq_pos != std::string::npos) {
                if (!store(*option, arg.substr(eq_pos + 1))) return false;
            } else if (i + 1 < argc) {
                if (!store(*option, argv[++i])) return false;
            } else {
                error_ = "Option --" + name + " requires a value";
                return false;
            }
            continue;
        }

        for (size_t j = 1; j < arg.size(); ++j) {
            const Option* option = find_short(arg[j]);
            if (!option) {
                error_ = std::string("Unknown option: -") + arg[j];
                return false;
            }

            if (option->kind == ValueKind::FLAG) {
                values_[option->long_name] = "true";
                continue;
            }

            if (j + 1 < arg.size()) {
                if (!store(*option, arg.substr(j + 1))) return false;
            } else if (i + 1 < argc) {
                if (!store(*option, argv[++i])) return false;
            } else {
                error_ = std::string("Option -") + arg[j] + " requires a value";
                return false;
            }
            break;
        }
    }

    return true;
}

bool CommandLineParser::store(const Option& option, const std::string& value) {
    if (option.kind == ValueKind::NUMBER && !parse_number(value)) {
        error_ = "Option --" + option.long_name + " expects a number, got '" + value + "'";
        return false;
    }
    values_[option.long_name] = value;
    return true;
}

bool CommandLineParser::has_option(const std::string& long_name) const {
    return values_.count(long_name) > 0;
}

std::string CommandLineParser::get_option(const std::string& long_name, const std::string& default_value) const {
    auto it = values_.find(long_name);
    if (it != values_.end()) {
        return it->second;
    }

    const Option* option = find_long(long_name);
    if (option && !option->default_value.empty()) {
        return option->default_value;
    }
    return default_value;
}

std::optional<std::uint64_t> CommandLineParser::get_number_option(const std::string& long_name) const {
    auto it = values_.find(long_name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return parse_number(it->second);
}

size_t CommandLineParser::apply_to(Config& config) const {
    size_t applied = 0;
    for (const auto& option : options_) {
        if (option.config_key.empty()) continue;

        auto it = values_.find(option.long_name);
        if (it != values_.end()) {
            config.set(option.config_key, it->second);
            ++applied;
        }
    }
    return applied;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& option : options_) {
        std::string flags = option.short_name != '\0'
            ? std::string("-") + option.short_name + ", --" + option.long_name
            : "    --" + option.long_name;
        if (option.kind != ValueKind::FLAG) {
            flags += option.kind == ValueKind::NUMBER ? " <n>" : " <value>";
        }

        std::cout << "  " << std::left << std::setw(26) << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 0.1.0\n";
    std::cout << "Built with C++20\n";
}

const CommandLineParser::Option* CommandLineParser::find_long(const std::string& long_name) const {
    for (const auto& option : options_) {
        if (option.long_name == long_name) return &option;
    }
    return nullptr;
}

const CommandLineParser::Option* CommandLineParser::find_short(char short_name) const {
    if (short_name == '\0') return nullptr;
    for (const auto& option : options_) {
        if (option.short_name == short_name) return &option;
    }
    return nullptr;
}

} // namespace chunkup::core
