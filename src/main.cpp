#include <iostream>
#include <string>
#include "chunkup/core/logger.hpp"
#include "chunkup/core/config.hpp"
#include "chunkup/core/cli.hpp"
#include "chunkup/core/utils.hpp"
#include "chunkup/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    chunkup::core::CommandLineParser parser("chunkup");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    chunkup::core::CommandRegistry command_registry;

    if (parser.has_option("help")) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = chunkup::core::Config::instance();
    config.set_defaults();

    auto config_file = chunkup::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.chunkup.conf"));
    if (chunkup::core::utils::FileUtils::exists(config_file) && !config.load_from_file(config_file.string())) {
        std::cerr << "Warning: could not read " << config_file.string() << "\n";
    }
    // Command line options override the configuration file.
    parser.apply_to(config);

    auto log_level = parser.has_option("verbose") ?
        chunkup::core::LogLevel::Debug :
        chunkup::core::parse_log_level(config.get_string("log.level", "info"));
    chunkup::core::Logger::initialize(config.get_string("log.file", "chunkup.log"), log_level);

    LOG_INFO("chunkup starting up");

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }

    chunkup::core::Logger::shutdown();
    return result.exit_code;
}
