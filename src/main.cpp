#include <iostream>
#include <string>
#include <vector>
#include "ginseng/core/logger.hpp"
#include "ginseng/core/config.hpp"
#include "ginseng/core/cli.hpp"
#include "ginseng/core/utils.hpp"
#include "ginseng/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    ginseng::core::CommandLineParser parser("ginseng");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    ginseng::core::CommandRegistry command_registry;
    
    auto& args = parser.get_positional_args();
    if (parser.has_option("help") || args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }
    
    auto& config = ginseng::core::Config::instance();
    config.set_defaults();
    
    auto config_file = ginseng::core::utils::FileUtils::expand_home(parser.get_option("config"));
    if (ginseng::core::utils::FileUtils::exists(config_file) && !config.load_from_file(config_file.string())) {
        std::cerr << "Warning: could not read " << config_file.string() << "\n";
    }
    
    if (parser.has_option("output")) {
        config.set("download.directory", parser.get_option("output"));
    }
    if (parser.has_option("json")) {
        config.set("output.format", "json");
    }
    
    auto log_level = ginseng::core::parse_log_level(config.get_string("log.level", "info"));
    if (parser.has_option("verbose")) {
        log_level = ginseng::core::LogLevel::Debug;
    }
    
    auto log_file = ginseng::core::utils::FileUtils::expand_home(config.get_string("log.file", "ginseng.log"));
    ginseng::core::Logger::initialize(log_file.string(), log_level);
    
    LOG_INFO("Ginseng starting up");
    
    std::string command = args[0];
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }
    
    ginseng::core::Logger::shutdown();
    return result.exit_code;
}
