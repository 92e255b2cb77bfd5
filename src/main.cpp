#include <iostream>
#include <string>
#include <vector>
#include "chunkflow/core/logger.hpp"
#include "chunkflow/core/config.hpp"
#include "chunkflow/core/cli.hpp"
#include "chunkflow/core/utils.hpp"
#include "chunkflow/core/command_registry.hpp"
#include "chunkflow/transfer/transfer_types.hpp"

int main(int argc, char* argv[]) {
    chunkflow::core::CommandLineParser parser("chunkflow");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = chunkflow::core::Config::instance();
    config.set_defaults();
    
    auto config_file = chunkflow::core::utils::FileUtils::expand_home(
        parser.get_option("config", "~/.chunkflow.conf"));
    if (chunkflow::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Warning: could not read " << config_file << "\n";
        }
    }
    
    // Command line overrides the config file
    if (auto rate = parser.get_uint64_option("rate")) {
        if (*rate < chunkflow::transfer::MIN_CHUNK_SIZE) {
            std::cerr << "Error: --rate must be at least " << chunkflow::transfer::MIN_CHUNK_SIZE
                      << " bytes/s\n";
            return 1;
        }
        config.set("broadcaster.max_bytes_per_sec", std::to_string(*rate));
    }
    if (auto priority = parser.get_uint64_option("priority")) {
        config.set("scheduler.default_priority", std::to_string(*priority));
    }
    
    auto log_level = parser.has_option("verbose") ?
        chunkflow::core::LogLevel::Debug :
        chunkflow::core::Logger::parse_level(config.get_string("log.level", "info"));
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        return 0;
    }
    
    chunkflow::core::Logger::initialize(config.get_string("log.file", "chunkflow.log"), log_level);
    LOG_INFO("ChunkFlow starting up");
    
    chunkflow::core::CommandRegistry command_registry;
    auto result = command_registry.execute_command(args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(args[0])) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }
    
    chunkflow::core::Logger::shutdown();
    return result.exit_code;
}
