#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/config.hpp"
#include "chunkvault/core/cli.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/core/command_registry.hpp"
#include "chunkvault/crypto/random.hpp"
#include "chunkvault/storage/storage_config.hpp"

int main(int argc, char* argv[]) {
    chunkvault::core::Invocation invocation;
    try {
        invocation = chunkvault::core::CommandLine::parse(argc, argv);
    } catch (const chunkvault::core::ValidationError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        chunkvault::core::CommandLine::print_usage(std::cerr);
        return 1;
    }
    
    if (invocation.show_help) {
        chunkvault::core::CommandLine::print_usage(std::cout);
        return 0;
    }
    
    if (invocation.show_version) {
        chunkvault::core::CommandLine::print_version(std::cout);
        return 0;
    }
    
    auto& config = chunkvault::core::Config::instance();
    config.set_defaults();
    
    chunkvault::storage::StorageConfig storage_config;
    try {
        if (chunkvault::core::utils::FileUtils::exists(invocation.config_path)) {
            config.load_from_file(invocation.config_path);
        }
        for (const auto& [key, value] : invocation.overrides) {
            config.set(key, value);
        }
        if (invocation.data_dir) {
            config.set("storage.base_dir", *invocation.data_dir);
        }
        storage_config = chunkvault::storage::StorageConfig::from_config(config);
    } catch (const chunkvault::core::UploadError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    
    auto log_level = invocation.verbose ?
        chunkvault::core::LogLevel::Debug :
        chunkvault::core::Logger::parse_level(config.get_string("log.level", "info"));
    chunkvault::core::Logger::initialize(config.get_string("log.file", "chunkvault.log"), log_level);
    
    for (const auto& key : config.unknown_keys()) {
        LOG_WARN("Ignoring unknown setting '{}'", key);
    }
    
    if (!chunkvault::crypto::SecureRandom::initialize()) {
        std::cerr << "Error: failed to initialize libsodium\n";
        return 1;
    }
    
    auto context = std::make_shared<chunkvault::core::ServiceContext>(storage_config);
    chunkvault::core::CommandRegistry command_registry(context);
    
    if (invocation.command.empty()) {
        chunkvault::core::CommandLine::print_usage(std::cout);
        command_registry.print_help();
        return 0;
    }
    
    LOG_DEBUG("Running '{}' against {}", invocation.command, storage_config.base_directory.string());
    
    auto result = command_registry.execute_command(invocation.command, invocation.args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(invocation.command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }
    
    chunkvault::core::Logger::shutdown();
    return result.exit_code;
}
