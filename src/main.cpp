#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>

#include "verifetch/common/config.hpp"
#include "verifetch/common/constants.hpp"
#include "verifetch/common/logger.hpp"
#include "cli/main_command.hpp"
#include "cli/config_command.hpp"
#include "cli/get_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{verifetch::constants::system::APPLICATION_NAME, "verifetch"};
        app.set_version_flag("--version,-v", verifetch::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        std::string log_level;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level, "DEBUG, INFO, WARN or ERROR");

        auto config_cmd = std::make_unique<verifetch::cli::ConfigCommand>();
        auto get_cmd = std::make_unique<verifetch::cli::GetCommand>();

        get_cmd->setup(app.add_subcommand("get", "Download one or more URLs"));
        config_cmd->setup(app.add_subcommand("config", "Inspect configuration"));

        CLI11_PARSE(app, argc, argv);

        auto& config = verifetch::common::Config::instance();
        if (!config.load(config_file)) {
            std::cerr << "Error: Cannot load configuration '"
                      << (config_file.empty() ? config.getConfigPath() : config_file) << "'\n";
            return 1;
        }

        if (!log_level.empty()) {
            auto level = verifetch::common::parseLogLevel(log_level);
            if (!level) {
                std::cerr << "Error: Invalid log level '" << log_level << "'\n";
                return 1;
            }
            config.global().log_level = *level;
        }

        const auto& global = config.global();
        verifetch::common::Logger::instance().initialize(
            global.log_file.empty() ? verifetch::common::LogMode::CONSOLE_ONLY
                                    : verifetch::common::LogMode::FILE_ONLY,
            global.log_file,
            global.log_level,
            global.logging
        );

        int result = 0;
        if (get_cmd->wasCalled()) {
            result = get_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            result = config_cmd->execute();
        } else {
            verifetch::cli::MainCommand().printHelp();
        }

        verifetch::common::Logger::instance().shutdown();
        return result;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
