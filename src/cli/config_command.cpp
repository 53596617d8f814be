#include "config_command.hpp"
#include "verifetch/common/config.hpp"
#include <iostream>
#include <iomanip>

namespace verifetch {
namespace cli {

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key, e.g. downloader.retries")->required();
    get_cmd_->callback([this]() { was_called_ = true; });

    set_cmd_ = subcommand->add_subcommand("set", "Set configuration value and save it");
    set_cmd_->add_option("key", set_key_, "Configuration key, e.g. downloader.rate")->required();
    set_cmd_->add_option("value", set_value_, "New value")->required();
    set_cmd_->callback([this]() { was_called_ = true; });

    show_cmd_ = subcommand->add_subcommand("show", "Show effective configuration");
    show_cmd_->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_;
}

int ConfigCommand::execute() {
    if (get_cmd_->parsed()) {
        return executeGet();
    } else if (set_cmd_->parsed()) {
        return executeSet();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    }

    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeGet() {
    auto value = common::Config::instance().getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown configuration key: " << get_key_ << "\n";
        return 1;
    }
    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();

    try {
        config.setValue(set_key_, set_value_);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!config.save()) {
        std::cerr << "Failed to save configuration.\n";
        return 1;
    }

    std::cout << "Configuration updated: " << set_key_ << " = " << set_value_
              << " (" << config.getConfigPath() << ")\n";
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();

    std::string path = config.getConfigPath();
    std::cout << "# " << (path.empty() ? "built-in defaults" : path) << "\n";

    for (const auto& key : config.keys()) {
        auto value = config.getValue(key);
        std::cout << std::left << std::setw(32) << key << " = " << value.value_or("") << "\n";
    }
    return 0;
}

}}
