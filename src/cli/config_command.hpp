#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace verifetch {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;

    CLI::App* get_cmd_ = nullptr;
    std::string get_key_;

    CLI::App* set_cmd_ = nullptr;
    std::string set_key_;
    std::string set_value_;

    CLI::App* show_cmd_ = nullptr;

    int executeGet();
    int executeSet();
    int executeShow();
};

}}
