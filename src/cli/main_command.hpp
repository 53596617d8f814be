#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace verifetch {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual bool validateArguments() const;
    void printHelp() const;

protected:
    CLI::App* subcommand_ = nullptr;
};

}}
