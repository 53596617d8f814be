#include "main_command.hpp"
#include "verifetch/common/constants.hpp"
#include <iostream>

namespace verifetch {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

void MainCommand::printHelp() const {
    std::cout << constants::system::APPLICATION_NAME << " - Resumable, verified file downloads\n\n";
    std::cout << "Usage: verifetch [OPTIONS] COMMAND [ARGS]...\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config PATH    Configuration file path\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version information\n\n";
    std::cout << "Commands:\n";
    std::cout << "  get                 Download one or more URLs\n";
    std::cout << "  config              Inspect configuration\n\n";
    std::cout << "Examples:\n";
    std::cout << "  verifetch get https://example.org/image.jpg -d downloads\n";
    std::cout << "  verifetch get --rate 500k -r 10 https://example.org/archive.zip\n";
    std::cout << "  verifetch config get downloader.retries\n";
    std::cout << "  verifetch config set downloader.rate 2M\n";
}

}}
