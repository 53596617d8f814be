#pragma once

#include "main_command.hpp"
#include "verifetch/common/config.hpp"
#include "verifetch/download/file_destination.hpp"
#include "verifetch/download/transfer.hpp"
#include <CLI/CLI.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace verifetch {
namespace cli {

class GetCommand : public MainCommand {
public:
    GetCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    bool validateArguments() const override;
    int execute();

private:
    bool was_called_;

    std::vector<std::string> urls_;
    std::string directory_;
    std::string filename_;
    std::string extension_;
    int retries_ = 0;
    double timeout_ = 0.0;
    CLI::Option* retries_option_ = nullptr;
    CLI::Option* timeout_option_ = nullptr;
    std::string rate_;
    std::string filesize_min_;
    std::string filesize_max_;
    std::string chunk_size_;
    std::string proxy_;
    std::string http_metadata_;
    std::vector<std::string> headers_;
    int jobs_ = 0;
    bool no_part_ = false;
    bool no_mtime_ = false;
    bool no_adjust_extensions_ = false;
    bool no_check_certificate_ = false;
    bool content_disposition_ = false;
    bool write_metadata_ = false;
    bool quiet_ = false;

    std::mutex output_mutex_;

    common::DownloaderSettings buildSettings() const;
    download::FileDestinationOptions destinationOptions(const std::string& url, size_t index,
                                                        const common::DownloaderSettings& settings) const;
    bool downloadOne(const std::string& url, size_t index, const download::TransferConfig& config,
                     network::Transport& transport, bool show_progress,
                     const common::DownloaderSettings& settings);
    void writeMetadataFile(const std::string& url, const download::FileDestination& destination) const;
    void report(const download::FileDestination& destination);
};

}}
