#include "get_command.hpp"
#include "verifetch/common/logger.hpp"
#include "verifetch/common/progress_bar.hpp"
#include "verifetch/common/text.hpp"
#include "verifetch/network/transport.hpp"
#include <nlohmann/json.hpp>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace verifetch {
namespace cli {

namespace {

class ConsoleProgress : public download::ProgressSink {
public:
    void onStart(const std::string& path) override {
        bar_ = std::make_unique<common::ProgressBarRenderer>(
            std::filesystem::path(path).filename().string());
    }

    void onProgress(std::optional<uint64_t> total, uint64_t downloaded, uint64_t bytes_per_sec) override {
        if (!bar_) {
            return;
        }
        bar_->update(total, downloaded, bytes_per_sec);
        bar_->render(std::cerr);
    }

    void finish() {
        if (bar_) {
            bar_->complete();
            bar_->render(std::cerr);
        }
    }

private:
    std::unique_ptr<common::ProgressBarRenderer> bar_;
};

}

GetCommand::GetCommand() : was_called_(false) {}

void GetCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("urls", urls_, "URLs to download")->required();

    subcommand->add_option("-d,--directory", directory_,
                           "Target directory (default: global.base_directory)");
    subcommand->add_option("-f,--filename", filename_,
                           "Filename without extension (single URL only)");
    subcommand->add_option("-e,--extension", extension_,
                           "Filename extension; inferred from the response when empty");
    retries_option_ = subcommand->add_option("-r,--retries", retries_,
                                             "Retry budget, negative for infinite");
    timeout_option_ = subcommand->add_option("--timeout", timeout_,
                                             "Connection and read timeout in seconds")
                                 ->check(CLI::PositiveNumber);
    subcommand->add_option("--rate", rate_, "Maximum download rate, e.g. 500k or 2M");
    subcommand->add_option("--filesize-min", filesize_min_, "Skip files smaller than this");
    subcommand->add_option("--filesize-max", filesize_max_, "Skip files larger than this");
    subcommand->add_option("--chunk-size", chunk_size_, "Read size per chunk");
    subcommand->add_option("--proxy", proxy_, "HTTP proxy, host:port or URL");
    subcommand->add_option("-H,--header", headers_, "Extra request header 'Name: value'")
              ->allow_extra_args(false);
    subcommand->add_option("--http-metadata", http_metadata_,
                           "Store response header metadata under this field");
    subcommand->add_option("-j,--jobs", jobs_, "Concurrent downloads")
              ->check(CLI::Range(1, 64));

    subcommand->add_flag("--no-part", no_part_, "Write directly to the target file");
    subcommand->add_flag("--no-mtime", no_mtime_, "Do not apply Last-Modified to the file");
    subcommand->add_flag("--no-adjust-extensions", no_adjust_extensions_,
                         "Keep the extension even if the content says otherwise");
    subcommand->add_flag("--no-check-certificate", no_check_certificate_,
                         "Disable TLS certificate verification");
    subcommand->add_flag("--content-disposition", content_disposition_,
                         "Name files after the Content-Disposition header");
    subcommand->add_flag("--write-metadata", write_metadata_,
                         "Write '<file>.json' next to every download");
    subcommand->add_flag("-q,--quiet", quiet_, "Quiet mode");

    subcommand->callback([this]() { was_called_ = true; });
}

bool GetCommand::wasCalled() const {
    return was_called_;
}

bool GetCommand::validateArguments() const {
    if (!filename_.empty() && urls_.size() > 1) {
        std::cerr << "Error: --filename can only be used with a single URL\n";
        return false;
    }

    for (const auto& header : headers_) {
        if (header.find(':') == std::string::npos) {
            std::cerr << "Error: Invalid header '" << header << "', expected 'Name: value'\n";
            return false;
        }
    }

    for (const auto& url : urls_) {
        if (!network::SchemeTransport::isSupported(url)) {
            std::cerr << "Error: Unsupported URL '" << url << "'\n";
            return false;
        }
    }
    return true;
}

common::DownloaderSettings GetCommand::buildSettings() const {
    common::DownloaderSettings settings = common::Config::instance().global().downloader;

    if (retries_option_ && retries_option_->count() > 0) settings.retries = retries_;
    if (timeout_option_ && timeout_option_->count() > 0) settings.timeout = timeout_;
    if (!rate_.empty()) settings.rate = rate_;
    if (!filesize_min_.empty()) settings.filesize_min = filesize_min_;
    if (!filesize_max_.empty()) settings.filesize_max = filesize_max_;
    if (!chunk_size_.empty()) settings.chunk_size = chunk_size_;
    if (!proxy_.empty()) settings.proxy = proxy_;
    if (!http_metadata_.empty()) settings.http_metadata = http_metadata_;
    if (no_part_) settings.part = false;
    if (no_mtime_) settings.mtime = false;
    if (no_adjust_extensions_) settings.adjust_extensions = false;
    if (no_check_certificate_) settings.verify = false;
    if (quiet_) settings.progress = 0.0;

    // Content-Disposition naming needs the header metadata.
    if (content_disposition_ && settings.http_metadata.empty()) {
        settings.http_metadata = "http";
    }

    for (const auto& header : headers_) {
        auto colon = header.find(':');
        settings.headers[common::trim(header.substr(0, colon))] = common::trim(header.substr(colon + 1));
    }

    return settings;
}

download::FileDestinationOptions GetCommand::destinationOptions(
        const std::string& url, size_t index, const common::DownloaderSettings& settings) const {
    download::FileDestinationOptions options;

    std::string directory = directory_.empty() ? common::Config::instance().global().base_directory : directory_;
    options.directory = directory.empty() ? "." : directory;
    options.part = settings.part;
    options.part_directory = settings.part_directory;
    options.use_header_filename = content_disposition_;

    auto [stem, extension] = download::filenameFromUrl(url);
    if (network::urlScheme(url) == "text" || stem.empty()) {
        stem = urls_.size() > 1 ? fmt::format("download_{}", index + 1) : "download";
        extension.clear();
    }

    options.filename = filename_.empty() ? stem : filename_;
    options.extension = extension_.empty() ? extension : extension_;
    return options;
}

int GetCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }

    auto settings = buildSettings();
    auto config = download::TransferConfig::fromSettings(settings);

    int jobs = jobs_ > 0 ? jobs_ : std::max(1, common::Config::instance().global().jobs);
    bool show_progress = !quiet_ && jobs == 1 && isatty(STDERR_FILENO);
    if (!show_progress) {
        config.progress_interval.reset();
    }

    common::Logger::instance().debug("[Get] Starting | urls={} | jobs={} | retries={}",
                                     urls_.size(), jobs, config.retries);

    network::SchemeTransport transport;
    std::vector<char> results(urls_.size(), 0);

    if (jobs == 1 || urls_.size() == 1) {
        for (size_t i = 0; i < urls_.size(); ++i) {
            results[i] = downloadOne(urls_[i], i, config, transport, show_progress, settings);
        }
    } else {
        tbb::task_arena arena(jobs);
        arena.execute([&] {
            tbb::parallel_for(size_t(0), urls_.size(), [&](size_t i) {
                results[i] = downloadOne(urls_[i], i, config, transport, false, settings);
            });
        });
    }

    size_t failed = std::count(results.begin(), results.end(), 0);
    common::Logger::instance().debug("[Get] Complete | success={} | failed={}",
                                     urls_.size() - failed, failed);
    return failed == 0 ? 0 : 1;
}

bool GetCommand::downloadOne(const std::string& url, size_t index, const download::TransferConfig& config,
                             network::Transport& transport, bool show_progress,
                             const common::DownloaderSettings& settings) {
    auto& log = common::Logger::instance();

    try {
        download::FileDestination destination(destinationOptions(url, index, settings));

        ConsoleProgress progress;
        download::ResumableTransfer transfer(config, transport, show_progress ? &progress : nullptr);

        download::TransferRequest request;
        request.url = url;

        download::TransferFailure failure;
        bool success = transfer.download(request, destination, &failure);
        progress.finish();

        if (!success) {
            log.error("[Get] Download failed | url={} | code={} | reason={}", url,
                      download::TransferErrorCodeHelper::toString(failure.code), failure.message);
            return false;
        }

        destination.finalize();
        if (write_metadata_ && !destination.isPresent()) {
            writeMetadataFile(url, destination);
        }
        report(destination);
        return true;

    } catch (const std::exception& e) {
        log.error("[Get] Download failed | url={} | error={}", url, e.what());
        return false;
    }
}

void GetCommand::writeMetadataFile(const std::string& url, const download::FileDestination& destination) const {
    nlohmann::json json;
    json["url"] = url;
    json["path"] = destination.path();
    json["extension"] = destination.extension();

    std::error_code ec;
    auto size = std::filesystem::file_size(destination.realPath(), ec);
    json["size"] = ec ? nlohmann::json(nullptr) : nlohmann::json(static_cast<uint64_t>(size));

    if (destination.desiredMtime()) {
        json["mtime"] = *destination.desiredMtime();
    } else {
        json["mtime"] = nullptr;
    }

    nlohmann::json metadata = nlohmann::json::object();
    for (const auto& [field, values] : destination.metadata()) {
        metadata[field] = values;
    }
    json["metadata"] = metadata;

    std::string metadata_path = destination.path() + ".json";
    std::ofstream out(metadata_path);
    if (!out) {
        throw std::runtime_error("Cannot write metadata file '" + metadata_path + "'");
    }
    out << json.dump(4) << "\n";

    common::Logger::instance().debug("[Get] Metadata written | path={}", metadata_path);
}

void GetCommand::report(const download::FileDestination& destination) {
    if (quiet_) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (destination.isPresent()) {
        std::cout << "# " << destination.path() << "\n";
    } else {
        std::cout << destination.path() << "\n";
    }
}

}}
