#include "verifetch/download/transfer_config.hpp"
#include "verifetch/common/constants.hpp"
#include "verifetch/common/logger.hpp"
#include "verifetch/common/text.hpp"

namespace verifetch {
namespace download {

namespace {

std::optional<uint64_t> parseSizeSetting(const std::string& value, const char* description) {
    if (value.empty()) {
        return std::nullopt;
    }
    auto parsed = common::parseBytes(value);
    if (!parsed || *parsed == 0) {
        common::Logger::instance().warn("Invalid {} ({})", description, value);
        return std::nullopt;
    }
    return parsed;
}

}

TransferConfig TransferConfig::fromSettings(const common::DownloaderSettings& settings) {
    TransferConfig config;

    config.retries = settings.retries < 0 ? constants::transfer::INFINITE_RETRIES : settings.retries;
    config.timeout_seconds = settings.timeout;
    config.verify_tls = settings.verify;
    if (!settings.proxy.empty()) {
        config.proxy = settings.proxy;
    }
    for (const auto& [name, value] : settings.headers) {
        config.headers[name] = value;
    }

    config.min_size = parseSizeSetting(settings.filesize_min, "minimum file size");
    config.max_size = parseSizeSetting(settings.filesize_max, "maximum file size");

    config.chunk_size = constants::transfer::DEFAULT_CHUNK_SIZE;
    if (!settings.chunk_size.empty()) {
        auto chunk = common::parseBytes(settings.chunk_size);
        if (chunk && *chunk > 0) {
            config.chunk_size = static_cast<size_t>(*chunk);
        } else {
            common::Logger::instance().warn("Invalid chunk size ({})", settings.chunk_size);
        }
    }

    config.rate_limit = parseSizeSetting(settings.rate, "rate limit");
    if (config.rate_limit && *config.rate_limit < config.chunk_size) {
        config.chunk_size = static_cast<size_t>(*config.rate_limit);
    }

    if (settings.progress > 0) {
        config.progress_interval = settings.progress;
    } else {
        config.progress_interval.reset();
    }

    config.adjust_extension = settings.adjust_extensions;
    config.preserve_mtime = settings.mtime;
    if (!settings.http_metadata.empty()) {
        config.metadata_field = settings.http_metadata;
    }

    return config;
}

network::TransportOptions TransferConfig::transportOptions() const {
    network::TransportOptions options;
    options.timeout_seconds = timeout_seconds;
    options.verify_tls = verify_tls;
    options.proxy = proxy;
    return options;
}

}}
