#pragma once

#include "../common/config.hpp"
#include "../network/types.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace verifetch {
namespace download {

struct TransferConfig {
    int retries = 4;
    double timeout_seconds = 30.0;
    bool verify_tls = true;
    std::optional<std::string> proxy;
    network::Headers headers;
    std::optional<uint64_t> rate_limit;
    std::optional<double> progress_interval = 3.0;
    std::optional<uint64_t> min_size;
    std::optional<uint64_t> max_size;
    bool adjust_extension = true;
    size_t chunk_size = 32768;
    bool preserve_mtime = true;
    std::optional<std::string> metadata_field;

    bool unlimitedRetries() const { return retries < 0; }

    // Validates the human-readable values of a config file section. Invalid
    // sizes and rates are logged and dropped, an invalid chunk size falls
    // back to the default, and a rate below the chunk size lowers it.
    static TransferConfig fromSettings(const common::DownloaderSettings& settings);

    network::TransportOptions transportOptions() const;
};

}}
