#pragma once

#include "clock.hpp"
#include "destination.hpp"
#include "error_codes.hpp"
#include "progress.hpp"
#include "transfer_config.hpp"
#include "../network/transport.hpp"
#include <functional>
#include <optional>
#include <string>

namespace verifetch {
namespace download {

enum class ResponseDisposition {
    FULL_CONTENT,
    PARTIAL_CONTENT,
    ALREADY_COMPLETE,
    RETRYABLE,
    FATAL
};

// 200 and 206 carry content, 416 on a resumed request means the file is
// already complete, 429 and 5xx are worth retrying, everything else is not.
ResponseDisposition classifyStatus(int status, uint64_t offset);

// Total size from "bytes 0-99/100"; nullopt for "*" or garbage.
std::optional<uint64_t> parseContentRangeTotal(const std::string& content_range);

class ValidationResult {
public:
    static ValidationResult accept() { return ValidationResult(true, std::nullopt); }
    static ValidationResult reject() { return ValidationResult(false, std::nullopt); }
    static ValidationResult redirect(std::string url) { return ValidationResult(true, std::move(url)); }

    bool accepted() const { return accepted_; }
    const std::optional<std::string>& replacementUrl() const { return replacement_url_; }

private:
    ValidationResult(bool accepted, std::optional<std::string> url)
        : accepted_(accepted), replacement_url_(std::move(url)) {}

    bool accepted_;
    std::optional<std::string> replacement_url_;
};

using ResponseValidator = std::function<ValidationResult(const network::Response&)>;

struct TransferRequest {
    std::string url;
    std::string method = "GET";
    network::Headers headers;
    std::optional<std::string> body;
    // Overrides TransferConfig::adjust_extension for this request.
    std::optional<bool> adjust_extension;
    ResponseValidator validate;
};

struct TransferFailure {
    TransferErrorCode code = TransferErrorCode::NONE;
    // Reason of the last retryable failure when code is RETRIES_EXHAUSTED.
    TransferErrorCode cause = TransferErrorCode::NONE;
    std::string message;
};

// Downloads one resource into a Destination, resuming partial files,
// retrying transient failures with linear backoff and correcting the file
// extension from the content. Holds only read-only state, so one instance
// may serve concurrent downloads into independent destinations.
class ResumableTransfer {
public:
    ResumableTransfer(TransferConfig config, network::Transport& transport,
                      ProgressSink* progress = nullptr, Clock clock = Clock::system());

    // Returns true once the destination holds the complete payload (or
    // already held it). Network and protocol failures are logged and
    // reported through `failure`; local I/O errors propagate as exceptions.
    bool download(const TransferRequest& request, Destination& destination,
                  TransferFailure* failure = nullptr) const;

    const TransferConfig& config() const { return config_; }

private:
    TransferConfig config_;
    network::Transport& transport_;
    ProgressSink* progress_;
    Clock clock_;

    network::Headers buildHeaders(const TransferRequest& request, uint64_t offset) const;
};

}}
