#include "verifetch/download/transfer.hpp"
#include "verifetch/download/byte_budget.hpp"
#include "verifetch/download/metadata.hpp"
#include "verifetch/download/signature_registry.hpp"
#include "verifetch/download/throttled_copier.hpp"
#include "verifetch/common/constants.hpp"
#include "verifetch/common/logger.hpp"
#include "verifetch/common/text.hpp"
#include <stdexcept>

namespace verifetch {
namespace download {

namespace {

// Removes what a failed transfer wrote unless the destination keeps partial
// files for a later resume.
class IncompleteFileGuard {
public:
    explicit IncompleteFileGuard(Destination& destination) : destination_(destination) {}

    ~IncompleteFileGuard() {
        if (writing_ && !completed_ && !destination_.supportsPartial()) {
            destination_.removeIncomplete();
        }
    }

    IncompleteFileGuard(const IncompleteFileGuard&) = delete;
    IncompleteFileGuard& operator=(const IncompleteFileGuard&) = delete;

    void writingStarted() { writing_ = true; }
    void complete() { completed_ = true; }

private:
    Destination& destination_;
    bool writing_ = false;
    bool completed_ = false;
};

void writeHeader(std::iostream& file, const std::string& header) {
    file.write(header.data(), static_cast<std::streamsize>(header.size()));
    if (!file) {
        throw std::runtime_error("Write to destination failed");
    }
}

}

ResponseDisposition classifyStatus(int status, uint64_t offset) {
    if (status == constants::http::OK) {
        return ResponseDisposition::FULL_CONTENT;
    }
    if (status == constants::http::PARTIAL_CONTENT) {
        return ResponseDisposition::PARTIAL_CONTENT;
    }
    if (status == constants::http::RANGE_NOT_SATISFIABLE && offset > 0) {
        return ResponseDisposition::ALREADY_COMPLETE;
    }
    if (status == constants::http::TOO_MANY_REQUESTS || (status >= 500 && status < 600)) {
        return ResponseDisposition::RETRYABLE;
    }
    return ResponseDisposition::FATAL;
}

std::optional<uint64_t> parseContentRangeTotal(const std::string& content_range) {
    auto slash = content_range.rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    return common::parseUnsigned(common::trim(content_range.substr(slash + 1)));
}

ResumableTransfer::ResumableTransfer(TransferConfig config, network::Transport& transport,
                                     ProgressSink* progress, Clock clock)
    : config_(std::move(config)), transport_(transport), progress_(progress), clock_(std::move(clock)) {
}

network::Headers ResumableTransfer::buildHeaders(const TransferRequest& request, uint64_t offset) const {
    network::Headers headers{{"Accept", "*/*"}};
    for (const auto& [name, value] : request.headers) {
        headers[name] = value;
    }
    for (const auto& [name, value] : config_.headers) {
        headers[name] = value;
    }
    if (offset > 0) {
        headers["Range"] = fmt::format("bytes={}-", offset);
    }
    return headers;
}

bool ResumableTransfer::download(const TransferRequest& request, Destination& destination,
                                 TransferFailure* failure) const {
    auto& log = common::Logger::instance();
    IncompleteFileGuard guard(destination);

    const bool adjust = request.adjust_extension.value_or(config_.adjust_extension);
    const std::string attempts_allowed =
        config_.unlimitedRetries() ? "inf" : std::to_string(config_.retries + 1);

    CopyOptions copy_options;
    copy_options.chunk_size = config_.chunk_size;
    copy_options.rate_limit = config_.rate_limit;
    copy_options.progress_interval = config_.progress_interval;
    ThrottledCopier copier(copy_options, progress_, clock_);

    auto fail = [failure](TransferErrorCode code, TransferErrorCode cause, const std::string& text) {
        if (failure) {
            failure->code = code;
            failure->cause = cause;
            failure->message = text;
        }
        return false;
    };
    auto succeed = [&guard, failure]() {
        guard.complete();
        if (failure) {
            *failure = TransferFailure{};
        }
        return true;
    };

    std::string url = request.url;
    std::string message;
    TransferErrorCode cause = TransferErrorCode::NONE;
    std::optional<std::string> last_modified;
    int tries = 0;
    bool backoff = true;

    while (true) {
        if (tries && backoff) {
            log.warn("{} ({}/{})", message, tries, attempts_allowed);
            if (!config_.unlimitedRetries() && tries > config_.retries) {
                return fail(TransferErrorCode::RETRIES_EXHAUSTED, cause, message);
            }
            clock_.sleep(static_cast<double>(tries));
        }
        backoff = true;
        tries++;

        const uint64_t part_size = destination.partSize();
        uint64_t offset = part_size;

        network::HttpRequest http_request;
        http_request.method = request.method;
        http_request.url = url;
        http_request.headers = buildHeaders(request, part_size);
        http_request.body = request.body;

        log.debug("[Transfer] Attempt | url={} | try={} | offset={}", url, tries, part_size);

        std::unique_ptr<network::Response> response;
        try {
            response = transport_.send(http_request, config_.transportOptions());
        } catch (const network::ConnectionError& e) {
            message = e.what();
            cause = TransferErrorCode::CONNECTION_FAILED;
            continue;
        } catch (const std::exception& e) {
            log.warn("{}", e.what());
            return fail(TransferErrorCode::TRANSPORT_FAILED, TransferErrorCode::NONE, e.what());
        }

        last_modified = response->header("Last-Modified");

        std::optional<uint64_t> size;
        bool already_complete = false;
        switch (classifyStatus(response->status, part_size)) {
            case ResponseDisposition::FULL_CONTENT:
                offset = 0;
                if (auto length = response->header("Content-Length")) {
                    size = common::parseUnsigned(common::trim(*length));
                }
                break;
            case ResponseDisposition::PARTIAL_CONTENT:
                if (auto range = response->header("Content-Range")) {
                    size = parseContentRangeTotal(*range);
                }
                break;
            case ResponseDisposition::ALREADY_COMPLETE:
                log.debug("[Transfer] Range not satisfiable, file complete | offset={}", part_size);
                already_complete = true;
                break;
            case ResponseDisposition::RETRYABLE:
                message = fmt::format("'{} {}' for '{}'", response->status, response->reason, url);
                cause = TransferErrorCode::HTTP_STATUS;
                continue;
            case ResponseDisposition::FATAL:
                message = fmt::format("'{} {}' for '{}'", response->status, response->reason, url);
                log.warn("{}", message);
                return fail(TransferErrorCode::HTTP_STATUS, TransferErrorCode::NONE, message);
        }
        if (already_complete) {
            break;
        }

        if (request.validate) {
            ValidationResult result = request.validate(*response);
            if (result.replacementUrl()) {
                log.debug("[Transfer] Validation redirect | from={} | to={}", url, *result.replacementUrl());
                url = *result.replacementUrl();
                tries--;
                backoff = false;
                continue;
            }
            if (!result.accepted()) {
                log.warn("Invalid response");
                return fail(TransferErrorCode::VALIDATION_REJECTED, TransferErrorCode::NONE, "Invalid response");
            }
        }

        switch (ByteBudgetGuard::evaluate(size, config_.min_size, config_.max_size)) {
            case BudgetVerdict::BELOW_MINIMUM:
                message = fmt::format("File size smaller than allowed minimum ({} < {})", *size, *config_.min_size);
                log.warn("{}", message);
                return fail(TransferErrorCode::SIZE_BELOW_MINIMUM, TransferErrorCode::NONE, message);
            case BudgetVerdict::ABOVE_MAXIMUM:
                message = fmt::format("File size larger than allowed maximum ({} > {})", *size, *config_.max_size);
                log.warn("{}", message);
                return fail(TransferErrorCode::SIZE_ABOVE_MAXIMUM, TransferErrorCode::NONE, message);
            case BudgetVerdict::WITHIN:
                break;
        }

        if (destination.extension().empty()) {
            destination.setExtension(SignatureRegistry::inferExtensionFromMime(
                response->header("Content-Type").value_or(constants::transfer::DEFAULT_CONTENT_TYPE)));
            if (destination.exists()) {
                destination.markPresent();
                return succeed();
            }
        }

        if (config_.metadata_field) {
            destination.setMetadata(*config_.metadata_field, extractMetadata(*response));
            destination.buildPath();
            if (destination.exists()) {
                destination.markPresent();
                return succeed();
            }
        }

        std::string file_header;
        if (adjust && offset == 0 && SignatureRegistry::hasSignature(destination.extension())) {
            size_t peek_size = response->isChunked() ? config_.chunk_size
                                                     : constants::transfer::SIGNATURE_HEADER_SIZE;
            try {
                response->body->read(file_header, peek_size);
            } catch (const network::StreamError& e) {
                message = e.what();
                cause = TransferErrorCode::STREAM_INTERRUPTED;
                continue;
            }
            if (adjustExtension(destination, file_header) && destination.exists()) {
                destination.markPresent();
                return succeed();
            }
        }

        if (offset == 0) {
            if (part_size) {
                log.debug("Unable to resume partial download");
            }
        } else {
            log.debug("Resuming download at byte {}", offset);
        }

        guard.writingStarted();
        auto file = destination.open(offset == 0 ? OpenMode::TRUNCATE_CREATE : OpenMode::UPDATE);

        if (!file_header.empty()) {
            writeHeader(*file, file_header);
            offset += file_header.size();
        } else if (offset) {
            if (adjust && SignatureRegistry::hasSignature(destination.extension())) {
                std::string existing(constants::transfer::SIGNATURE_HEADER_SIZE, '\0');
                file->read(&existing[0], static_cast<std::streamsize>(existing.size()));
                existing.resize(static_cast<size_t>(file->gcount()));
                file->clear();
                adjustExtension(destination, existing);
            }
            file->seekg(static_cast<std::streamoff>(offset));
            file->seekp(static_cast<std::streamoff>(offset));
        }

        if (progress_) {
            progress_->onStart(destination.path());
        }

        try {
            copier.copy(*file, *response->body, size, offset);
        } catch (const network::StreamError& e) {
            message = e.what();
            cause = TransferErrorCode::STREAM_INTERRUPTED;
            continue;
        }

        file->flush();
        auto position = file->tellp();
        if (position < 0) {
            throw std::runtime_error("Cannot determine size of '" + destination.path() + "'");
        }
        if (size && static_cast<uint64_t>(position) < *size) {
            message = fmt::format("file size mismatch ({} < {})", static_cast<uint64_t>(position), *size);
            cause = TransferErrorCode::SIZE_MISMATCH;
            continue;
        }

        break;
    }

    if (config_.preserve_mtime) {
        if (!destination.desiredMtime()) {
            destination.setDesiredMtime(last_modified);
        }
    } else {
        destination.setDesiredMtime(std::nullopt);
    }

    log.debug("[Transfer] Complete | url={} | path={}", url, destination.path());
    return succeed();
}

}}
