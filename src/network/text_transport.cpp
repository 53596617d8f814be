#include "verifetch/network/text_transport.hpp"
#include "verifetch/common/constants.hpp"
#include "verifetch/common/logger.hpp"
#include "verifetch/common/text.hpp"

namespace verifetch {
namespace network {

StringBodyStream::StringBodyStream(std::string data)
    : data_(std::move(data)), position_(0) {
}

bool StringBodyStream::read(std::string& chunk, size_t max_bytes) {
    if (position_ >= data_.size() || max_bytes == 0) {
        chunk.clear();
        return false;
    }
    size_t count = std::min(max_bytes, data_.size() - position_);
    chunk.assign(data_, position_, count);
    position_ += count;
    return true;
}

std::unique_ptr<Response> TextTransport::send(const HttpRequest& request,
                                              const TransportOptions& /*options*/) {
    auto colon = request.url.find(':');
    if (colon == std::string::npos) {
        throw TransportError("Invalid text URL '" + request.url + "'");
    }
    std::string payload = request.url.substr(colon + 1);

    auto response = std::make_unique<Response>();
    response->headers.emplace("Content-Type", "text/plain");

    std::optional<uint64_t> start;
    auto range_it = request.headers.find("Range");
    if (range_it != request.headers.end()) {
        std::string spec = common::extractBetween(range_it->second + "\n", "bytes=", "-");
        start = common::parseUnsigned(spec);
    }

    if (start && *start > 0) {
        if (*start >= payload.size()) {
            response->status = constants::http::RANGE_NOT_SATISFIABLE;
            response->headers.emplace("Content-Range", fmt::format("bytes */{}", payload.size()));
            payload.clear();
        } else {
            response->status = constants::http::PARTIAL_CONTENT;
            response->headers.emplace("Content-Range", fmt::format(
                "bytes {}-{}/{}", *start, payload.size() - 1, payload.size()));
            payload = payload.substr(*start);
        }
    } else {
        response->status = constants::http::OK;
    }

    response->reason = reasonPhrase(response->status);
    response->headers.emplace("Content-Length", std::to_string(payload.size()));
    response->body = std::make_unique<StringBodyStream>(std::move(payload));

    common::Logger::instance().debug("[Text] Response | status={} | range_start={}",
                                     response->status, start.value_or(0));
    return response;
}

}}
