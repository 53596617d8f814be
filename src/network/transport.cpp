#include "verifetch/network/transport.hpp"
#include "verifetch/network/http_transport.hpp"
#include "verifetch/network/text_transport.hpp"
#include "verifetch/common/text.hpp"

namespace verifetch {
namespace network {

std::string urlScheme(const std::string& url) {
    auto pos = url.find(':');
    if (pos == std::string::npos) {
        return "";
    }
    return common::toLower(url.substr(0, pos));
}

SchemeTransport::SchemeTransport()
    : http_(std::make_unique<HttpTransport>()),
      text_(std::make_unique<TextTransport>()) {
}

SchemeTransport::~SchemeTransport() = default;

std::unique_ptr<Response> SchemeTransport::send(const HttpRequest& request,
                                                const TransportOptions& options) {
    std::string scheme = urlScheme(request.url);
    if (scheme == "http" || scheme == "https") {
        return http_->send(request, options);
    }
    if (scheme == "text") {
        return text_->send(request, options);
    }
    throw TransportError("Unsupported URL scheme '" + scheme + "' in '" + request.url + "'");
}

bool SchemeTransport::isSupported(const std::string& url) {
    std::string scheme = urlScheme(url);
    return scheme == "http" || scheme == "https" || scheme == "text";
}

}}
