#pragma once

#include "types.hpp"
#include <memory>
#include <string>

namespace verifetch {
namespace network {

class Transport {
public:
    virtual ~Transport() = default;

    // Issues `request` and returns once the status line and headers are in.
    // Throws ConnectionError for retryable connect/timeout failures and
    // TransportError for everything else.
    virtual std::unique_ptr<Response> send(const HttpRequest& request,
                                           const TransportOptions& options) = 0;
};

// Routes requests to HttpTransport or TextTransport by URL scheme.
class SchemeTransport : public Transport {
public:
    SchemeTransport();
    ~SchemeTransport() override;

    std::unique_ptr<Response> send(const HttpRequest& request,
                                   const TransportOptions& options) override;

    static bool isSupported(const std::string& url);

private:
    std::unique_ptr<Transport> http_;
    std::unique_ptr<Transport> text_;
};

std::string urlScheme(const std::string& url);

}}
