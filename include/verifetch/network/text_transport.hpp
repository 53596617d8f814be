#pragma once

#include "transport.hpp"

namespace verifetch {
namespace network {

// Serves `text:<payload>` URLs from the URL itself. Honours `Range: bytes=N-`
// so partially written text files resume like HTTP downloads.
class TextTransport : public Transport {
public:
    std::unique_ptr<Response> send(const HttpRequest& request,
                                   const TransportOptions& options) override;
};

// Body stream over an in-memory string.
class StringBodyStream : public BodyStream {
public:
    explicit StringBodyStream(std::string data);

    bool read(std::string& chunk, size_t max_bytes) override;

private:
    std::string data_;
    size_t position_;
};

}}
