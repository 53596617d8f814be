#pragma once

#include <string>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace verifetch {
namespace network {

struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const {
        return std::lexicographical_compare(
            lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
            [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
    }
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

// Connect and timeout failures; the request may be retried.
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Any other failure while issuing a request.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Failure while reading a response body that was already started.
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TransportOptions {
    double timeout_seconds = 30.0;
    bool verify_tls = true;
    std::optional<std::string> proxy;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    Headers headers;
    std::optional<std::string> body;
};

class BodyStream {
public:
    virtual ~BodyStream() = default;

    // Fills `chunk` with at most `max_bytes` bytes. Returns false once the
    // body is exhausted; throws StreamError when the transfer breaks off.
    virtual bool read(std::string& chunk, size_t max_bytes) = 0;
};

struct Response {
    int status = 0;
    std::string reason;
    Headers headers;
    std::unique_ptr<BodyStream> body;

    std::optional<std::string> header(const std::string& name) const {
        auto it = headers.find(name);
        if (it == headers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool isChunked() const;
};

std::string reasonPhrase(int status);

}}
