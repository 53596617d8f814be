#include "verifetch/network/http_transport.hpp"
#include "verifetch/common/constants.hpp"
#include "verifetch/common/logger.hpp"
#include "verifetch/common/text.hpp"
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <cmath>

namespace verifetch {
namespace network {

namespace {

struct StreamState {
    // Shared with the reader so a cancelled stream can shut the socket down
    // instead of waiting for the read timeout.
    std::unique_ptr<httplib::Client> client;

    std::mutex mutex;
    std::condition_variable cv;

    bool headers_ready = false;
    bool finished = false;
    bool cancelled = false;

    int status = 0;
    std::string reason;
    Headers headers;

    std::deque<std::string> chunks;
    size_t buffered = 0;

    std::optional<httplib::Error> error;
    std::string failure;
};

bool isConnectionError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Connection:
        case httplib::Error::BindIPAddress:
        case httplib::Error::Read:
        case httplib::Error::Write:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLServerVerification:
            return true;
        default:
            return false;
    }
}

void applyTimeout(httplib::Client& client, double timeout_seconds) {
    double whole = std::floor(timeout_seconds);
    time_t sec = static_cast<time_t>(whole);
    time_t usec = static_cast<time_t>((timeout_seconds - whole) * 1000000.0);

    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
}

void applyProxy(httplib::Client& client, const std::string& proxy) {
    ProxySettings settings = parseProxy(proxy);
    client.set_proxy(settings.host, settings.port);
    if (!settings.username.empty()) {
        client.set_proxy_basic_auth(settings.username, settings.password);
    }
}

class HttpBodyStream : public BodyStream {
public:
    HttpBodyStream(std::shared_ptr<StreamState> state, std::thread worker)
        : state_(std::move(state)), worker_(std::move(worker)) {}

    ~HttpBodyStream() override {
        bool finished;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
            finished = state_->finished;
        }
        state_->cv.notify_all();
        if (!finished) {
            // Unblocks a worker stuck in a socket read.
            state_->client->stop();
        }
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    bool read(std::string& chunk, size_t max_bytes) override {
        chunk.clear();
        if (max_bytes == 0) {
            return false;
        }

        size_t wanted = std::min(max_bytes, constants::http::STREAM_BUFFER_LIMIT);

        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [&] {
            return state_->buffered >= wanted || state_->finished;
        });

        if (state_->chunks.empty()) {
            if (state_->error) {
                throw StreamError(fmt::format("Body read failed: {}", httplib::to_string(*state_->error)));
            }
            if (!state_->failure.empty()) {
                throw StreamError(state_->failure);
            }
            return false;
        }

        while (!state_->chunks.empty() && chunk.size() < max_bytes) {
            auto& front = state_->chunks.front();
            size_t take = std::min(max_bytes - chunk.size(), front.size());
            chunk.append(front, 0, take);
            state_->buffered -= take;
            if (take == front.size()) {
                state_->chunks.pop_front();
            } else {
                front.erase(0, take);
            }
        }

        lock.unlock();
        state_->cv.notify_all();
        return true;
    }

private:
    std::shared_ptr<StreamState> state_;
    std::thread worker_;
};

void runRequest(const std::shared_ptr<StreamState>& state, const UrlParts& parts,
                const HttpRequest& request) {
    try {
        httplib::Client& client = *state->client;

        httplib::Request req;
        req.method = request.method;
        req.path = parts.path;
        for (const auto& [name, value] : request.headers) {
            req.headers.emplace(name, value);
        }
        if (request.body) {
            req.body = *request.body;
        }

        req.response_handler = [state](const httplib::Response& res) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->status = res.status;
            state->reason = res.reason;
            state->headers.clear();
            for (const auto& [name, value] : res.headers) {
                state->headers.emplace(name, value);
            }
            state->headers_ready = true;
            state->cv.notify_all();
            return !state->cancelled;
        };

        req.content_receiver = [state](const char* data, size_t length,
                                       uint64_t /*offset*/, uint64_t /*total*/) {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&] {
                return state->buffered < constants::http::STREAM_BUFFER_LIMIT || state->cancelled;
            });
            if (state->cancelled) {
                return false;
            }
            state->chunks.emplace_back(data, length);
            state->buffered += length;
            lock.unlock();
            state->cv.notify_all();
            return true;
        };

        httplib::Response res;
        httplib::Error error = httplib::Error::Success;
        bool ok = client.send(req, res, error);

        std::lock_guard<std::mutex> lock(state->mutex);
        if (!ok && !state->cancelled) {
            state->error = error;
        }
        if (ok && !state->headers_ready) {
            state->status = res.status;
            state->reason = res.reason;
            for (const auto& [name, value] : res.headers) {
                state->headers.emplace(name, value);
            }
            state->headers_ready = true;
        }
        state->finished = true;
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->failure = e.what();
        state->finished = true;
    }
    state->cv.notify_all();
}

}

UrlParts splitUrl(const std::string& url) {
    size_t scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos || scheme_pos == 0) {
        throw TransportError("Invalid URL '" + url + "'");
    }

    size_t path_pos = url.find_first_of("/?#", scheme_pos + 3);
    UrlParts parts;
    parts.scheme_host_port = url.substr(0, path_pos);
    if (parts.scheme_host_port.size() == scheme_pos + 3) {
        throw TransportError("Missing host in URL '" + url + "'");
    }

    if (path_pos == std::string::npos) {
        parts.path = "/";
    } else {
        parts.path = url.substr(path_pos);
        size_t fragment = parts.path.find('#');
        if (fragment != std::string::npos) {
            parts.path.erase(fragment);
        }
        if (parts.path.empty() || parts.path[0] != '/') {
            parts.path.insert(0, "/");
        }
    }
    return parts;
}

ProxySettings parseProxy(const std::string& proxy) {
    std::string authority = proxy;
    size_t scheme_pos = authority.find("://");
    if (scheme_pos != std::string::npos) {
        authority = authority.substr(scheme_pos + 3);
    }
    size_t path_pos = authority.find('/');
    if (path_pos != std::string::npos) {
        authority.erase(path_pos);
    }

    ProxySettings settings;
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        size_t colon = userinfo.find(':');
        settings.username = userinfo.substr(0, colon);
        if (colon != std::string::npos) {
            settings.password = userinfo.substr(colon + 1);
        }
    }

    settings.host = authority;
    size_t port_pos = authority.rfind(':');
    size_t bracket = authority.rfind(']');
    if (port_pos != std::string::npos && (bracket == std::string::npos || port_pos > bracket)) {
        settings.host = authority.substr(0, port_pos);
        auto port = common::parseUnsigned(authority.substr(port_pos + 1));
        if (!port || *port == 0 || *port > 65535) {
            throw TransportError("Invalid proxy port in '" + proxy + "'");
        }
        settings.port = static_cast<int>(*port);
    }

    if (settings.host.empty()) {
        throw TransportError("Missing proxy host in '" + proxy + "'");
    }
    return settings;
}

HttpTransport::HttpTransport() = default;
HttpTransport::~HttpTransport() = default;

std::unique_ptr<Response> HttpTransport::send(const HttpRequest& request,
                                              const TransportOptions& options) {
    UrlParts parts = splitUrl(request.url);

    common::Logger::instance().debug("[HTTP] Request | method={} | url={}", request.method, request.url);

    auto state = std::make_shared<StreamState>();
    state->client = std::make_unique<httplib::Client>(parts.scheme_host_port);
    if (!state->client->is_valid()) {
        throw TransportError("Invalid request origin '" + parts.scheme_host_port + "'");
    }

    applyTimeout(*state->client, options.timeout_seconds);
    state->client->set_follow_location(true);
    state->client->enable_server_certificate_verification(options.verify_tls);
    if (options.proxy && !options.proxy->empty()) {
        applyProxy(*state->client, *options.proxy);
    }

    std::thread worker(runRequest, state, parts, request);

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait(lock, [&] { return state->headers_ready || state->finished; });

        if (state->headers_ready) {
            auto response = std::make_unique<Response>();
            response->status = state->status;
            response->reason = state->reason.empty() ? reasonPhrase(state->status) : state->reason;
            response->headers = state->headers;
            lock.unlock();

            response->body = std::make_unique<HttpBodyStream>(state, std::move(worker));
            common::Logger::instance().debug("[HTTP] Response | status={} | url={}",
                                             response->status, request.url);
            return response;
        }
    }

    worker.join();

    if (!state->failure.empty()) {
        throw TransportError(state->failure);
    }

    httplib::Error error = state->error.value_or(httplib::Error::Unknown);
    std::string message = fmt::format("{} ({})", httplib::to_string(error), request.url);
    if (isConnectionError(error)) {
        throw ConnectionError(message);
    }
    throw TransportError(message);
}

}}
