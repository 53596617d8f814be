#include "verifetch/network/types.hpp"
#include "verifetch/common/text.hpp"

namespace verifetch {
namespace network {

bool Response::isChunked() const {
    auto encoding = header("Transfer-Encoding");
    return encoding && common::toLower(*encoding).find("chunked") != std::string::npos;
}

std::string reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 410: return "Gone";
        case 416: return "Range Not Satisfiable";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

}}
