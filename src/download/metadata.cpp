#include "verifetch/download/metadata.hpp"
#include "verifetch/common/text.hpp"

namespace verifetch {
namespace download {

Metadata extractMetadata(const network::Response& response) {
    Metadata data;
    for (const auto& [name, value] : response.headers) {
        data[common::toLower(name)] = value;
    }

    if (auto disposition = response.header("Content-Disposition")) {
        std::string name = common::extractBetween(*disposition, "filename=\"", "\"");
        if (!name.empty()) {
            auto slash = name.find_last_of("/\\");
            if (slash != std::string::npos) {
                name = name.substr(slash + 1);
            }
            auto dot = name.rfind('.');
            if (dot != std::string::npos && dot > 0) {
                data["filename"] = name.substr(0, dot);
                data["extension"] = common::toLower(name.substr(dot + 1));
            } else {
                data["filename"] = name;
                data["extension"] = "";
            }
        }
    }

    if (auto modified = response.header("Last-Modified")) {
        if (auto timestamp = common::parseHttpDate(*modified)) {
            data["date"] = common::formatTimestamp(*timestamp);
        }
    }

    return data;
}

}}
