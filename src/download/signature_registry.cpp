#include "verifetch/download/signature_registry.hpp"
#include "verifetch/common/constants.hpp"
#include "verifetch/common/logger.hpp"
#include "verifetch/common/text.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace verifetch {
namespace download {

namespace {

bool hasBytesAt(const std::string& header, size_t offset, const char* magic, size_t length) {
    return header.size() >= offset + length && header.compare(offset, length, magic, length) == 0;
}

template<size_t N>
bool startsWith(const std::string& header, const char (&magic)[N]) {
    return hasBytesAt(header, 0, magic, N - 1);
}

template<size_t N>
bool bytesAt(const std::string& header, size_t offset, const char (&magic)[N]) {
    return hasBytesAt(header, offset, magic, N - 1);
}

// https://en.wikipedia.org/wiki/List_of_file_signatures
const std::vector<Signature> SIGNATURES = {
    {"jpg",  [](const std::string& s) { return startsWith(s, "\xFF\xD8\xFF"); }},
    {"png",  [](const std::string& s) { return startsWith(s, "\x89PNG\r\n\x1A\n"); }},
    {"gif",  [](const std::string& s) { return startsWith(s, "GIF87a") || startsWith(s, "GIF89a"); }},
    {"bmp",  [](const std::string& s) { return startsWith(s, "BM"); }},
    {"webp", [](const std::string& s) { return startsWith(s, "RIFF") && bytesAt(s, 8, "WEBP"); }},
    {"avif", [](const std::string& s) { return bytesAt(s, 4, "ftypavif"); }},
    {"svg",  [](const std::string& s) { return startsWith(s, "<?xml"); }},
    {"ico",  [](const std::string& s) { return startsWith(s, "\x00\x00\x01\x00"); }},
    {"cur",  [](const std::string& s) { return startsWith(s, "\x00\x00\x02\x00"); }},
    {"psd",  [](const std::string& s) { return startsWith(s, "8BPS"); }},
    {"webm", [](const std::string& s) { return startsWith(s, "\x1A\x45\xDF\xA3"); }},
    {"ogg",  [](const std::string& s) { return startsWith(s, "OggS"); }},
    {"wav",  [](const std::string& s) { return startsWith(s, "RIFF") && bytesAt(s, 8, "WAVE"); }},
    {"mp3",  [](const std::string& s) {
        return startsWith(s, "ID3") || startsWith(s, "\xFF\xFB") ||
               startsWith(s, "\xFF\xF3") || startsWith(s, "\xFF\xF2");
    }},
    {"zip",  [](const std::string& s) {
        return startsWith(s, "PK\x03\x04") || startsWith(s, "PK\x05\x06") || startsWith(s, "PK\x07\x08");
    }},
    {"rar",  [](const std::string& s) { return startsWith(s, "\x52\x61\x72\x21\x1A\x07"); }},
    {"7z",   [](const std::string& s) { return startsWith(s, "\x37\x7A\xBC\xAF\x27\x1C"); }},
    {"pdf",  [](const std::string& s) { return startsWith(s, "%PDF-"); }},
    {"swf",  [](const std::string& s) { return startsWith(s, "CWS") || startsWith(s, "FWS"); }},
    {"bin",  [](const std::string&) { return false; }},
};

const std::unordered_map<std::string, std::string> MIME_TYPES = {
    {"image/jpeg", "jpg"},
    {"image/jpg", "jpg"},
    {"image/png", "png"},
    {"image/gif", "gif"},
    {"image/bmp", "bmp"},
    {"image/x-bmp", "bmp"},
    {"image/x-ms-bmp", "bmp"},
    {"image/webp", "webp"},
    {"image/avif", "avif"},
    {"image/svg+xml", "svg"},
    {"image/ico", "ico"},
    {"image/icon", "ico"},
    {"image/x-icon", "ico"},
    {"image/vnd.microsoft.icon", "ico"},
    {"image/x-photoshop", "psd"},
    {"application/x-photoshop", "psd"},
    {"image/vnd.adobe.photoshop", "psd"},

    {"video/webm", "webm"},
    {"video/ogg", "ogg"},
    {"video/mp4", "mp4"},

    {"audio/wav", "wav"},
    {"audio/x-wav", "wav"},
    {"audio/webm", "webm"},
    {"audio/ogg", "ogg"},
    {"audio/mpeg", "mp3"},

    {"application/zip", "zip"},
    {"application/x-zip", "zip"},
    {"application/x-zip-compressed", "zip"},
    {"application/rar", "rar"},
    {"application/x-rar", "rar"},
    {"application/x-rar-compressed", "rar"},
    {"application/x-7z-compressed", "7z"},

    {"application/pdf", "pdf"},
    {"application/x-pdf", "pdf"},
    {"application/x-shockwave-flash", "swf"},

    {"application/ogg", "ogg"},
    {"application/octet-stream", "bin"},
};

std::unordered_map<std::string, std::string> loadSystemMimeTypes(const std::string& path) {
    std::unordered_map<std::string, std::string> types;

    std::ifstream file(path);
    if (!file) {
        common::Logger::instance().debug("[Signature] MIME database not available | path={}", path);
        return types;
    }

    std::string line;
    while (std::getline(file, line)) {
        auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }

        std::istringstream fields(line);
        std::string type;
        std::string extension;
        if (fields >> type >> extension) {
            types.emplace(common::toLower(type), extension);
        }
    }

    common::Logger::instance().debug("[Signature] MIME database loaded | path={} | types={}",
                                     path, types.size());
    return types;
}

}

const std::vector<Signature>& SignatureRegistry::signatures() {
    return SIGNATURES;
}

bool SignatureRegistry::hasSignature(const std::string& extension) {
    return std::any_of(SIGNATURES.begin(), SIGNATURES.end(),
                       [&](const Signature& sig) { return extension == sig.extension; });
}

bool SignatureRegistry::matchSignature(const std::string& extension, const std::string& header) {
    for (const auto& sig : SIGNATURES) {
        if (extension == sig.extension) {
            return sig.check(header);
        }
    }
    return false;
}

std::optional<std::string> SignatureRegistry::detectExtension(const std::string& header) {
    for (const auto& sig : SIGNATURES) {
        if (sig.check(header)) {
            return std::string(sig.extension);
        }
    }
    return std::nullopt;
}

std::optional<std::string> SignatureRegistry::lookupMimeTable(const std::string& mime_type) {
    auto it = MIME_TYPES.find(mime_type);
    if (it == MIME_TYPES.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> SignatureRegistry::lookupSystemMimeTypes(const std::string& mime_type) {
    static const std::unordered_map<std::string, std::string> system_types =
        loadSystemMimeTypes(constants::system::MIME_TYPES_FILE);

    auto it = system_types.find(common::toLower(mime_type));
    if (it == system_types.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string SignatureRegistry::inferExtensionFromMime(const std::string& mime_type) {
    std::string mtype = common::trim(mime_type.substr(0, mime_type.find(';')));

    if (mtype.find('/') == std::string::npos) {
        mtype = "image/" + mtype;
    }

    if (auto extension = lookupMimeTable(mtype)) {
        return *extension;
    }

    if (auto extension = lookupSystemMimeTypes(mtype)) {
        return *extension;
    }

    common::Logger::instance().warn("Unknown MIME type '{}'", mtype);
    return constants::transfer::FALLBACK_EXTENSION;
}

bool adjustExtension(Destination& destination, const std::string& header) {
    if (SignatureRegistry::matchSignature(destination.extension(), header)) {
        return false;
    }
    auto detected = SignatureRegistry::detectExtension(header);
    if (!detected) {
        return false;
    }
    common::Logger::instance().debug("[Signature] Extension corrected | from={} | to={}",
                                     destination.extension(), *detected);
    destination.setExtension(*detected);
    return true;
}

}}
