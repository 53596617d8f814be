#pragma once

#include <string>
#include <vector>
#include <optional>

#include "destination.hpp"

namespace verifetch {
namespace download {

using SignatureCheck = bool (*)(const std::string& header);

struct Signature {
    const char* extension;
    SignatureCheck check;
};

// File-type knowledge shared by every transfer: magic-byte predicates in a
// fixed order, and the MIME type to extension table. Both are immutable.
class SignatureRegistry {
public:
    // Ordered; detectExtension() returns the first match. "bin" is last and
    // never matches, so a "bin" file is always checked against the others.
    static const std::vector<Signature>& signatures();

    static bool hasSignature(const std::string& extension);

    // False for unknown extensions and for headers shorter than the magic.
    static bool matchSignature(const std::string& extension, const std::string& header);

    static std::optional<std::string> detectExtension(const std::string& header);

    // "image/png; charset=x" -> "png"; "png" is treated as "image/png".
    // Falls back to the system MIME database, then to "bin".
    static std::string inferExtensionFromMime(const std::string& mime_type);

    static std::optional<std::string> lookupMimeTable(const std::string& mime_type);
    static std::optional<std::string> lookupSystemMimeTypes(const std::string& mime_type);
};

// Checks `header` against the destination's current extension and, when it
// does not match but another signature does, switches the destination to
// that extension. Returns true when the extension was changed.
bool adjustExtension(Destination& destination, const std::string& header);

}}
