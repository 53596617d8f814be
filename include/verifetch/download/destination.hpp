#pragma once

#include <string>
#include <map>
#include <memory>
#include <optional>
#include <iostream>
#include <cstdint>

namespace verifetch {
namespace download {

enum class OpenMode {
    TRUNCATE_CREATE,
    UPDATE
};

using Metadata = std::map<std::string, std::string>;

// Where a transfer writes. Owned by the caller; the engine only removes the
// incomplete artifact of a failed transfer when partial files are not kept.
class Destination {
public:
    virtual ~Destination() = default;

    // Bytes already present from an earlier attempt; 0 when partial files
    // are disabled or nothing was written yet.
    virtual uint64_t partSize() const = 0;

    virtual const std::string& extension() const = 0;

    // Rebuilds the final path with the new extension.
    virtual void setExtension(const std::string& extension) = 0;

    // Whether a file already exists at the final path.
    virtual bool exists() const = 0;

    virtual std::unique_ptr<std::iostream> open(OpenMode mode) = 0;

    virtual std::string path() const = 0;

    virtual void setMetadata(const std::string& field, Metadata metadata) = 0;
    virtual void buildPath() = 0;

    // The final path already holds the content; nothing is written.
    virtual void markPresent() = 0;

    virtual bool supportsPartial() const = 0;
    virtual void removeIncomplete() = 0;

    virtual const std::optional<std::string>& desiredMtime() const = 0;
    virtual void setDesiredMtime(std::optional<std::string> http_date) = 0;
};

}}
