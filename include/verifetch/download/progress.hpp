#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace verifetch {
namespace download {

class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void onStart(const std::string& path) = 0;

    // `total` is the declared size when the server sent one; `downloaded`
    // counts bytes in the file, including a resumed prefix.
    virtual void onProgress(std::optional<uint64_t> total, uint64_t downloaded,
                            uint64_t bytes_per_sec) = 0;
};

}}
