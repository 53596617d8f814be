#pragma once

#include "clock.hpp"
#include "progress.hpp"
#include "../network/types.hpp"
#include <ostream>
#include <optional>
#include <cstdint>

namespace verifetch {
namespace download {

struct CopyOptions {
    size_t chunk_size = 32768;
    std::optional<uint64_t> rate_limit;
    std::optional<double> progress_interval;
};

class ThrottledCopier {
public:
    ThrottledCopier(CopyOptions options, ProgressSink* progress, Clock clock = Clock::system());

    // Writes every remaining chunk of `source` to `sink`. Returns the number
    // of bytes written. StreamError from the source propagates.
    uint64_t copy(std::ostream& sink, network::BodyStream& source,
                  std::optional<uint64_t> bytes_total, uint64_t bytes_downloaded);

    bool isThrottled() const {
        return options_.rate_limit.has_value() || options_.progress_interval.has_value();
    }

private:
    CopyOptions options_;
    ProgressSink* progress_;
    Clock clock_;

    uint64_t copyDirect(std::ostream& sink, network::BodyStream& source);
    uint64_t copyPaced(std::ostream& sink, network::BodyStream& source,
                       std::optional<uint64_t> bytes_total, uint64_t bytes_downloaded);
};

}}
