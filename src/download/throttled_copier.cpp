#include "verifetch/download/throttled_copier.hpp"
#include <stdexcept>

namespace verifetch {
namespace download {

namespace {

void writeChunk(std::ostream& sink, const std::string& chunk) {
    sink.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!sink) {
        throw std::runtime_error("Write to destination failed");
    }
}

}

ThrottledCopier::ThrottledCopier(CopyOptions options, ProgressSink* progress, Clock clock)
    : options_(std::move(options)), progress_(progress), clock_(std::move(clock)) {
    if (options_.chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

uint64_t ThrottledCopier::copy(std::ostream& sink, network::BodyStream& source,
                               std::optional<uint64_t> bytes_total, uint64_t bytes_downloaded) {
    if (isThrottled()) {
        return copyPaced(sink, source, bytes_total, bytes_downloaded);
    }
    return copyDirect(sink, source);
}

uint64_t ThrottledCopier::copyDirect(std::ostream& sink, network::BodyStream& source) {
    uint64_t written = 0;
    std::string chunk;
    while (source.read(chunk, options_.chunk_size)) {
        writeChunk(sink, chunk);
        written += chunk.size();
    }
    return written;
}

// The rate limit is applied per chunk: after each write, sleep for whatever
// the chunk's expected transmission time exceeds the time actually taken.
uint64_t ThrottledCopier::copyPaced(std::ostream& sink, network::BodyStream& source,
                                    std::optional<uint64_t> bytes_total, uint64_t bytes_downloaded) {
    const uint64_t bytes_start = bytes_downloaded;
    const double t_start = clock_.now();
    double t_chunk = t_start;
    double t_report = t_start;

    uint64_t written = 0;
    std::string chunk;
    while (source.read(chunk, options_.chunk_size)) {
        writeChunk(sink, chunk);

        double t_now = clock_.now();
        double elapsed = t_now - t_chunk;
        uint64_t num_bytes = chunk.size();
        written += num_bytes;
        bytes_downloaded += num_bytes;

        if (options_.progress_interval && progress_) {
            double since_start = t_now - t_start;
            if (t_now - t_report >= *options_.progress_interval && since_start > 0) {
                auto rate = static_cast<uint64_t>((bytes_downloaded - bytes_start) / since_start);
                progress_->onProgress(bytes_total, bytes_downloaded, rate);
                t_report = t_now;
            }
        }

        if (options_.rate_limit) {
            double expected = static_cast<double>(num_bytes) / static_cast<double>(*options_.rate_limit);
            if (elapsed < expected) {
                clock_.sleep(expected - elapsed);
                t_now = clock_.now();
            }
        }

        t_chunk = t_now;
    }
    return written;
}

}}
