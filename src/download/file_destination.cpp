#include "verifetch/download/file_destination.hpp"
#include "verifetch/common/constants.hpp"
#include "verifetch/common/logger.hpp"
#include "verifetch/common/text.hpp"
#include <fstream>
#include <stdexcept>
#include <sys/time.h>

namespace verifetch {
namespace download {

namespace fs = std::filesystem;

FileDestination::FileDestination(FileDestinationOptions options)
    : options_(std::move(options)),
      filename_(options_.filename),
      extension_(options_.extension) {
    if (filename_.empty()) {
        throw std::invalid_argument("FileDestination requires a filename");
    }

    buildPath();

    if (options_.part) {
        fs::path part_dir = options_.part_directory.empty() ? options_.directory : options_.part_directory;
        temp_path_ = part_dir / (filename_ + constants::transfer::PART_SUFFIX);
    } else {
        temp_path_ = real_path_;
    }
}

uint64_t FileDestination::partSize() const {
    if (!options_.part) {
        return 0;
    }
    std::error_code ec;
    auto size = fs::file_size(temp_path_, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

void FileDestination::setExtension(const std::string& extension) {
    extension_ = extension;
    buildPath();
}

bool FileDestination::exists() const {
    std::error_code ec;
    return !extension_.empty() && fs::exists(real_path_, ec);
}

std::unique_ptr<std::iostream> FileDestination::open(OpenMode mode) {
    std::error_code ec;
    fs::create_directories(temp_path_.parent_path().empty() ? fs::path(".") : temp_path_.parent_path(), ec);

    auto flags = std::ios::in | std::ios::out | std::ios::binary;
    if (mode == OpenMode::TRUNCATE_CREATE) {
        flags |= std::ios::trunc;
    }

    auto file = std::make_unique<std::fstream>(temp_path_, flags);
    if (!file->is_open()) {
        throw std::runtime_error("Cannot open '" + temp_path_.string() + "' for writing");
    }
    return file;
}

void FileDestination::setMetadata(const std::string& field, Metadata metadata) {
    metadata_[field] = std::move(metadata);
}

void FileDestination::buildPath() {
    if (options_.use_header_filename) {
        for (const auto& [field, values] : metadata_) {
            auto name = values.find("filename");
            if (name != values.end() && !name->second.empty()) {
                filename_ = name->second;
                auto ext = values.find("extension");
                if (ext != values.end() && !ext->second.empty()) {
                    extension_ = ext->second;
                }
            }
        }
    }

    std::string name = filename_;
    if (!extension_.empty()) {
        name += "." + extension_;
    }
    real_path_ = options_.directory / name;
}

void FileDestination::removeIncomplete() {
    if (present_) {
        return;
    }
    std::error_code ec;
    if (fs::remove(temp_path_, ec)) {
        common::Logger::instance().debug("[Destination] Removed incomplete file | path={}", temp_path_.string());
    } else if (ec) {
        common::Logger::instance().warn("[Destination] Cannot remove incomplete file | path={} | error={}",
                                        temp_path_.string(), ec.message());
    }
}

void FileDestination::finalize() {
    if (present_) {
        return;
    }

    if (temp_path_ != real_path_) {
        fs::create_directories(real_path_.parent_path().empty() ? fs::path(".") : real_path_.parent_path());
        fs::rename(temp_path_, real_path_);
    }

    applyMtime(real_path_);
}

void FileDestination::applyMtime(const fs::path& path) const {
    if (!mtime_) {
        return;
    }

    auto timestamp = common::parseHttpDate(*mtime_);
    if (!timestamp) {
        common::Logger::instance().debug("[Destination] Unparsable mtime | value={}", *mtime_);
        return;
    }

    struct timeval times[2];
    times[0].tv_sec = static_cast<time_t>(*timestamp);
    times[0].tv_usec = 0;
    times[1] = times[0];
    if (utimes(path.c_str(), times) != 0) {
        common::Logger::instance().warn("[Destination] Cannot set mtime | path={}", path.string());
    }
}

std::pair<std::string, std::string> filenameFromUrl(const std::string& url) {
    std::string path = url;
    size_t scheme = path.find("://");
    if (scheme != std::string::npos) {
        path = path.substr(scheme + 3);
        size_t slash = path.find('/');
        path = (slash == std::string::npos) ? "" : path.substr(slash);
    }
    path = path.substr(0, path.find_first_of("?#"));

    std::string name = path.substr(path.rfind('/') == std::string::npos ? 0 : path.rfind('/') + 1);
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return {name, ""};
    }
    return {name.substr(0, dot), common::toLower(name.substr(dot + 1))};
}

}}
