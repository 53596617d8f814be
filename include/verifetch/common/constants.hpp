#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace verifetch {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("verifetch v") + CLI_VERSION;
    }

    inline std::string getUserAgent() {
        return std::string("verifetch/") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "verifetch";
    constexpr const char* CONFIG_FILE_NAME = "verifetch.toml";
    constexpr const char* SYSTEM_CONFIG_DIR = "/etc/verifetch";
    constexpr const char* MIME_TYPES_FILE = "/etc/mime.types";
}

namespace transfer {
    constexpr int DEFAULT_RETRIES = 4;
    constexpr int INFINITE_RETRIES = -1;
    constexpr double DEFAULT_TIMEOUT_SECONDS = 30.0;
    constexpr double DEFAULT_PROGRESS_INTERVAL_SECONDS = 3.0;
    constexpr size_t DEFAULT_CHUNK_SIZE = 32768;
    constexpr size_t SIGNATURE_HEADER_SIZE = 16;
    constexpr const char* DEFAULT_CONTENT_TYPE = "image/jpeg";
    constexpr const char* FALLBACK_EXTENSION = "bin";
    constexpr const char* PART_SUFFIX = ".part";
}

namespace http {
    constexpr int OK = 200;
    constexpr int PARTIAL_CONTENT = 206;
    constexpr int RANGE_NOT_SATISFIABLE = 416;
    constexpr int TOO_MANY_REQUESTS = 429;
    constexpr size_t STREAM_BUFFER_LIMIT = 4 * 1024 * 1024;
}

namespace limits {
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
    constexpr int DEFAULT_JOBS = 1;
}

}
}
