#include "verifetch/common/config.hpp"
#include "verifetch/common/constants.hpp"
#include "verifetch/common/logger.hpp"
#include <toml.hpp>
#include <cstdlib>
#include <stdexcept>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace verifetch {
namespace common {

namespace {

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    GlobalConfig config;

    config.log_file = "";
    config.log_level = LogLevel::INFO;
    config.base_directory = ".";
    config.jobs = constants::limits::DEFAULT_JOBS;

    config.logging.rotation_size_mb = constants::limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    config.logging.max_files = constants::limits::DEFAULT_LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    auto& dl = config.downloader;
    dl.retries = constants::transfer::DEFAULT_RETRIES;
    dl.timeout = constants::transfer::DEFAULT_TIMEOUT_SECONDS;
    dl.verify = true;
    dl.proxy = "";
    dl.rate = "";
    dl.progress = constants::transfer::DEFAULT_PROGRESS_INTERVAL_SECONDS;
    dl.filesize_min = "";
    dl.filesize_max = "";
    dl.chunk_size = std::to_string(constants::transfer::DEFAULT_CHUNK_SIZE);
    dl.adjust_extensions = true;
    dl.mtime = true;
    dl.part = true;
    dl.part_directory = "";
    dl.http_metadata = "";
    dl.headers = {{"User-Agent", constants::version::getUserAgent()}};

    return config;
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    const std::string file_name = constants::system::CONFIG_FILE_NAME;

    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        paths.push_back(std::string(xdg) + "/verifetch/" + file_name);
    }

    const char* home = std::getenv("HOME");
    if (home && *home) {
        paths.push_back(std::string(home) + "/.config/verifetch/" + file_name);
    }

    paths.push_back(std::string(constants::system::SYSTEM_CONFIG_DIR) + "/" + file_name);
    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    try {
        global_ = createDefaultConfig();

        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            auto best = findBestConfig();
            if (!best) {
                Logger::instance().debug("[Config] No config file found, using defaults");
                current_config_path_.clear();
                return true;
            }
            effective_config_file = *best;
        }

        current_config_path_ = effective_config_file;
        return tryLoadTomlFile(effective_config_file);
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | error={}", e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().warn("[Config] File not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] File not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            auto global_section = data.at("global");

            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                auto level = parseLogLevel(toml::find<std::string>(global_section, "log_level"));
                if (level) global_.log_level = *level;
            }
            if (global_section.contains("base_directory")) {
                global_.base_directory = toml::find<std::string>(global_section, "base_directory");
            }
            if (global_section.contains("jobs")) {
                global_.jobs = toml::find<int>(global_section, "jobs");
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                global_.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
        }

        if (data.contains("downloader")) {
            auto dl_section = data.at("downloader");
            auto& dl = global_.downloader;

            if (dl_section.contains("retries")) {
                dl.retries = toml::find<int>(dl_section, "retries");
            }
            if (dl_section.contains("timeout")) {
                dl.timeout = toml::find<double>(dl_section, "timeout");
            }
            if (dl_section.contains("verify")) {
                dl.verify = toml::find<bool>(dl_section, "verify");
            }
            if (dl_section.contains("proxy")) {
                dl.proxy = toml::find<std::string>(dl_section, "proxy");
            }
            if (dl_section.contains("rate")) {
                dl.rate = toml::find<std::string>(dl_section, "rate");
            }
            if (dl_section.contains("progress")) {
                dl.progress = toml::find<double>(dl_section, "progress");
            }
            if (dl_section.contains("filesize_min")) {
                dl.filesize_min = toml::find<std::string>(dl_section, "filesize_min");
            }
            if (dl_section.contains("filesize_max")) {
                dl.filesize_max = toml::find<std::string>(dl_section, "filesize_max");
            }
            if (dl_section.contains("chunk_size")) {
                const auto& chunk = dl_section.at("chunk_size");
                if (chunk.is_integer()) {
                    dl.chunk_size = std::to_string(toml::get<int64_t>(chunk));
                } else {
                    dl.chunk_size = toml::get<std::string>(chunk);
                }
            }
            if (dl_section.contains("adjust_extensions")) {
                dl.adjust_extensions = toml::find<bool>(dl_section, "adjust_extensions");
            }
            if (dl_section.contains("mtime")) {
                dl.mtime = toml::find<bool>(dl_section, "mtime");
            }
            if (dl_section.contains("part")) {
                dl.part = toml::find<bool>(dl_section, "part");
            }
            if (dl_section.contains("part_directory")) {
                dl.part_directory = toml::find<std::string>(dl_section, "part_directory");
            }
            if (dl_section.contains("http_metadata")) {
                dl.http_metadata = toml::find<std::string>(dl_section, "http_metadata");
            }
            if (dl_section.contains("headers")) {
                auto headers = toml::find<std::map<std::string, std::string>>(dl_section, "headers");
                for (const auto& [name, value] : headers) {
                    dl.headers[name] = value;
                }
            }
        }

        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

bool Config::save(const std::string& config_file) {
    try {
        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            effective_config_file = current_config_path_.empty()
                ? getConfigSearchPaths().front()
                : current_config_path_;
        }

        const auto& dl = global_.downloader;
        toml::table headers;
        for (const auto& [name, value] : dl.headers) {
            headers[name] = value;
        }

        toml::value data = toml::table{
            {"global", toml::table{
                {"log_file", global_.log_file},
                {"log_level", to_string(global_.log_level)},
                {"base_directory", global_.base_directory},
                {"jobs", global_.jobs}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }},
            {"downloader", toml::table{
                {"retries", dl.retries},
                {"timeout", dl.timeout},
                {"verify", dl.verify},
                {"proxy", dl.proxy},
                {"rate", dl.rate},
                {"progress", dl.progress},
                {"filesize_min", dl.filesize_min},
                {"filesize_max", dl.filesize_max},
                {"chunk_size", dl.chunk_size},
                {"adjust_extensions", dl.adjust_extensions},
                {"mtime", dl.mtime},
                {"part", dl.part},
                {"part_directory", dl.part_directory},
                {"http_metadata", dl.http_metadata},
                {"headers", headers}
            }}
        };

        std::filesystem::path parent = std::filesystem::path(effective_config_file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }

        file << toml::format(data);
        file.close();
        if (!file) {
            Logger::instance().error("[Config] Write failed | path={}", effective_config_file);
            return false;
        }

        current_config_path_ = effective_config_file;

        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

void Config::setValue(const std::string& key, const std::string& value) {
    auto& dl = global_.downloader;

    if (key == "log_file") global_.log_file = value;
    else if (key == "log_level") {
        auto level = parseLogLevel(value);
        if (!level) throw std::invalid_argument("Invalid log level: " + value);
        global_.log_level = *level;
    }
    else if (key == "base_directory") global_.base_directory = value;
    else if (key == "jobs") global_.jobs = std::stoi(value);
    else if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = std::stoull(value);
    else if (key == "logging.max_files") global_.logging.max_files = std::stoull(value);
    else if (key == "logging.format") global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
    else if (key == "downloader.retries") dl.retries = std::stoi(value);
    else if (key == "downloader.timeout") dl.timeout = std::stod(value);
    else if (key == "downloader.verify") dl.verify = parseBool(value);
    else if (key == "downloader.proxy") dl.proxy = value;
    else if (key == "downloader.rate") dl.rate = value;
    else if (key == "downloader.progress") dl.progress = std::stod(value);
    else if (key == "downloader.filesize_min") dl.filesize_min = value;
    else if (key == "downloader.filesize_max") dl.filesize_max = value;
    else if (key == "downloader.chunk_size") dl.chunk_size = value;
    else if (key == "downloader.adjust_extensions") dl.adjust_extensions = parseBool(value);
    else if (key == "downloader.mtime") dl.mtime = parseBool(value);
    else if (key == "downloader.part") dl.part = parseBool(value);
    else if (key == "downloader.part_directory") dl.part_directory = value;
    else if (key == "downloader.http_metadata") dl.http_metadata = value;
    else if (key.rfind("downloader.headers.", 0) == 0) {
        dl.headers[key.substr(std::string("downloader.headers.").size())] = value;
    }
    else {
        throw std::invalid_argument("Unknown configuration key: " + key);
    }
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    const auto& dl = global_.downloader;

    if (key == "log_file") return global_.log_file;
    else if (key == "log_level") return to_string(global_.log_level);
    else if (key == "base_directory") return global_.base_directory;
    else if (key == "jobs") return std::to_string(global_.jobs);
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";
    else if (key == "downloader.retries") return std::to_string(dl.retries);
    else if (key == "downloader.timeout") return fmt::format("{}", dl.timeout);
    else if (key == "downloader.verify") return dl.verify ? "true" : "false";
    else if (key == "downloader.proxy") return dl.proxy;
    else if (key == "downloader.rate") return dl.rate;
    else if (key == "downloader.progress") return fmt::format("{}", dl.progress);
    else if (key == "downloader.filesize_min") return dl.filesize_min;
    else if (key == "downloader.filesize_max") return dl.filesize_max;
    else if (key == "downloader.chunk_size") return dl.chunk_size;
    else if (key == "downloader.adjust_extensions") return dl.adjust_extensions ? "true" : "false";
    else if (key == "downloader.mtime") return dl.mtime ? "true" : "false";
    else if (key == "downloader.part") return dl.part ? "true" : "false";
    else if (key == "downloader.part_directory") return dl.part_directory;
    else if (key == "downloader.http_metadata") return dl.http_metadata;
    else if (key.rfind("downloader.headers.", 0) == 0) {
        auto it = dl.headers.find(key.substr(std::string("downloader.headers.").size()));
        if (it != dl.headers.end()) return it->second;
    }

    return std::nullopt;
}

std::vector<std::string> Config::keys() const {
    std::vector<std::string> result = {
        "log_file", "log_level", "base_directory", "jobs",
        "logging.rotation_size_mb", "logging.max_files", "logging.format",
        "downloader.retries", "downloader.timeout", "downloader.verify",
        "downloader.proxy", "downloader.rate", "downloader.progress",
        "downloader.filesize_min", "downloader.filesize_max", "downloader.chunk_size",
        "downloader.adjust_extensions", "downloader.mtime", "downloader.part",
        "downloader.part_directory", "downloader.http_metadata"
    };
    for (const auto& [name, value] : global_.downloader.headers) {
        result.push_back("downloader.headers." + name);
    }
    return result;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    if (value == "DEBUG") return LogLevel::DEBUG;
    if (value == "INFO") return LogLevel::INFO;
    if (value == "WARN") return LogLevel::WARN;
    if (value == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

}}
