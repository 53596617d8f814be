#pragma once

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <cstdint>

namespace verifetch {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

// Values as written in the config file; byte sizes stay human-readable
// strings until download::TransferConfig::fromSettings() validates them.
struct DownloaderSettings {
    int retries;
    double timeout;
    bool verify;
    std::string proxy;
    std::string rate;
    double progress;
    std::string filesize_min;
    std::string filesize_max;
    std::string chunk_size;
    bool adjust_extensions;
    bool mtime;
    bool part;
    std::string part_directory;
    std::string http_metadata;
    std::map<std::string, std::string> headers;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    std::string base_directory;
    int jobs;
    LoggingConfig logging;
    DownloaderSettings downloader;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    // Writes the current values as TOML to `config_file`, else to the loaded
    // file, else to the first user config location.
    bool save(const std::string& config_file = "");

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    void setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    std::vector<std::string> keys() const;

    std::optional<std::string> findBestConfig() const;
    std::vector<std::string> getConfigSearchPaths() const;
    std::string getConfigPath() const { return current_config_path_; }

    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    bool tryLoadTomlFile(const std::string& path);
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& value);

}}
