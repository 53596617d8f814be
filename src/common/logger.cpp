#include "verifetch/common/logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <iostream>
#include <filesystem>

namespace verifetch {
namespace common {

static constexpr const char* LOGGER_NAME = "verifetch";

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    if (logger_) {
        spdlog::drop(LOGGER_NAME);
        logger_.reset();
    }

    auto spdlog_level = toSpdlogLevel(level);
    std::vector<spdlog::sink_ptr> sinks;

    if (mode == LogMode::FILE_ONLY) {
        try {
            if (log_file.empty()) {
                throw spdlog::spdlog_ex("Log file path required for FILE_ONLY mode");
            }

            std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();
            std::error_code ec;
            if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
                std::filesystem::create_directories(log_dir, ec);
            }

            std::string effective_log_file = getLogFileWithSuffix(logging_config.format, log_file);
            size_t max_size = logging_config.rotation_size_mb * 1024 * 1024;

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                effective_log_file, max_size, logging_config.max_files);
            file_sink->set_level(spdlog_level);
            sinks.push_back(file_sink);

            current_format_ = logging_config.format;

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "[Logger] Failed to open log file: " << log_file
                     << " - " << ex.what() << std::endl;
            std::cerr << "[Logger] Falling back to console output" << std::endl;
            sinks.clear();
        }
    }

    if (sinks.empty()) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog_level);
        sinks.push_back(console_sink);
    }

    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());

    if (current_format_ == LogFormat::JSON) {
        logger_->set_pattern(R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})");
    } else {
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    }

    logger_->set_level(spdlog_level);

    if (mode == LogMode::FILE_ONLY) {
        logger_->flush_on(spdlog::level::info);
    }

    spdlog::register_logger(logger_);
    initialized_ = true;
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::addSink(spdlog::sink_ptr sink) {
    if (!logger_) {
        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME);
        logger_->set_level(spdlog::level::debug);
        spdlog::register_logger(logger_);
    }
    logger_->sinks().push_back(std::move(sink));
}

void Logger::removeSink(const spdlog::sink_ptr& sink) {
    if (!logger_) {
        return;
    }
    auto& sinks = logger_->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(LOGGER_NAME);
        logger_.reset();
    }
    spdlog::shutdown();
    initialized_ = false;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

std::string Logger::getLogFileWithSuffix(LogFormat format, const std::string& base_path) const {
    if (format == LogFormat::JSON) {
        std::filesystem::path p(base_path);
        std::string stem = p.stem().string();
        std::string ext = p.extension().string();
        std::string parent = p.parent_path().string();

        if (parent.empty()) {
            return stem + ".json" + ext;
        } else {
            return parent + "/" + stem + ".json" + ext;
        }
    }
    return base_path;
}

}}
