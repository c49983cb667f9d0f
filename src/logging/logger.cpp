/**
 * @file logger.cpp
 * @brief spdlog backend for the podium logging API
 */

#include "logging/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace podium {
namespace logging {

namespace {

constexpr const char* kLoggerName = "podium";

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum native;
    const char* name;
};

// Indexed by LogLevel
constexpr std::array<LevelEntry, 7> kLevels = {{
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
}};

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

const LevelEntry& entryFor(LogLevel level) {
    const auto index = static_cast<std::size_t>(level);
    return index < kLevels.size() ? kLevels[index] : kLevels[2];
}

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    return entryFor(level).native;
}

LogLevel fromSpdlogLevel(spdlog::level::level_enum native) {
    for (const auto& entry : kLevels) {
        if (entry.native == native) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

// Caller must hold g_init_mutex.
void installLogger(std::vector<spdlog::sink_ptr> sinks, const LogConfig& config) {
    if (g_logger) {
        spdlog::drop(kLoggerName);
    }
    g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    g_logger->set_level(toSpdlogLevel(config.level));
    g_logger->set_pattern(config.pattern);
    g_logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(g_logger);
    g_initialized.store(true, std::memory_order_release);
}

// Keys with the wrong JSON type are reported and skipped; the rest of the section still applies.
template <typename T>
void readKey(const nlohmann::json& section, const char* key, T& out) {
    if (!section.contains(key)) {
        return;
    }
    try {
        out = section[key].get<T>();
    } catch (const nlohmann::json::exception&) {
        std::cerr << "logging." << key << " has the wrong type, keeping default" << std::endl;
    }
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.consoleOutput) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_level(toSpdlogLevel(config.level));
            if (!config.coloredOutput) {
                console->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console);
        }

        if (!config.filePath.empty()) {
            auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups);
            rotating->set_level(toSpdlogLevel(config.level));
            sinks.push_back(rotating);
        }

        installLogger(std::move(sinks), config);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    LOG_DEBUG("Logging initialized (level={})", levelToString(config.level));
    if (!config.filePath.empty()) {
        LOG_DEBUG("Log file: {} (max {}MB x {} backups)", config.filePath,
                  config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_initialized.load(std::memory_order_acquire)) {
        return true;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
        installLogger(std::move(sinks), LogConfig{});
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeFromConfig(const std::string& configPath) {
    LogConfig config;

    std::ifstream file(configPath);
    if (file.is_open()) {
        nlohmann::json document;
        try {
            file >> document;
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "Failed to parse logging config: " << ex.what() << std::endl;
        }

        if (document.is_object() && document.contains("logging") &&
            document["logging"].is_object()) {
            const auto& section = document["logging"];
            std::string level = std::string(levelToString(config.level));
            readKey(section, "level", level);
            config.level = stringToLevel(level);
            readKey(section, "filePath", config.filePath);
            readKey(section, "maxFileSize", config.maxFileSize);
            readKey(section, "maxBackups", config.maxBackups);
            readKey(section, "consoleOutput", config.consoleOutput);
            readKey(section, "coloredOutput", config.coloredOutput);
            readKey(section, "pattern", config.pattern);
        }
    }

    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = getLogger();
    if (!logger) {
        return;
    }
    logger->set_level(toSpdlogLevel(level));
    for (auto& sink : logger->sinks()) {
        sink->set_level(toSpdlogLevel(level));
    }
    LOG_DEBUG("Log level changed to {}", levelToString(level));
}

LogLevel getLevel() {
    if (g_logger) {
        return fromSpdlogLevel(g_logger->level());
    }
    return LogLevel::Info;
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initializeEarly();
    return g_logger;
}

ScopedRunLog::ScopedRunLog(const std::string& path) {
    auto logger = getLogger();
    if (!logger) {
        return;
    }
    try {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
        file->set_level(logger->level());
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        std::lock_guard<std::mutex> lock(g_init_mutex);
        logger->sinks().push_back(file);
        sink_ = file;
    } catch (const spdlog::spdlog_ex& ex) {
        LOG_WARN("Cannot open run log {}: {}", path, ex.what());
    }
}

ScopedRunLog::~ScopedRunLog() {
    if (!sink_) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        auto& sinks = g_logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
    }
    sink_->flush();
}

std::string_view levelToString(LogLevel level) {
    return entryFor(level).name;
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    for (const auto& entry : kLevels) {
        if (lower == entry.name) {
            return entry.level;
        }
    }
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "err") {
        return LogLevel::Error;
    }
    if (lower == "fatal") {
        return LogLevel::Critical;
    }
    if (lower == "none") {
        return LogLevel::Off;
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace podium
