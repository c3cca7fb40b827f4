#include "logging/logger.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace audio_segmenter {
namespace logging {

namespace {

struct SinkSettings {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // empty = no file sink
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

constexpr const char* kLoggerName = "audio_segmenter";

std::mutex gMutex;
std::shared_ptr<spdlog::logger> gLogger;

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

// Caller holds gMutex
bool install(const SinkSettings& settings) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (settings.consoleOutput) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            if (!settings.coloredOutput) {
                console->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console);
        }
        if (!settings.filePath.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.filePath, settings.maxFileSize, settings.maxBackups));
        }

        auto created = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        created->set_pattern(settings.pattern);
        created->set_level(toSpdlog(settings.level));
        for (auto& sink : created->sinks()) {
            sink->set_level(toSpdlog(settings.level));
        }
        created->flush_on(spdlog::level::err);

        if (gLogger) {
            gLogger->flush();
        }
        gLogger = created;
        spdlog::set_default_logger(gLogger);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger setup failed: " << ex.what() << std::endl;
        return false;
    }
}

std::shared_ptr<spdlog::logger> ensureLogger() {
    std::lock_guard<std::mutex> lock(gMutex);
    if (!gLogger && !install(SinkSettings{})) {
        // Last resort so that LOG_* never dereferences null
        gLogger = std::make_shared<spdlog::logger>(kLoggerName);
    }
    return gLogger;
}

void readLoggingSection(const nlohmann::json& section, SinkSettings& settings) {
    if (section.contains("level")) {
        settings.level = parseLevel(section["level"].get<std::string>());
    }
    if (section.contains("filePath")) {
        settings.filePath = section["filePath"].get<std::string>();
    }
    if (section.contains("maxFileSize")) {
        settings.maxFileSize = section["maxFileSize"].get<size_t>();
    }
    if (section.contains("maxBackups")) {
        settings.maxBackups = section["maxBackups"].get<size_t>();
    }
    if (section.contains("consoleOutput")) {
        settings.consoleOutput = section["consoleOutput"].get<bool>();
    }
    if (section.contains("coloredOutput")) {
        settings.coloredOutput = section["coloredOutput"].get<bool>();
    }
    if (section.contains("pattern")) {
        settings.pattern = section["pattern"].get<std::string>();
    }
}

}  // namespace

bool initializeEarly() {
    SinkSettings settings;
    settings.pattern = "[%H:%M:%S.%e] [%^%l%$] %v";
    std::lock_guard<std::mutex> lock(gMutex);
    return install(settings);
}

bool initializeFromConfig(const std::string& configPath) {
    SinkSettings settings;
    std::ifstream file(configPath);
    if (file.is_open()) {
        try {
            const auto json = nlohmann::json::parse(file);
            if (json.contains("logging") && json["logging"].is_object()) {
                readLoggingSection(json["logging"], settings);
            }
        } catch (const nlohmann::json::exception& ex) {
            settings = SinkSettings{};
            std::cerr << "Ignoring logging section of " << configPath << ": " << ex.what()
                      << std::endl;
        }
    }

    bool installed = false;
    {
        std::lock_guard<std::mutex> lock(gMutex);
        installed = install(settings);
    }
    if (installed) {
        LOG_DEBUG("Logging at {} level{}{}", levelName(settings.level),
                  settings.filePath.empty() ? "" : ", file ", settings.filePath);
    }
    return installed;
}

void setLevel(LogLevel level) {
    auto current = ensureLogger();
    current->set_level(toSpdlog(level));
    for (auto& sink : current->sinks()) {
        sink->set_level(toSpdlog(level));
    }
}

void flush() {
    ensureLogger()->flush();
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gMutex);
    if (gLogger) {
        gLogger->flush();
    }
    gLogger.reset();
    spdlog::shutdown();
}

LogLevel parseLevel(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") {
        return LogLevel::Trace;
    }
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "error" || lower == "err") {
        return LogLevel::Error;
    }
    if (lower == "critical" || lower == "fatal") {
        return LogLevel::Critical;
    }
    if (lower == "off" || lower == "none") {
        return LogLevel::Off;
    }
    return LogLevel::Info;
}

std::string_view levelName(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    }
    return "info";
}

std::shared_ptr<spdlog::logger> logger() {
    return ensureLogger();
}

}  // namespace logging
}  // namespace audio_segmenter
