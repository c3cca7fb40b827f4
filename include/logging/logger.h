/**
 * @file logger.h
 * @brief spdlog-backed logging for the audio segmenter
 *
 * stdout carries the JSON result of a split job, so log output goes to stderr and,
 * when the "logging" section of the config names a filePath, to a rotating file.
 * One logger is shared by the calling thread and every encode worker; all sinks are
 * thread-safe and the LOG_* macros may be used from any thread.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace audio_segmenter {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

// stderr only, short timestamps; used before the config file is known
bool initializeEarly();

/**
 * @brief Rebuild the logger from the "logging" section of a JSON config.
 *
 * Keys: level, filePath, maxFileSize, maxBackups, consoleOutput, coloredOutput, pattern.
 * A missing file or section keeps stderr output at info level. Returns false only
 * when no logger could be built (e.g. the log file cannot be opened).
 */
bool initializeFromConfig(const std::string& configPath);

// Applies to the logger and all of its sinks
void setLevel(LogLevel level);

void flush();
void shutdown();

// "warning", "err", "fatal" and "none" are accepted as aliases; unknown names map to Info
LogLevel parseLevel(std::string_view name);
std::string_view levelName(LogLevel level);

// Created on first use with stderr defaults; never null
std::shared_ptr<spdlog::logger> logger();

}  // namespace logging
}  // namespace audio_segmenter

#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(audio_segmenter::logging::logger(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(audio_segmenter::logging::logger(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(audio_segmenter::logging::logger(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(audio_segmenter::logging::logger(), __VA_ARGS__)
