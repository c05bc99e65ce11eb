/*
 * DialTuner - An ESP32-based e-paper internet radio remote for MPD
 * Copyright (C) 2025 Costin Stroie
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef LOG_H
#define LOG_H

#include <stdarg.h>

/**
 * @brief Log severity levels
 */
enum class LogLevel { Debug, Info, Warn, Error, None };

/**
 * @brief Log sink function type
 * @details Receives one fully formatted line, without the trailing newline.
 * The firmware routes it to the serial console, tests may capture it.
 */
typedef void (*LogSink)(LogLevel level, const char* tag, const char* message);

/**
 * @brief Replace the active log sink
 * @param sink New sink, or nullptr to restore the default stdout sink
 */
void setLogSink(LogSink sink);

/**
 * @brief Set the minimum level that reaches the sink
 * @param level Lowest level to emit, LogLevel::None silences everything
 */
void setLogLevel(LogLevel level);

LogLevel getLogLevel();

/**
 * @brief Single character label of a level ("D", "I", "W", "E")
 */
const char* logLevelLabel(LogLevel level);

/**
 * @brief Format and emit a log line
 * @param level Message severity
 * @param tag Short module tag, may be nullptr
 * @param fmt printf-style format
 */
void logMessage(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
  __attribute__((format(printf, 3, 4)))
#endif
  ;

void vlogMessage(LogLevel level, const char* tag, const char* fmt, va_list args);

#define LOGD(TAG, FMT, ...) logMessage(LogLevel::Debug, TAG, FMT, ##__VA_ARGS__)
#define LOGI(TAG, FMT, ...) logMessage(LogLevel::Info,  TAG, FMT, ##__VA_ARGS__)
#define LOGW(TAG, FMT, ...) logMessage(LogLevel::Warn,  TAG, FMT, ##__VA_ARGS__)
#define LOGE(TAG, FMT, ...) logMessage(LogLevel::Error, TAG, FMT, ##__VA_ARGS__)

#endif // LOG_H
