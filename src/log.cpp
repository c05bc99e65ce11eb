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

#include "log.h"
#include <stdio.h>

// Longest formatted message, longer lines are truncated
#define LOG_LINE_SIZE 256

/**
 * @brief Default sink, writes to stdout
 * On the ESP32 stdout is mapped to UART0, same as Serial.
 */
static void stdoutSink(LogLevel level, const char* tag, const char* message) {
  printf("[%s][%s] %s\n", logLevelLabel(level), tag ? tag : "-", message);
}

static LogSink activeSink = stdoutSink;
static LogLevel activeLevel = LogLevel::Info;

void setLogSink(LogSink sink) {
  activeSink = sink ? sink : stdoutSink;
}

void setLogLevel(LogLevel level) {
  activeLevel = level;
}

LogLevel getLogLevel() {
  return activeLevel;
}

const char* logLevelLabel(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "D";
    case LogLevel::Info:  return "I";
    case LogLevel::Warn:  return "W";
    case LogLevel::Error: return "E";
    default:              return "-";
  }
}

void vlogMessage(LogLevel level, const char* tag, const char* fmt, va_list args) {
  if (level == LogLevel::None || static_cast<int>(level) < static_cast<int>(activeLevel)) {
    return;
  }
  char line[LOG_LINE_SIZE];
  vsnprintf(line, sizeof(line), fmt, args);
  activeSink(level, tag, line);
}

void logMessage(LogLevel level, const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlogMessage(level, tag, fmt, args);
  va_end(args);
}
