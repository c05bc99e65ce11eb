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

#include "mpd.h"
#include "log.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static const char* TAG = "mpd";

// Status and current song in one round trip
static const char* const STATUS_QUERY[] = {
  "command_list_begin",
  "status",
  "currentsong",
  "command_list_end"
};
static const int STATUS_QUERY_COUNT = sizeof(STATUS_QUERY) / sizeof(STATUS_QUERY[0]);

void MPDReply::clear() {
  state[0] = '\0';
  volume = -1;
  hasAudio = false;
  error[0] = '\0';
  file[0] = '\0';
  title[0] = '\0';
  name[0] = '\0';
}

/**
 * @brief Store one "key: value" response line
 * @param line Response line
 * @param reply Collected fields
 */
static void parseField(const char* line, MPDReply& reply) {
  const char* sep = strstr(line, ": ");
  if (sep == nullptr) {
    return;
  }
  size_t keyLen = sep - line;
  const char* value = sep + 2;
  if (keyLen == 5 && strncmp(line, "state", 5) == 0) {
    copyText(reply.state, value);
  } else if (keyLen == 6 && strncmp(line, "volume", 6) == 0) {
    reply.volume = atoi(value);
  } else if (keyLen == 5 && strncmp(line, "audio", 5) == 0) {
    reply.hasAudio = true;
  } else if (keyLen == 5 && strncmp(line, "error", 5) == 0) {
    copyText(reply.error, value);
  } else if (keyLen == 4 && strncmp(line, "file", 4) == 0) {
    copyText(reply.file, value);
  } else if (keyLen == 5 && strncmp(line, "Title", 5) == 0) {
    copyText(reply.title, value);
  } else if (keyLen == 4 && strncmp(line, "Name", 4) == 0) {
    copyText(reply.name, value);
  }
}

MPDClient::MPDClient(MPDTransport& transportRef, const Playlist& playlistRef, const char* mpdHost,
                     uint16_t mpdPort, const char* mpdPassword, unsigned long timeoutMs)
  : transport(transportRef), playlist(playlistRef), port(mpdPort), timeout(timeoutMs),
    deadline(0), ready(false), playsSent(0) {
  copyText(host, mpdHost);
  copyText(password, mpdPassword);
}

void MPDClient::setServer(const char* mpdHost, uint16_t mpdPort, const char* mpdPassword) {
  dropConnection();
  copyText(host, mpdHost);
  port = mpdPort;
  copyText(password, mpdPassword);
}

bool MPDClient::quoteArgument(const char* value, char* buffer, size_t size) {
  if (value == nullptr || size < 3) {
    return false;
  }
  size_t pos = 0;
  buffer[pos++] = '"';
  for (const char* p = value; *p; p++) {
    bool escape = (*p == '"' || *p == '\\');
    // Room for the character, its escape, the closing quote and the terminator
    if (pos + (escape ? 2 : 1) + 2 > size) {
      buffer[0] = '\0';
      return false;
    }
    if (escape) {
      buffer[pos++] = '\\';
    }
    buffer[pos++] = *p;
  }
  buffer[pos++] = '"';
  buffer[pos] = '\0';
  return true;
}

/**
 * @brief Classify an ACK line
 * @details The line format is: ACK [error@command_list_num] {current_command} message
 */
DaemonError MPDClient::classifyAck(const char* line, char (&message)[RESULT_MESSAGE_SIZE]) {
  int code = -1;
  const char* bracket = strchr(line, '[');
  if (bracket != nullptr) {
    code = atoi(bracket + 1);
  }
  const char* brace = strchr(line, '}');
  if (brace != nullptr) {
    const char* text = brace + 1;
    while (*text == ' ') text++;
    copyText(message, text);
  } else {
    copyText(message, line + 4);
  }
  if (message[0] == '\0') {
    copyText(message, daemonErrorName(DaemonError::StreamError));
  }
  if (code == MPD_ACK_ERROR_PASSWORD || code == MPD_ACK_ERROR_PERMISSION) {
    return DaemonError::DaemonUnavailable;
  }
  return DaemonError::StreamError;
}

/**
 * @brief Start the time budget of one operation
 */
void MPDClient::startOperation() {
  deadline = transport.currentTime() + timeout;
}

/**
 * @brief Time left until the operation deadline
 * @return Milliseconds, 0 once the deadline has passed
 */
unsigned long MPDClient::remaining() {
  long left = static_cast<long>(deadline - transport.currentTime());
  return left > 0 ? static_cast<unsigned long>(left) : 0;
}

void MPDClient::dropConnection() {
  if (ready) {
    LOGD(TAG, "Dropping connection to %s:%u", host, port);
  }
  transport.stop();
  ready = false;
}

void MPDClient::disconnect() {
  dropConnection();
}

/**
 * @brief Make sure there is a usable, greeted connection
 * @details Connects, checks the "OK MPD <version>" greeting and sends the
 * password when one is configured. An existing connection is reused.
 * @return Result of the connection attempt
 */
DaemonResult MPDClient::connectDaemon() {
  if (ready && transport.connected()) {
    return makeResult(DaemonError::None);
  }
  dropConnection();
  if (host[0] == '\0') {
    return makeResult(DaemonError::DaemonUnavailable, "No daemon host");
  }
  if (remaining() == 0) {
    return makeResult(DaemonError::Timeout);
  }
  if (!transport.connect(host, port, remaining())) {
    LOGW(TAG, "Cannot connect to %s:%u", host, port);
    return makeResult(DaemonError::DaemonUnavailable, "Cannot connect");
  }
  char line[MPD_LINE_SIZE];
  unsigned long left = remaining();
  ReadStatus status = left > 0 ? transport.readLine(line, sizeof(line), left) : ReadStatus::Timeout;
  if (status == ReadStatus::Timeout) {
    dropConnection();
    LOGW(TAG, "No greeting from %s:%u", host, port);
    return makeResult(DaemonError::Timeout, "No greeting");
  }
  if (status == ReadStatus::Closed) {
    dropConnection();
    return makeResult(DaemonError::DaemonUnavailable, "Connection closed");
  }
  if (strncmp(line, MPD_GREETING, strlen(MPD_GREETING)) != 0) {
    dropConnection();
    LOGW(TAG, "Unexpected greeting: %s", line);
    return makeResult(DaemonError::DaemonUnavailable, "Bad greeting");
  }
  LOGD(TAG, "Connected to %s:%u, %s", host, port, line + 3);
  if (password[0] != '\0') {
    char command[MPD_PASSWORD_SIZE * 2 + 16];
    strcpy(command, "password ");
    if (!quoteArgument(password, command + 9, sizeof(command) - 9) || !transport.writeLine(command)) {
      dropConnection();
      return makeResult(DaemonError::DaemonUnavailable, "Password not sent");
    }
    bool nothingRead = false;
    DaemonResult result = readResponse(nullptr, nothingRead);
    if (!result.ok()) {
      dropConnection();
      LOGW(TAG, "Password rejected: %s", result.message);
      if (result.error != DaemonError::Timeout) {
        result.error = DaemonError::DaemonUnavailable;
      }
      return result;
    }
  }
  ready = true;
  return makeResult(DaemonError::None);
}

/**
 * @brief Read a response until OK or ACK
 * @details The response must arrive before the operation deadline. The
 * connection is dropped on timeout, since the daemon may still answer later
 * and desynchronize the stream.
 * @param reply Receives the known fields, may be nullptr
 * @param nothingRead Set when the connection failed before the first line
 * @return Result of the command
 */
DaemonResult MPDClient::readResponse(MPDReply* reply, bool& nothingRead) {
  char line[MPD_LINE_SIZE];
  nothingRead = true;
  while (true) {
    unsigned long left = remaining();
    if (left == 0) {
      dropConnection();
      LOGW(TAG, "Response timeout after %lu ms", timeout);
      return makeResult(DaemonError::Timeout);
    }
    ReadStatus status = transport.readLine(line, sizeof(line), left);
    if (status == ReadStatus::Timeout) {
      dropConnection();
      LOGW(TAG, "Response timeout after %lu ms", timeout);
      return makeResult(DaemonError::Timeout);
    }
    if (status == ReadStatus::Closed) {
      dropConnection();
      return makeResult(DaemonError::DaemonUnavailable, "Connection closed");
    }
    nothingRead = false;
    if (strcmp(line, "OK") == 0) {
      return makeResult(DaemonError::None);
    }
    if (strncmp(line, "ACK ", 4) == 0) {
      char message[RESULT_MESSAGE_SIZE];
      DaemonError error = classifyAck(line, message);
      LOGW(TAG, "Daemon refused: %s", line);
      return makeResult(error, message);
    }
    if (strcmp(line, "list_OK") == 0) {
      continue;
    }
    if (reply != nullptr) {
      parseField(line, *reply);
    }
  }
}

/**
 * @brief Send the lines of one request and read the answer
 * @param stale Set when the connection turned out to be dead before any answer
 */
DaemonResult MPDClient::exchange(const char* const* lines, int count, MPDReply* reply, bool& stale) {
  stale = false;
  DaemonResult result = connectDaemon();
  if (!result.ok()) {
    return result;
  }
  for (int i = 0; i < count; i++) {
    if (!transport.writeLine(lines[i])) {
      dropConnection();
      stale = true;
      return makeResult(DaemonError::DaemonUnavailable, "Write failed");
    }
  }
  bool nothingRead = false;
  result = readResponse(reply, nothingRead);
  if (result.error == DaemonError::DaemonUnavailable && nothingRead) {
    stale = true;
  }
  return result;
}

/**
 * @brief Run one request, reconnecting once if the kept connection was stale
 * @details The daemon closes idle connections on its own, which is only
 * noticed on the next write or read. That case is retried on a fresh
 * connection; any other failure is returned as is.
 */
DaemonResult MPDClient::transact(const char* const* lines, int count, MPDReply* reply) {
  if (reply != nullptr) {
    reply->clear();
  }
  bool reused = ready && transport.connected();
  bool stale = false;
  DaemonResult result = exchange(lines, count, reply, stale);
  if (stale && reused) {
    LOGD(TAG, "Stale connection, reconnecting");
    if (reply != nullptr) {
      reply->clear();
    }
    result = exchange(lines, count, reply, stale);
  }
  return result;
}

DaemonResult MPDClient::selectAndPlay(int stationIndex) {
  if (!playlist.isValidIndex(stationIndex)) {
    LOGW(TAG, "Invalid station index %d", stationIndex);
    return makeResult(DaemonError::StreamError, "Invalid station");
  }
  const Station& station = playlist.getItem(stationIndex);
  startOperation();
  MPDReply reply;
  DaemonResult result = transact(STATUS_QUERY, STATUS_QUERY_COUNT, &reply);
  if (!result.ok()) {
    return result;
  }
  if (strcmp(reply.state, "play") == 0 && strcmp(reply.file, station.url) == 0) {
    LOGD(TAG, "Already playing %s", station.name);
    return result;
  }
  char addCommand[MPD_COMMAND_SIZE];
  strcpy(addCommand, "add ");
  if (!quoteArgument(station.url, addCommand + 4, sizeof(addCommand) - 4)) {
    return makeResult(DaemonError::StreamError, "URL too long");
  }
  const char* const lines[] = {
    "command_list_begin",
    "clear",
    addCommand,
    "play 0",
    "command_list_end"
  };
  result = transact(lines, sizeof(lines) / sizeof(lines[0]), nullptr);
  if (result.ok()) {
    playsSent++;
    LOGI(TAG, "Playing %s (%s)", station.name, station.url);
  }
  return result;
}

DaemonResult MPDClient::stop() {
  startOperation();
  const char* const lines[] = {"stop"};
  DaemonResult result = transact(lines, 1, nullptr);
  if (result.ok()) {
    LOGI(TAG, "Stopped");
  }
  return result;
}

DaemonResult MPDClient::setVolume(int level) {
  if (level < 0) level = 0;
  if (level > 100) level = 100;
  char command[16];
  snprintf(command, sizeof(command), "setvol %d", level);
  const char* const lines[] = {command};
  startOperation();
  DaemonResult result = transact(lines, 1, nullptr);
  if (result.ok()) {
    LOGD(TAG, "Volume set to %d", level);
  }
  return result;
}

DaemonStatus MPDClient::pollStatus() {
  DaemonStatus status = makeEmptyStatus();
  startOperation();
  MPDReply reply;
  DaemonResult result = transact(STATUS_QUERY, STATUS_QUERY_COUNT, &reply);
  if (!result.ok()) {
    status.state = PlaybackState::Error;
    status.error = result.error;
    return status;
  }
  status.volume = reply.volume;
  copyText(status.uri, reply.file);
  status.stationIndex = playlist.findByUrl(reply.file);
  copyText(status.title, reply.title[0] != '\0' ? reply.title : reply.name);
  if (reply.error[0] != '\0') {
    status.state = PlaybackState::Error;
    status.error = DaemonError::StreamError;
  } else if (strcmp(reply.state, "play") == 0) {
    status.state = reply.hasAudio ? PlaybackState::Playing : PlaybackState::Buffering;
  } else {
    status.state = PlaybackState::Stopped;
  }
  return status;
}

DaemonResult MPDClient::execute(const Command& command) {
  switch (command.kind) {
    case CommandKind::SelectAndPlay:
      return selectAndPlay(command.stationIndex);
    case CommandKind::Stop:
      return stop();
    case CommandKind::SetVolume:
      return setVolume(command.volume);
  }
  return makeResult(DaemonError::StreamError, "Unknown command");
}
