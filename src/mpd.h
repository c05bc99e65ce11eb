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

#ifndef MPD_H
#define MPD_H

#include <stddef.h>
#include <stdint.h>
#include "events.h"
#include "playlist.h"

// MPD protocol constants
#define MPD_DEFAULT_PORT     6600
#define MPD_GREETING         "OK MPD "
#define MPD_LINE_SIZE        256
#define MPD_HOST_SIZE        64
#define MPD_PASSWORD_SIZE    64
#define MPD_COMMAND_SIZE     (STATION_URL_SIZE * 2 + 16)

// ACK error codes that mean the daemon refuses to serve us
#define MPD_ACK_ERROR_PASSWORD    3
#define MPD_ACK_ERROR_PERMISSION  4

/**
 * @brief Outcome of a line read
 */
enum class ReadStatus { Ok, Timeout, Closed };

/**
 * @brief Line oriented byte stream to the daemon
 * @details Implemented over WiFiClient on the device and by an in-memory
 * daemon in the tests. Lines are exchanged without the trailing newline.
 */
class MPDTransport {
public:
  virtual ~MPDTransport() {}

  /**
   * @brief Open the connection
   * @param host Host name or dotted address
   * @param port TCP port
   * @param timeoutMs Connect timeout in milliseconds
   * @return true if connected
   */
  virtual bool connect(const char* host, uint16_t port, unsigned long timeoutMs) = 0;
  virtual bool connected() = 0;
  virtual void stop() = 0;

  /**
   * @brief Send one line, the newline is appended by the transport
   * @return false if the line could not be written
   */
  virtual bool writeLine(const char* line) = 0;

  /**
   * @brief Read one line, waiting at most timeoutMs
   * @param buffer Destination, always terminated on Ok
   * @param size Buffer size, longer lines are truncated
   * @param timeoutMs Maximum wait in milliseconds
   */
  virtual ReadStatus readLine(char* buffer, size_t size, unsigned long timeoutMs) = 0;

  /**
   * @brief Monotonic time in milliseconds, used for response deadlines
   */
  virtual unsigned long currentTime() = 0;
};

/**
 * @brief Fields collected from a daemon response
 * Only the keys used by the client are kept, the rest is skipped.
 */
struct MPDReply {
  char state[16];                  ///< "play", "pause" or "stop"
  int volume;                      ///< Mixer volume, -1 if absent
  bool hasAudio;                   ///< An "audio:" line was seen (decoder running)
  char error[RESULT_MESSAGE_SIZE]; ///< Content of the "error:" line
  char file[STATUS_URI_SIZE];      ///< Current song URI
  char title[STATUS_TITLE_SIZE];   ///< Stream title
  char name[STATUS_TITLE_SIZE];    ///< Stream name

  void clear();
};

/**
 * @brief MPD client
 * @details Speaks the MPD text protocol to an external daemon: the station
 * list is pushed as a single-entry queue (clear, add, play), playback is
 * stopped and the mixer volume is set with plain commands, and the state is
 * read with status and currentsong in one command list.
 *
 * The connection is opened lazily, kept between requests and re-opened after
 * a timeout or when the daemon has dropped it. Every request answers with an
 * explicit DaemonResult, nothing is retried beyond one reconnect of a stale
 * connection.
 *
 * The command timeout bounds a whole operation: connecting, the greeting, the
 * password and every round trip of the request share one deadline.
 *
 * An instance is not thread safe; the firmware runs one instance per task.
 */
class MPDClient {
private:
  MPDTransport& transport;        ///< Byte stream to the daemon
  const Playlist& playlist;       ///< Station list, read only
  char host[MPD_HOST_SIZE];       ///< Daemon host
  uint16_t port;                  ///< Daemon port
  char password[MPD_PASSWORD_SIZE]; ///< Optional password, empty when not used
  unsigned long timeout;          ///< Command timeout in milliseconds
  unsigned long deadline;         ///< End of the current operation
  bool ready;                     ///< Connected, greeted and authenticated
  uint32_t playsSent;             ///< Number of play command lists sent

public:
  MPDClient(MPDTransport& transportRef, const Playlist& playlistRef, const char* mpdHost,
            uint16_t mpdPort = MPD_DEFAULT_PORT, const char* mpdPassword = nullptr,
            unsigned long timeoutMs = 2000);

  /**
   * @brief Change the daemon address, the current connection is dropped
   */
  void setServer(const char* mpdHost, uint16_t mpdPort, const char* mpdPassword);

  /**
   * @brief Play a station
   * @details Skips the request when the daemon already plays the station's
   * URI, so repeating it is harmless.
   * @param stationIndex Index in the station list
   * @return Result of the request
   */
  DaemonResult selectAndPlay(int stationIndex);

  DaemonResult stop();

  /**
   * @brief Set the mixer volume
   * @param level Volume, clamped to 0-100
   */
  DaemonResult setVolume(int level);

  /**
   * @brief Query the daemon state
   * @details Never waits longer than the command timeout. Failures are
   * reported as an Error state carrying the classification.
   * @return Daemon status snapshot
   */
  DaemonStatus pollStatus();

  /**
   * @brief Run a coordinator command
   */
  DaemonResult execute(const Command& command);

  void disconnect();
  bool isReady() const { return ready; }
  uint32_t getPlaysSent() const { return playsSent; }

  /**
   * @brief Quote a command argument
   * @details Wraps the value in double quotes, escaping quotes and backslashes.
   * @return false if the result does not fit
   */
  static bool quoteArgument(const char* value, char* buffer, size_t size);

  /**
   * @brief Classify an ACK line
   * @param line Response line starting with "ACK "
   * @param message Receives the human readable part of the line
   * @return DaemonUnavailable for password and permission errors, else StreamError
   */
  static DaemonError classifyAck(const char* line, char (&message)[RESULT_MESSAGE_SIZE]);

private:
  void startOperation();
  unsigned long remaining();
  DaemonResult connectDaemon();
  DaemonResult transact(const char* const* lines, int count, MPDReply* reply);
  DaemonResult exchange(const char* const* lines, int count, MPDReply* reply, bool& stale);
  DaemonResult readResponse(MPDReply* reply, bool& nothingRead);
  void dropConnection();
};

#endif // MPD_H
