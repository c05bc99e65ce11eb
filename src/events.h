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

#ifndef EVENTS_H
#define EVENTS_H

#include <stddef.h>
#include <stdint.h>
#include <string.h>

// Buffer size constants
#define STATUS_URI_SIZE      128
#define STATUS_TITLE_SIZE     96
#define RESULT_MESSAGE_SIZE   64

/**
 * @brief Bounded copy into a fixed character buffer, always terminated
 */
template <size_t N>
inline void copyText(char (&dst)[N], const char* src) {
  if (src == nullptr) {
    dst[0] = '\0';
    return;
  }
  strncpy(dst, src, N - 1);
  dst[N - 1] = '\0';
}

/**
 * @brief Physical buttons
 * Select is the encoder push switch, Menu and Back are the auxiliary buttons.
 */
enum class ButtonId : uint8_t { Select = 0, Menu = 1, Back = 2 };

#define BUTTON_COUNT 3

enum class InputType : uint8_t { RotateCW, RotateCCW, Click, LongPress };

/**
 * @brief Debounced logical input event
 * The button field is only meaningful for Click and LongPress.
 */
struct InputEvent {
  InputType type;
  ButtonId button;
  unsigned long timestamp;  ///< millis() when the event was recognized
};

/**
 * @brief Failure classification of a daemon operation
 */
enum class DaemonError : uint8_t {
  None = 0,
  DaemonUnavailable,  ///< Cannot connect, bad greeting or access refused
  StreamError,        ///< Daemon refused the command or reported a playback error
  Timeout             ///< No complete answer within the command timeout
};

enum class PlaybackState : uint8_t { Stopped, Playing, Buffering, Error };

/**
 * @brief Snapshot of the daemon state, as seen by the last status poll
 */
struct DaemonStatus {
  PlaybackState state;           ///< Playback state, Error carries the error field
  DaemonError error;             ///< Error classification when state is Error
  int stationIndex;              ///< Index of the playing station, -1 if none or unknown
  int volume;                    ///< Mixer volume 0-100, -1 if the daemon has no mixer
  char uri[STATUS_URI_SIZE];     ///< Current song URI
  char title[STATUS_TITLE_SIZE]; ///< Current stream title
};

/**
 * @brief Outcome of a daemon command
 */
struct DaemonResult {
  DaemonError error;
  char message[RESULT_MESSAGE_SIZE];

  bool ok() const { return error == DaemonError::None; }
};

enum class CommandKind : uint8_t { SelectAndPlay, Stop, SetVolume };

/**
 * @brief Daemon command issued by the coordinator
 */
struct Command {
  CommandKind kind;
  uint32_t id;       ///< Sequence number, echoed in the completion event
  int stationIndex;  ///< SelectAndPlay only
  int volume;        ///< SetVolume only
};

enum class EventType : uint8_t { Input, Status, CommandDone, Tick };

/**
 * @brief Item of the coordinator event queue
 * @details Plain data so it can be copied by value through a FreeRTOS queue.
 * Which member is valid depends on the type:
 * - Input: input
 * - Status: status
 * - CommandDone: command and result
 * - Tick: minuteOfDay
 */
struct Event {
  EventType type;
  unsigned long timestamp;  ///< millis() when the event (or the poll) started
  InputEvent input;
  DaemonStatus status;
  Command command;
  DaemonResult result;
  int minuteOfDay;          ///< Wall clock minute (0-1439), -1 when not synchronized
};

// Helpers to build results and events
DaemonResult makeResult(DaemonError error, const char* message = nullptr);
DaemonStatus makeEmptyStatus();
Event makeInputEvent(InputType type, ButtonId button, unsigned long timestamp);
Event makeStatusEvent(const DaemonStatus& status, unsigned long timestamp);
Event makeCommandDoneEvent(const Command& command, const DaemonResult& result, unsigned long timestamp);
Event makeTickEvent(int minuteOfDay, unsigned long timestamp);

// Human readable names, used by logs and the display
const char* daemonErrorName(DaemonError error);
const char* playbackStateName(PlaybackState state);
const char* buttonName(ButtonId button);
const char* commandKindName(CommandKind kind);

/**
 * @brief Parse a button name ("select", "menu", "back")
 * @return true if the name is known
 */
bool buttonFromName(const char* name, ButtonId& button);

#endif // EVENTS_H
