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

#include "events.h"
#include <strings.h>

DaemonResult makeResult(DaemonError error, const char* message) {
  DaemonResult result = DaemonResult();
  result.error = error;
  copyText(result.message, message ? message : daemonErrorName(error));
  return result;
}

DaemonStatus makeEmptyStatus() {
  DaemonStatus status = DaemonStatus();
  status.state = PlaybackState::Stopped;
  status.error = DaemonError::None;
  status.stationIndex = -1;
  status.volume = -1;
  return status;
}

Event makeInputEvent(InputType type, ButtonId button, unsigned long timestamp) {
  Event event = Event();
  event.type = EventType::Input;
  event.timestamp = timestamp;
  event.input.type = type;
  event.input.button = button;
  event.input.timestamp = timestamp;
  event.minuteOfDay = -1;
  return event;
}

Event makeStatusEvent(const DaemonStatus& status, unsigned long timestamp) {
  Event event = Event();
  event.type = EventType::Status;
  event.timestamp = timestamp;
  event.status = status;
  event.minuteOfDay = -1;
  return event;
}

Event makeCommandDoneEvent(const Command& command, const DaemonResult& result, unsigned long timestamp) {
  Event event = Event();
  event.type = EventType::CommandDone;
  event.timestamp = timestamp;
  event.command = command;
  event.result = result;
  event.minuteOfDay = -1;
  return event;
}

Event makeTickEvent(int minuteOfDay, unsigned long timestamp) {
  Event event = Event();
  event.type = EventType::Tick;
  event.timestamp = timestamp;
  event.minuteOfDay = minuteOfDay;
  return event;
}

const char* daemonErrorName(DaemonError error) {
  switch (error) {
    case DaemonError::None:              return "OK";
    case DaemonError::DaemonUnavailable: return "Daemon unavailable";
    case DaemonError::StreamError:       return "Stream error";
    case DaemonError::Timeout:           return "Timeout";
  }
  return "Unknown error";
}

const char* playbackStateName(PlaybackState state) {
  switch (state) {
    case PlaybackState::Stopped:   return "Stopped";
    case PlaybackState::Playing:   return "Playing";
    case PlaybackState::Buffering: return "Buffering";
    case PlaybackState::Error:     return "Error";
  }
  return "Unknown";
}

const char* buttonName(ButtonId button) {
  switch (button) {
    case ButtonId::Select: return "select";
    case ButtonId::Menu:   return "menu";
    case ButtonId::Back:   return "back";
  }
  return "unknown";
}

const char* commandKindName(CommandKind kind) {
  switch (kind) {
    case CommandKind::SelectAndPlay: return "play";
    case CommandKind::Stop:          return "stop";
    case CommandKind::SetVolume:     return "setvol";
  }
  return "unknown";
}

bool buttonFromName(const char* name, ButtonId& button) {
  if (name == nullptr) {
    return false;
  }
  for (int i = 0; i < BUTTON_COUNT; i++) {
    ButtonId candidate = static_cast<ButtonId>(i);
    if (strcasecmp(name, buttonName(candidate)) == 0) {
      button = candidate;
      return true;
    }
  }
  return false;
}
