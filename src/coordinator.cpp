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

#include "coordinator.h"
#include "log.h"
#include <stdio.h>

static const char* TAG = "coord";

/**
 * @brief Wraparound safe "now is at or past deadline"
 */
static bool reached(unsigned long now, unsigned long deadline) {
  return static_cast<long>(now - deadline) >= 0;
}

const char* uiModeName(UiMode mode) {
  switch (mode) {
    case UiMode::Browsing:     return "Browsing";
    case UiMode::Playing:      return "Playing";
    case UiMode::VolumeAdjust: return "VolumeAdjust";
  }
  return "Unknown";
}

Coordinator::Coordinator(const Playlist& playlistRef, const Config& configRef, CommandPort& commandPort,
                         RenderPort& renderPort)
  : playlist(playlistRef), config(configRef), commands(commandPort), renderer(renderPort),
    inFlight(false), playbackPending(false), volumePending(false), nextCommandId(1),
    lastCommandDoneAt(0), commandCompleted(false), userInteracted(false), adopted(false),
    rendered(false), renderRequests(0) {
  state.mode = UiMode::Browsing;
  state.previousMode = UiMode::Browsing;
  state.selectedIndex = 0;
  state.playingIndex = -1;
  state.volumeLevel = config.default_volume;
  state.lastKnownDaemonStatus = makeEmptyStatus();
  state.hasDaemonStatus = false;
  state.overlay.active = false;
  state.overlay.error = DaemonError::None;
  state.overlay.expiresAt = 0;
  state.lastInputTime = 0;
  state.minuteOfDay = -1;
  state.lastRenderedSnapshot = makeBlankSnapshot();
  state.lastRenderTimestamp = 0;
  inFlightCommand = Command();
  pendingPlayback = Command();
  pendingVolume = Command();
}

void Coordinator::begin(unsigned long now) {
  LOGI(TAG, "Starting with %d stations, %s", playlist.getCount(),
       config.live_preview ? "live preview" : "confirm mode");
  rendered = false;
  updateDisplay(now);
}

void Coordinator::handle(const Event& event) {
  switch (event.type) {
    case EventType::Input:
      handleInput(event.input, event.timestamp);
      break;
    case EventType::Status:
      handleStatus(event.status, event.timestamp);
      break;
    case EventType::CommandDone:
      handleCommandDone(event.command, event.result, event.timestamp);
      break;
    case EventType::Tick:
      state.minuteOfDay = event.minuteOfDay;
      break;
  }
  updateDisplay(event.timestamp);
}

void Coordinator::tick(unsigned long now) {
  bool changed = false;
  if (state.overlay.active && reached(now, state.overlay.expiresAt)) {
    state.overlay.active = false;
    changed = true;
  }
  if (state.mode == UiMode::VolumeAdjust &&
      (now - state.lastInputTime) >= static_cast<unsigned long>(config.volume_timeout)) {
    LOGD(TAG, "Volume mode timed out");
    exitVolume();
    changed = true;
  }
  if (changed) {
    updateDisplay(now);
  }
}

/**
 * @brief Input events
 * @details A visible error overlay is dismissed by any input, which is then
 * processed as usual. The long press of the volume button enters volume mode
 * from any mode; everything else depends on the mode.
 */
void Coordinator::handleInput(const InputEvent& input, unsigned long now) {
  state.lastInputTime = now;
  userInteracted = true;
  state.overlay.active = false;
  if (input.type == InputType::LongPress) {
    if (input.button == config.volume_button) {
      enterVolume(now);
    } else {
      LOGD(TAG, "Long press on %s ignored", buttonName(input.button));
    }
    return;
  }
  switch (state.mode) {
    case UiMode::Browsing:
      handleBrowsing(input, now);
      break;
    case UiMode::Playing:
      handlePlaying(input, now);
      break;
    case UiMode::VolumeAdjust:
      handleVolume(input, now);
      break;
  }
}

void Coordinator::handleBrowsing(const InputEvent& input, unsigned long now) {
  if (playlist.isEmpty()) {
    return;
  }
  switch (input.type) {
    case InputType::RotateCW:
      state.selectedIndex = playlist.wrapIndex(state.selectedIndex, 1);
      break;
    case InputType::RotateCCW:
      state.selectedIndex = playlist.wrapIndex(state.selectedIndex, -1);
      break;
    case InputType::Click:
      if (input.button == ButtonId::Select) {
        play(state.selectedIndex, now);
      } else if (input.button == ButtonId::Back) {
        // Back to the station the daemon is on, if it is one of ours
        int daemonIndex = state.lastKnownDaemonStatus.stationIndex;
        if (state.hasDaemonStatus && playlist.isValidIndex(daemonIndex)) {
          state.selectedIndex = daemonIndex;
        }
      }
      break;
    default:
      break;
  }
}

void Coordinator::handlePlaying(const InputEvent& input, unsigned long now) {
  switch (input.type) {
    case InputType::RotateCW:
    case InputType::RotateCCW:
      if (playlist.isEmpty()) {
        return;
      }
      state.selectedIndex = playlist.wrapIndex(state.selectedIndex,
                                               input.type == InputType::RotateCW ? 1 : -1);
      if (config.live_preview && state.selectedIndex != state.playingIndex) {
        play(state.selectedIndex, now);
      }
      break;
    case InputType::Click:
      if (input.button == ButtonId::Select) {
        if (!config.live_preview && state.selectedIndex != state.playingIndex) {
          play(state.selectedIndex, now);
        } else {
          stopPlayback(now);
        }
      } else if (input.button == ButtonId::Back) {
        stopPlayback(now);
      }
      break;
    default:
      break;
  }
}

void Coordinator::handleVolume(const InputEvent& input, unsigned long now) {
  int level = state.volumeLevel;
  switch (input.type) {
    case InputType::RotateCW:
      level += config.volume_step;
      break;
    case InputType::RotateCCW:
      level -= config.volume_step;
      break;
    case InputType::Click:
      exitVolume();
      return;
    default:
      return;
  }
  if (level < 0) level = 0;
  if (level > 100) level = 100;
  if (level != state.volumeLevel) {
    state.volumeLevel = level;
    issue(CommandKind::SetVolume, -1, level, now);
  }
}

/**
 * @brief Status poll results
 * @details Besides keeping the last status, this adopts the daemon's station
 * at startup and follows playback that stopped or failed on the daemon side.
 * A status is only trusted when it was polled after the last command
 * completed and no command is waiting, otherwise it may describe the state
 * before our own command.
 */
void Coordinator::handleStatus(const DaemonStatus& status, unsigned long now) {
  state.lastKnownDaemonStatus = status;
  state.hasDaemonStatus = true;
  bool settled = !inFlight && !playbackPending && !volumePending &&
                 (!commandCompleted || static_cast<long>(now - lastCommandDoneAt) > 0);
  if (!settled) {
    return;
  }
  if (status.volume >= 0 && state.mode != UiMode::VolumeAdjust) {
    state.volumeLevel = status.volume;
  }
  bool daemonPlaying = status.state == PlaybackState::Playing || status.state == PlaybackState::Buffering;
  if (config.follow_daemon && !adopted && !userInteracted) {
    if (daemonPlaying && playlist.isValidIndex(status.stationIndex)) {
      adopted = true;
      state.selectedIndex = status.stationIndex;
      state.playingIndex = status.stationIndex;
      state.mode = UiMode::Playing;
      LOGI(TAG, "Following daemon on %s", playlist.getItem(status.stationIndex).name);
      return;
    }
  }
  if (!effectivelyPlaying()) {
    return;
  }
  if (status.state == PlaybackState::Stopped) {
    LOGI(TAG, "Playback stopped on the daemon");
    leavePlaying();
  } else if (status.state == PlaybackState::Error && status.error == DaemonError::StreamError) {
    LOGW(TAG, "Daemon reports a stream error");
    leavePlaying();
    showError(DaemonError::StreamError, now);
  } else if (daemonPlaying && playlist.isValidIndex(status.stationIndex) &&
             status.stationIndex != state.playingIndex) {
    // Another client changed the station
    state.playingIndex = status.stationIndex;
    if (config.live_preview) {
      state.selectedIndex = status.stationIndex;
    }
  }
}

/**
 * @brief Command completion
 * @details Completions of anything but the command in flight are ignored.
 * A failure shows the error overlay; a failed play also reverts the
 * optimistic Playing mode and drops the parked playback intent, a failed
 * volume change falls back to the daemon's volume.
 */
void Coordinator::handleCommandDone(const Command& command, const DaemonResult& result, unsigned long now) {
  if (!inFlight || command.id != inFlightCommand.id) {
    LOGW(TAG, "Ignoring completion of stale command %u", static_cast<unsigned>(command.id));
    return;
  }
  inFlight = false;
  lastCommandDoneAt = now;
  commandCompleted = true;
  if (!result.ok()) {
    LOGW(TAG, "Command %s failed: %s", commandKindName(command.kind), result.message);
    showError(result.error, now);
    if (command.kind == CommandKind::SelectAndPlay) {
      playbackPending = false;
      leavePlaying();
    } else if (command.kind == CommandKind::SetVolume) {
      if (state.hasDaemonStatus && state.lastKnownDaemonStatus.volume >= 0) {
        state.volumeLevel = state.lastKnownDaemonStatus.volume;
      }
    }
  } else {
    LOGD(TAG, "Command %s done", commandKindName(command.kind));
  }
  dispatchPending(now);
}

void Coordinator::play(int stationIndex, unsigned long now) {
  state.playingIndex = stationIndex;
  state.mode = UiMode::Playing;
  LOGI(TAG, "Select %s", playlist.getItem(stationIndex).name);
  issue(CommandKind::SelectAndPlay, stationIndex, -1, now);
}

void Coordinator::stopPlayback(unsigned long now) {
  state.playingIndex = -1;
  state.mode = UiMode::Browsing;
  LOGI(TAG, "Stop");
  issue(CommandKind::Stop, -1, -1, now);
}

void Coordinator::enterVolume(unsigned long now) {
  if (state.mode != UiMode::VolumeAdjust) {
    state.previousMode = state.mode;
    state.mode = UiMode::VolumeAdjust;
    if (state.hasDaemonStatus && state.lastKnownDaemonStatus.volume >= 0) {
      state.volumeLevel = state.lastKnownDaemonStatus.volume;
    }
    LOGD(TAG, "Volume mode, level %d", state.volumeLevel);
  }
  state.lastInputTime = now;
}

void Coordinator::exitVolume() {
  if (state.mode == UiMode::VolumeAdjust) {
    state.mode = state.previousMode;
  }
}

bool Coordinator::effectivelyPlaying() const {
  return state.mode == UiMode::Playing ||
         (state.mode == UiMode::VolumeAdjust && state.previousMode == UiMode::Playing);
}

/**
 * @brief Fall back to Browsing, or make volume mode return there
 */
void Coordinator::leavePlaying() {
  state.playingIndex = -1;
  if (state.mode == UiMode::Playing) {
    state.mode = UiMode::Browsing;
  } else if (state.mode == UiMode::VolumeAdjust && state.previousMode == UiMode::Playing) {
    state.previousMode = UiMode::Browsing;
  }
}

void Coordinator::issue(CommandKind kind, int stationIndex, int volume, unsigned long now) {
  Command command;
  command.kind = kind;
  command.id = nextCommandId++;
  command.stationIndex = stationIndex;
  command.volume = volume;
  if (!inFlight) {
    dispatch(command, now);
    return;
  }
  // Park the intent, replacing an older one of the same kind
  if (kind == CommandKind::SetVolume) {
    volumePending = true;
    pendingVolume = command;
  } else {
    playbackPending = true;
    pendingPlayback = command;
  }
}

void Coordinator::dispatch(const Command& command, unsigned long now) {
  inFlight = true;
  inFlightCommand = command;
  LOGD(TAG, "Dispatch %s #%u", commandKindName(command.kind), static_cast<unsigned>(command.id));
  if (!commands.submit(command)) {
    LOGE(TAG, "Cannot queue command %s", commandKindName(command.kind));
    handleCommandDone(command, makeResult(DaemonError::DaemonUnavailable, "Command queue full"), now);
  }
}

void Coordinator::dispatchPending(unsigned long now) {
  if (inFlight) {
    return;
  }
  if (playbackPending) {
    playbackPending = false;
    dispatch(pendingPlayback, now);
  } else if (volumePending) {
    volumePending = false;
    dispatch(pendingVolume, now);
  }
}

void Coordinator::showError(DaemonError error, unsigned long now) {
  state.overlay.active = true;
  state.overlay.error = error;
  state.overlay.expiresAt = now + config.error_timeout;
}

void Coordinator::updateDisplay(unsigned long now) {
  RenderSnapshot snapshot = buildSnapshot();
  if (rendered && snapshot == state.lastRenderedSnapshot) {
    return;
  }
  renderer.requestRender(snapshot, now);
  state.lastRenderedSnapshot = snapshot;
  state.lastRenderTimestamp = now;
  rendered = true;
  renderRequests++;
}

RenderSnapshot Coordinator::buildSnapshot() const {
  RenderSnapshot snapshot = makeBlankSnapshot();
  buildHeader(snapshot);
  if (state.minuteOfDay >= 0) {
    snprintf(snapshot.clock, sizeof(snapshot.clock), "%02d:%02d",
             (state.minuteOfDay / 60) % 24, state.minuteOfDay % 60);
  }
  switch (state.mode) {
    case UiMode::VolumeAdjust:
      snapshot.layout = ScreenLayout::Volume;
      copyText(snapshot.lines[0], "Volume");
      snapshot.volume = state.volumeLevel;
      break;
    case UiMode::Playing:
      // In confirm mode the browsed station is shown until it is confirmed
      if (!config.live_preview && state.selectedIndex != state.playingIndex) {
        buildList(snapshot);
      } else {
        buildNowPlaying(snapshot);
      }
      break;
    case UiMode::Browsing:
      buildList(snapshot);
      break;
  }
  if (state.overlay.active) {
    copyText(snapshot.overlay, daemonErrorName(state.overlay.error));
  }
  return snapshot;
}

/**
 * @brief Title bar text, a summary of the daemon state
 */
void Coordinator::buildHeader(RenderSnapshot& snapshot) const {
  if (!state.hasDaemonStatus) {
    copyText(snapshot.header, "Internet Radio");
    return;
  }
  const DaemonStatus& status = state.lastKnownDaemonStatus;
  switch (status.state) {
    case PlaybackState::Error:
      copyText(snapshot.header, status.error == DaemonError::StreamError ? "Stream error" : "Offline");
      break;
    case PlaybackState::Stopped:
      copyText(snapshot.header, "Stopped");
      break;
    case PlaybackState::Playing:
    case PlaybackState::Buffering:
      if (status.stationIndex >= 0) {
        snprintf(snapshot.header, sizeof(snapshot.header), "%s #%d",
                 playbackStateName(status.state), status.stationIndex + 1);
      } else {
        copyText(snapshot.header, playbackStateName(status.state));
      }
      break;
  }
}

/**
 * @brief Three line browser: previous, selected (inverted) and next station
 */
void Coordinator::buildList(RenderSnapshot& snapshot) const {
  snapshot.layout = ScreenLayout::List;
  int count = playlist.getCount();
  if (count == 0) {
    copyText(snapshot.lines[1], "No stations");
    snapshot.highlight = -1;
    return;
  }
  copyText(snapshot.lines[1], playlist.getItem(state.selectedIndex).name);
  snapshot.highlight = 1;
  if (count >= 2) {
    copyText(snapshot.lines[2], playlist.getItem(playlist.wrapIndex(state.selectedIndex, 1)).name);
  }
  if (count >= 3) {
    copyText(snapshot.lines[0], playlist.getItem(playlist.wrapIndex(state.selectedIndex, -1)).name);
  }
}

/**
 * @brief Station name, stream title and playback state
 */
void Coordinator::buildNowPlaying(RenderSnapshot& snapshot) const {
  snapshot.layout = ScreenLayout::NowPlaying;
  if (!playlist.isValidIndex(state.playingIndex)) {
    return;
  }
  copyText(snapshot.lines[0], playlist.getItem(state.playingIndex).name);
  const DaemonStatus& status = state.lastKnownDaemonStatus;
  if (state.hasDaemonStatus && status.stationIndex == state.playingIndex &&
      (status.state == PlaybackState::Playing || status.state == PlaybackState::Buffering)) {
    copyText(snapshot.lines[1], status.title);
    copyText(snapshot.lines[2], playbackStateName(status.state));
  } else {
    copyText(snapshot.lines[2], "Tuning");
  }
}
