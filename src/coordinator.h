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

#ifndef COORDINATOR_H
#define COORDINATOR_H

#include <stdint.h>
#include "config.h"
#include "events.h"
#include "playlist.h"
#include "render.h"

/**
 * @brief User interface modes
 */
enum class UiMode : uint8_t { Browsing, Playing, VolumeAdjust };

const char* uiModeName(UiMode mode);

/**
 * @brief Where the coordinator sends daemon commands
 * @details Implementations hand the command over to the command task and
 * return at once; the outcome comes back later as a CommandDone event.
 */
class CommandPort {
public:
  virtual ~CommandPort() {}

  /**
   * @brief Hand over a command
   * @return false if the command could not be queued
   */
  virtual bool submit(const Command& command) = 0;
};

/**
 * @brief Error overlay shown over the current screen
 */
struct ErrorOverlay {
  bool active;
  DaemonError error;
  unsigned long expiresAt;  ///< millis() when the overlay is removed
};

/**
 * @brief Coordinator state, owned and mutated only by the control loop
 */
struct UiState {
  UiMode mode;                         ///< Current mode
  UiMode previousMode;                 ///< Mode to return to from VolumeAdjust
  int selectedIndex;                   ///< Browsed station
  int playingIndex;                    ///< Station a play was issued for, -1 if none
  int volumeLevel;                     ///< Last known or requested volume
  DaemonStatus lastKnownDaemonStatus;  ///< Copy of the last status poll
  bool hasDaemonStatus;                ///< A status poll was received
  ErrorOverlay overlay;                ///< Error overlay
  unsigned long lastInputTime;         ///< millis() of the last input event
  int minuteOfDay;                     ///< Wall clock minute, -1 when unknown
  RenderSnapshot lastRenderedSnapshot; ///< Last snapshot sent to the renderer
  unsigned long lastRenderTimestamp;   ///< When it was sent
};

/**
 * @brief Playback control coordinator
 * @details Consumes input, status, command completion and clock events from
 * the control loop, evolves the UI state machine, issues daemon commands and
 * requests renders. It never waits on the daemon or the panel.
 *
 * Only one daemon command is in flight at a time. Newer intents wait in two
 * single-slot mailboxes, one for playback (play, stop) and one for the
 * volume, each replaced by a newer intent of the same kind. When the command
 * in flight completes the playback intent is sent first, then the volume.
 *
 * Every event that changes the derived snapshot produces exactly one render
 * request; events that change nothing visible produce none.
 */
class Coordinator {
private:
  const Playlist& playlist;
  const Config& config;
  CommandPort& commands;
  RenderPort& renderer;
  UiState state;

  bool inFlight;                  ///< A command was submitted and not completed yet
  Command inFlightCommand;        ///< The command in flight
  bool playbackPending;           ///< Playback mailbox is full
  Command pendingPlayback;        ///< Latest playback intent
  bool volumePending;             ///< Volume mailbox is full
  Command pendingVolume;          ///< Latest volume intent
  uint32_t nextCommandId;         ///< Id of the next command
  unsigned long lastCommandDoneAt;///< When the last completion was handled
  bool commandCompleted;          ///< At least one command completed
  bool userInteracted;            ///< Any input was received
  bool adopted;                   ///< Startup adoption of the daemon station is done
  bool rendered;                  ///< At least one render was requested
  uint32_t renderRequests;        ///< Number of render requests

public:
  Coordinator(const Playlist& playlistRef, const Config& configRef, CommandPort& commandPort,
              RenderPort& renderPort);

  /**
   * @brief Start in Browsing on the first station and draw the first frame
   * @param now Current time in milliseconds
   */
  void begin(unsigned long now);

  /**
   * @brief Handle one event from the queue
   */
  void handle(const Event& event);

  /**
   * @brief Run the timers: overlay expiry and the volume mode timeout
   * @param now Current time in milliseconds
   */
  void tick(unsigned long now);

  const UiState& getState() const { return state; }
  bool isCommandInFlight() const { return inFlight; }
  bool hasPendingCommands() const { return playbackPending || volumePending; }
  uint32_t getRenderRequestCount() const { return renderRequests; }

  /**
   * @brief Derive the display snapshot from the current state
   */
  RenderSnapshot buildSnapshot() const;

private:
  void handleInput(const InputEvent& input, unsigned long now);
  void handleBrowsing(const InputEvent& input, unsigned long now);
  void handlePlaying(const InputEvent& input, unsigned long now);
  void handleVolume(const InputEvent& input, unsigned long now);
  void handleStatus(const DaemonStatus& status, unsigned long now);
  void handleCommandDone(const Command& command, const DaemonResult& result, unsigned long now);

  void play(int stationIndex, unsigned long now);
  void stopPlayback(unsigned long now);
  void enterVolume(unsigned long now);
  void exitVolume();
  bool effectivelyPlaying() const;
  void leavePlaying();

  void issue(CommandKind kind, int stationIndex, int volume, unsigned long now);
  void dispatch(const Command& command, unsigned long now);
  void dispatchPending(unsigned long now);
  void showError(DaemonError error, unsigned long now);
  void updateDisplay(unsigned long now);

  void buildHeader(RenderSnapshot& snapshot) const;
  void buildList(RenderSnapshot& snapshot) const;
  void buildNowPlaying(RenderSnapshot& snapshot) const;
};

#endif // COORDINATOR_H
