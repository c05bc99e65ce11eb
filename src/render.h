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

#ifndef RENDER_H
#define RENDER_H

#include <stdint.h>
#include <mutex>

// Snapshot text sizes
#define RENDER_LINES         3
#define RENDER_LINE_SIZE     64
#define RENDER_HEADER_SIZE   32
#define RENDER_CLOCK_SIZE    8
#define RENDER_OVERLAY_SIZE  48

/**
 * @brief Screen layouts
 * - List: three line station browser, the middle line is the selection
 * - NowPlaying: station name, stream title and state
 * - Volume: volume bar
 */
enum class ScreenLayout : uint8_t { List, NowPlaying, Volume };

/**
 * @brief Everything needed to draw one frame
 * @details Derived from the coordinator state, never from the panel. Two equal
 * snapshots draw the same frame.
 */
struct RenderSnapshot {
  ScreenLayout layout;
  char header[RENDER_HEADER_SIZE];           ///< Title bar text
  char clock[RENDER_CLOCK_SIZE];             ///< "HH:MM", empty before the clock is known
  char lines[RENDER_LINES][RENDER_LINE_SIZE];///< Body lines
  int highlight;                             ///< Inverted body line, -1 for none
  int volume;                                ///< Volume layout level 0-100
  char overlay[RENDER_OVERLAY_SIZE];         ///< Error overlay text, empty when hidden

  bool operator==(const RenderSnapshot& other) const;
  bool operator!=(const RenderSnapshot& other) const { return !(*this == other); }
};

/**
 * @brief Empty List snapshot with no highlight
 */
RenderSnapshot makeBlankSnapshot();

/**
 * @brief Low level panel
 * @details Draws a whole frame and waits for the refresh to complete, which
 * takes hundreds of milliseconds on e-paper.
 */
class Panel {
public:
  virtual ~Panel() {}
  virtual bool begin() = 0;

  /**
   * @brief Draw and refresh
   * @return false if the panel is not ready or the refresh did not complete
   */
  virtual bool show(const RenderSnapshot& snapshot) = 0;
};

/**
 * @brief Where the coordinator sends its render requests
 * Implementations must return without waiting for the panel.
 */
class RenderPort {
public:
  virtual ~RenderPort() {}
  virtual void requestRender(const RenderSnapshot& snapshot, unsigned long now) = 0;
};

/**
 * @brief Refresh rate limiter with a single latest-wins slot
 * @details A request arriving after an idle period is due immediately.
 * Requests arriving before the minimum interval since the last draw has
 * elapsed replace each other; only the latest one is drawn once the interval
 * is over.
 */
class RenderScheduler {
private:
  unsigned long minInterval;  ///< Minimum time between two draws
  RenderSnapshot slot;        ///< Latest request
  bool pending;               ///< Slot holds an undrawn request
  bool drawn;                 ///< At least one draw happened
  unsigned long lastDrawAt;   ///< When the last draw was started
  uint32_t replaced;          ///< Requests overwritten before being drawn

public:
  explicit RenderScheduler(unsigned long minIntervalMs = 1000);

  void setMinInterval(unsigned long minIntervalMs) { minInterval = minIntervalMs; }

  void request(const RenderSnapshot& snapshot);

  /**
   * @brief Take the pending snapshot if it may be drawn now
   * @param now Current time in milliseconds
   * @param snapshot Receives the snapshot to draw
   * @return true if a draw is due, the draw time is recorded
   */
  bool takeDue(unsigned long now, RenderSnapshot& snapshot);

  bool hasPending() const { return pending; }
  uint32_t getReplacedCount() const { return replaced; }
};

/**
 * @brief Display renderer
 * @details Thread safe front of the scheduler: the coordinator calls
 * requestRender() from the control loop, the render task calls service()
 * periodically and performs the slow panel write outside the lock.
 */
class Renderer : public RenderPort {
private:
  Panel& panel;
  RenderScheduler scheduler;
  std::mutex lock;
  bool panelReady;
  uint32_t writes;
  uint32_t failures;

public:
  Renderer(Panel& panelRef, unsigned long minIntervalMs = 1000);

  /**
   * @brief Initialize the panel
   * @return false if the panel did not respond, draws are then skipped
   */
  bool begin();

  virtual void requestRender(const RenderSnapshot& snapshot, unsigned long now);

  /**
   * @brief Draw the pending snapshot when due
   * @param now Current time in milliseconds
   * @return true if a frame was written
   */
  bool service(unsigned long now);

  uint32_t getWriteCount() const { return writes; }
  uint32_t getFailureCount() const { return failures; }
};

#endif // RENDER_H
