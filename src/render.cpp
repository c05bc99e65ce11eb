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

#include "render.h"
#include "log.h"
#include <string.h>

static const char* TAG = "render";

bool RenderSnapshot::operator==(const RenderSnapshot& other) const {
  if (layout != other.layout || highlight != other.highlight || volume != other.volume) {
    return false;
  }
  if (strcmp(header, other.header) != 0 || strcmp(clock, other.clock) != 0 ||
      strcmp(overlay, other.overlay) != 0) {
    return false;
  }
  for (int i = 0; i < RENDER_LINES; i++) {
    if (strcmp(lines[i], other.lines[i]) != 0) {
      return false;
    }
  }
  return true;
}

RenderSnapshot makeBlankSnapshot() {
  RenderSnapshot snapshot;
  memset(&snapshot, 0, sizeof(snapshot));
  snapshot.layout = ScreenLayout::List;
  snapshot.highlight = -1;
  return snapshot;
}

RenderScheduler::RenderScheduler(unsigned long minIntervalMs)
  : minInterval(minIntervalMs), slot(makeBlankSnapshot()), pending(false), drawn(false),
    lastDrawAt(0), replaced(0) {}

void RenderScheduler::request(const RenderSnapshot& snapshot) {
  if (pending) {
    replaced++;
  }
  slot = snapshot;
  pending = true;
}

bool RenderScheduler::takeDue(unsigned long now, RenderSnapshot& snapshot) {
  if (!pending) {
    return false;
  }
  if (drawn && (now - lastDrawAt) < minInterval) {
    return false;
  }
  snapshot = slot;
  pending = false;
  drawn = true;
  lastDrawAt = now;
  return true;
}

Renderer::Renderer(Panel& panelRef, unsigned long minIntervalMs)
  : panel(panelRef), scheduler(minIntervalMs), panelReady(false), writes(0), failures(0) {}

bool Renderer::begin() {
  panelReady = panel.begin();
  if (!panelReady) {
    LOGE(TAG, "Display panel not ready, rendering disabled");
  }
  return panelReady;
}

void Renderer::requestRender(const RenderSnapshot& snapshot, unsigned long now) {
  std::lock_guard<std::mutex> guard(lock);
  scheduler.request(snapshot);
  LOGD(TAG, "Render requested at %lu", now);
}

bool Renderer::service(unsigned long now) {
  RenderSnapshot snapshot;
  {
    std::lock_guard<std::mutex> guard(lock);
    if (!scheduler.takeDue(now, snapshot)) {
      return false;
    }
  }
  if (!panelReady) {
    failures++;
    LOGW(TAG, "Display write skipped, panel not ready");
    return false;
  }
  if (!panel.show(snapshot)) {
    failures++;
    LOGW(TAG, "Display write failed");
    return false;
  }
  writes++;
  return true;
}
