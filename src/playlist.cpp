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

#include "playlist.h"
#include "events.h"
#include "log.h"

static const char* TAG = "playlist";

/**
 * @brief Playlist constructor
 */
Playlist::Playlist() {
  count = 0;
  for (int i = 0; i < MAX_PLAYLIST_SIZE; i++) {
    stations[i].index = i;
    stations[i].name[0] = '\0';
    stations[i].url[0] = '\0';
  }
}

bool Playlist::addItem(const char* name, const char* url) {
  if (count >= MAX_PLAYLIST_SIZE) {
    LOGW(TAG, "Playlist limit reached (%d entries)", MAX_PLAYLIST_SIZE);
    return false;
  }
  if (name == nullptr || strlen(name) == 0) {
    LOGW(TAG, "Skipping stream with empty name");
    return false;
  }
  if (!VALIDATE_URL(url)) {
    LOGW(TAG, "Skipping stream '%s' with invalid URL format", name);
    return false;
  }
  if (strlen(url) >= STATION_URL_SIZE) {
    LOGW(TAG, "Skipping stream '%s', URL longer than %d characters", name, STATION_URL_SIZE - 1);
    return false;
  }
  Station& station = stations[count];
  station.index = count;
  copyText(station.name, name);
  copyText(station.url, url);
  count++;
  return true;
}

void Playlist::clear() {
  for (int i = 0; i < count; i++) {
    stations[i].name[0] = '\0';
    stations[i].url[0] = '\0';
  }
  count = 0;
}

int Playlist::findByUrl(const char* url) const {
  if (url == nullptr || url[0] == '\0') {
    return -1;
  }
  for (int i = 0; i < count; i++) {
    if (strcmp(stations[i].url, url) == 0) {
      return i;
    }
  }
  return -1;
}

int Playlist::wrapIndex(int index, int delta) const {
  if (count == 0) {
    return 0;
  }
  int wrapped = (index + delta) % count;
  if (wrapped < 0) {
    wrapped += count;
  }
  return wrapped;
}
