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

#ifndef PLAYLIST_H
#define PLAYLIST_H

#include <string.h>

#define MAX_PLAYLIST_SIZE 20
#define STATION_NAME_SIZE 96
#define STATION_URL_SIZE  128

#define VALIDATE_URL(url) (url && (strncmp(url, "http://", 7) == 0 || strncmp(url, "https://", 8) == 0))

/**
 * @brief Radio station entry
 */
struct Station {
  int index;                     ///< Position in the station list
  char name[STATION_NAME_SIZE];  ///< Display name
  char url[STATION_URL_SIZE];    ///< Stream URI handed to the daemon
};

/**
 * @brief Fixed, ordered list of radio stations
 * @details Filled once at startup by the storage layer, then handed to the
 * coordinator and the daemon client as a read-only reference.
 */
class Playlist {
private:
  Station stations[MAX_PLAYLIST_SIZE];
  int count;

public:
  Playlist();

  /**
   * @brief Append a station
   * @details Rejects empty names, URLs that are not http(s) or do not fit
   * and entries past MAX_PLAYLIST_SIZE. Overlong names are truncated.
   * @param name Station name
   * @param url Stream URL
   * @return true if the station was added
   */
  bool addItem(const char* name, const char* url);
  void clear();

  int getCount() const { return count; }
  bool isEmpty() const { return count == 0; }
  bool isValidIndex(int index) const { return index >= 0 && index < count; }
  const Station& getItem(int index) const { return stations[index]; }

  /**
   * @brief Find a station by its stream URL
   * @return Station index, or -1 if no station uses this URL
   */
  int findByUrl(const char* url) const;

  /**
   * @brief Step an index with wraparound
   * @details Moves by delta positions, wrapping at both ends of the list.
   * @param index Starting index
   * @param delta Signed number of positions
   * @return The wrapped index, or 0 for an empty list
   */
  int wrapIndex(int index, int delta) const;
};

#endif // PLAYLIST_H
