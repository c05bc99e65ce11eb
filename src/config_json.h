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

#ifndef CONFIG_JSON_H
#define CONFIG_JSON_H

#include <ArduinoJson.h>
#include "config.h"
#include "playlist.h"

#define MAX_WIFI_NETWORKS 5
#define WIFI_SSID_SIZE    64
#define WIFI_PASS_SIZE    64

// Maximum accepted file sizes
#define CONFIG_FILE_SIZE    2048
#define PLAYLIST_FILE_SIZE  8192
#define WIFI_FILE_SIZE      2048

/**
 * @brief Configured WiFi networks, tried in order
 */
struct WiFiCredentials {
  char ssid[MAX_WIFI_NETWORKS][WIFI_SSID_SIZE];
  char password[MAX_WIFI_NETWORKS][WIFI_PASS_SIZE];
  int count;
};

/**
 * @brief Read configuration values from a parsed document
 * @details Every key is optional, missing keys get their default value.
 * The result still has to go through validateConfig().
 * @param doc Parsed /config.json
 * @param cfg Configuration to fill
 */
void applyConfigJson(const JsonDocument& doc, Config& cfg);

/**
 * @brief Store a configuration into a document, for writing it back
 */
void fillConfigJson(const Config& cfg, JsonDocument& doc);

/**
 * @brief Load the station list from a parsed document
 * @details The document is an array of {"name": ..., "url": ...} objects.
 * Invalid entries are skipped and entries past the list capacity dropped.
 * @param doc Parsed /playlist.json
 * @param playlist Station list, cleared first
 * @return Number of stations loaded
 */
int parsePlaylistJson(const JsonDocument& doc, Playlist& playlist);

/**
 * @brief Load WiFi networks from a parsed document
 * @details The document is an array of {"ssid": ..., "password": ...}
 * objects, at most MAX_WIFI_NETWORKS are kept.
 * @return Number of networks loaded
 */
int parseWiFiJson(const JsonDocument& doc, WiFiCredentials& credentials);

#endif // CONFIG_JSON_H
