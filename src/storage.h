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

#ifndef STORAGE_H
#define STORAGE_H

#include <ArduinoJson.h>
#include "config.h"
#include "config_json.h"
#include "playlist.h"

/**
 * @brief Mount SPIFFS, formatting it if it cannot be mounted
 * @return true if the filesystem is usable
 */
bool initSPIFFS();

// JSON file helper functions
bool readJsonFile(const char* filename, size_t maxFileSize, DynamicJsonDocument& doc);
bool writeJsonFile(const char* filename, DynamicJsonDocument& doc);

/**
 * @brief Load /config.json, writing the defaults back when it is missing
 */
void loadConfig(Config& cfg);
bool saveConfig(const Config& cfg);

/**
 * @brief Load the station list from /playlist.json
 * @return Number of stations
 */
int loadPlaylist(Playlist& playlist);

/**
 * @brief Load the WiFi networks from /wifi.json
 * @return Number of networks
 */
int loadWiFiCredentials(WiFiCredentials& credentials);

#endif // STORAGE_H
