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

#include "storage.h"
#include "log.h"
#include <SPIFFS.h>
#include <memory>

static const char* TAG = "storage";

/**
 * @brief Initialize SPIFFS with error recovery
 * Mounts SPIFFS filesystem, formatting and mounting again if needed
 * @return true if successful, false otherwise
 */
bool initSPIFFS() {
  if (!SPIFFS.begin(true)) {
    LOGE(TAG, "An error has occurred while mounting SPIFFS");
    // Try to reformat SPIFFS
    if (!SPIFFS.format()) {
      LOGE(TAG, "Failed to format SPIFFS");
      return false;
    }
    // Try to mount again after formatting
    if (!SPIFFS.begin(true)) {
      LOGE(TAG, "Failed to mount SPIFFS after formatting");
      return false;
    }
    LOGI(TAG, "SPIFFS formatted and mounted");
  } else {
    LOGI(TAG, "SPIFFS mounted, %u of %u bytes used", (unsigned)SPIFFS.usedBytes(), (unsigned)SPIFFS.totalBytes());
  }
  return true;
}

/**
 * @brief Read and parse a JSON file from SPIFFS
 * @param filename Path to the file in SPIFFS
 * @param maxFileSize Maximum allowed file size
 * @param doc Document to populate with parsed data
 * @return true if successful, false otherwise
 */
bool readJsonFile(const char* filename, size_t maxFileSize, DynamicJsonDocument& doc) {
  // Check if the file exists
  if (!SPIFFS.exists(filename)) {
    LOGW(TAG, "JSON file not found: %s", filename);
    return false;
  }
  File file = SPIFFS.open(filename, "r");
  if (!file) {
    LOGE(TAG, "Failed to open JSON file: %s", filename);
    return false;
  }
  size_t size = file.size();
  if (size > maxFileSize) {
    LOGE(TAG, "JSON file too large: %s", filename);
    file.close();
    return false;
  }
  if (size == 0) {
    LOGW(TAG, "JSON file is empty: %s", filename);
    file.close();
    return false;
  }
  // Read the whole file, then parse it
  std::unique_ptr<char[]> buf(new char[size + 1]);
  if (file.readBytes(buf.get(), size) != size) {
    LOGE(TAG, "Failed to read JSON file: %s", filename);
    file.close();
    return false;
  }
  buf[size] = '\0';
  file.close();
  DeserializationError error = deserializeJson(doc, buf.get());
  if (error) {
    LOGE(TAG, "Failed to parse JSON file %s: %s", filename, error.c_str());
    return false;
  }
  return true;
}

/**
 * @brief Write a JSON document to SPIFFS
 * The previous file is kept as a backup until the new one is written, and
 * restored if writing fails.
 * @param filename Path to the file in SPIFFS
 * @param doc Document to serialize
 * @return true if successful, false otherwise
 */
bool writeJsonFile(const char* filename, DynamicJsonDocument& doc) {
  String backupFilename = String(filename) + ".bak";
  if (SPIFFS.exists(filename)) {
    if (SPIFFS.exists(backupFilename)) {
      SPIFFS.remove(backupFilename);
    }
    if (!SPIFFS.rename(filename, backupFilename)) {
      LOGW(TAG, "Failed to create backup of %s", filename);
    }
  }
  File file = SPIFFS.open(filename, "w");
  if (!file) {
    LOGE(TAG, "Failed to open JSON file for writing: %s", filename);
    if (SPIFFS.exists(backupFilename) && !SPIFFS.rename(backupFilename, filename)) {
      LOGE(TAG, "Failed to restore %s from backup", filename);
    }
    return false;
  }
  size_t bytesWritten = serializeJson(doc, file);
  file.close();
  if (bytesWritten == 0) {
    LOGE(TAG, "Failed to write JSON to file: %s", filename);
    if (SPIFFS.exists(backupFilename)) {
      SPIFFS.remove(filename);
      if (SPIFFS.rename(backupFilename, filename)) {
        LOGI(TAG, "Restored %s from backup", filename);
      } else {
        LOGE(TAG, "Failed to restore %s from backup", filename);
      }
    }
    return false;
  }
  // Remove backup file after successful save
  if (SPIFFS.exists(backupFilename)) {
    SPIFFS.remove(backupFilename);
  }
  return true;
}

void loadConfig(Config& cfg) {
  DynamicJsonDocument doc(CONFIG_FILE_SIZE);
  if (!readJsonFile("/config.json", CONFIG_FILE_SIZE, doc)) {
    LOGI(TAG, "Config file not found, using defaults");
    setDefaultConfig(cfg);
    saveConfig(cfg);
    return;
  }
  applyConfigJson(doc, cfg);
  int fixed = validateConfig(cfg);
  LOGI(TAG, "Loaded configuration from SPIFFS, %d values corrected", fixed);
}

bool saveConfig(const Config& cfg) {
  DynamicJsonDocument doc(CONFIG_FILE_SIZE);
  fillConfigJson(cfg, doc);
  if (!writeJsonFile("/config.json", doc)) {
    LOGE(TAG, "Failed to save configuration to SPIFFS");
    return false;
  }
  LOGI(TAG, "Saved configuration to SPIFFS");
  return true;
}

int loadPlaylist(Playlist& playlist) {
  DynamicJsonDocument doc(PLAYLIST_FILE_SIZE);
  if (!readJsonFile("/playlist.json", PLAYLIST_FILE_SIZE, doc)) {
    playlist.clear();
    LOGW(TAG, "No station list");
    return 0;
  }
  return parsePlaylistJson(doc, playlist);
}

int loadWiFiCredentials(WiFiCredentials& credentials) {
  credentials.count = 0;
  DynamicJsonDocument doc(WIFI_FILE_SIZE);
  if (!readJsonFile("/wifi.json", WIFI_FILE_SIZE, doc)) {
    return 0;
  }
  return parseWiFiJson(doc, credentials);
}
