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

#include "config_json.h"
#include "log.h"

static const char* TAG = "config";

/**
 * @brief Integer setting with a default for missing keys
 */
static int readInt(const JsonDocument& doc, const char* key, int fallback) {
  return doc.containsKey(key) ? doc[key].as<int>() : fallback;
}

static bool readBool(const JsonDocument& doc, const char* key, bool fallback) {
  return doc.containsKey(key) ? doc[key].as<bool>() : fallback;
}

template <size_t N>
static void readString(const JsonDocument& doc, const char* key, char (&dst)[N], const char* fallback) {
  const char* value = doc.containsKey(key) ? doc[key].as<const char*>() : nullptr;
  copyText(dst, value ? value : fallback);
}

void applyConfigJson(const JsonDocument& doc, Config& cfg) {
  Config defaults;
  setDefaultConfig(defaults);
  // Pins
  cfg.rotary_a = readInt(doc, "rotary_a", defaults.rotary_a);
  cfg.rotary_b = readInt(doc, "rotary_b", defaults.rotary_b);
  cfg.rotary_sw = readInt(doc, "rotary_sw", defaults.rotary_sw);
  cfg.menu_button = readInt(doc, "menu_button", defaults.menu_button);
  cfg.back_button = readInt(doc, "back_button", defaults.back_button);
  cfg.led_pin = readInt(doc, "led_pin", defaults.led_pin);
  cfg.epd_cs = readInt(doc, "epd_cs", defaults.epd_cs);
  cfg.epd_dc = readInt(doc, "epd_dc", defaults.epd_dc);
  cfg.epd_rst = readInt(doc, "epd_rst", defaults.epd_rst);
  cfg.epd_busy = readInt(doc, "epd_busy", defaults.epd_busy);
  // Daemon
  readString(doc, "mpd_host", cfg.mpd_host, defaults.mpd_host);
  cfg.mpd_port = readInt(doc, "mpd_port", defaults.mpd_port);
  readString(doc, "mpd_password", cfg.mpd_password, defaults.mpd_password);
  // Timing
  cfg.poll_interval = readInt(doc, "poll_interval", defaults.poll_interval);
  cfg.sample_interval = readInt(doc, "sample_interval", defaults.sample_interval);
  cfg.debounce_time = readInt(doc, "debounce_time", defaults.debounce_time);
  cfg.long_press_time = readInt(doc, "long_press_time", defaults.long_press_time);
  cfg.command_timeout = readInt(doc, "command_timeout", defaults.command_timeout);
  cfg.refresh_interval = readInt(doc, "refresh_interval", defaults.refresh_interval);
  cfg.volume_timeout = readInt(doc, "volume_timeout", defaults.volume_timeout);
  cfg.error_timeout = readInt(doc, "error_timeout", defaults.error_timeout);
  // Behaviour
  cfg.volume_step = readInt(doc, "volume_step", defaults.volume_step);
  cfg.default_volume = readInt(doc, "default_volume", defaults.default_volume);
  cfg.volume_button = defaults.volume_button;
  if (doc.containsKey("volume_button")) {
    const char* name = doc["volume_button"].as<const char*>();
    if (!buttonFromName(name, cfg.volume_button)) {
      LOGW(TAG, "Unknown volume_button '%s', using %s", name ? name : "",
           buttonName(defaults.volume_button));
    }
  }
  cfg.live_preview = readBool(doc, "live_preview", defaults.live_preview);
  cfg.follow_daemon = readBool(doc, "follow_daemon", defaults.follow_daemon);
  // Clock
  readString(doc, "ntp_server", cfg.ntp_server, defaults.ntp_server);
  readString(doc, "timezone", cfg.timezone, defaults.timezone);
}

void fillConfigJson(const Config& cfg, JsonDocument& doc) {
  doc["rotary_a"] = cfg.rotary_a;
  doc["rotary_b"] = cfg.rotary_b;
  doc["rotary_sw"] = cfg.rotary_sw;
  doc["menu_button"] = cfg.menu_button;
  doc["back_button"] = cfg.back_button;
  doc["led_pin"] = cfg.led_pin;
  doc["epd_cs"] = cfg.epd_cs;
  doc["epd_dc"] = cfg.epd_dc;
  doc["epd_rst"] = cfg.epd_rst;
  doc["epd_busy"] = cfg.epd_busy;
  doc["mpd_host"] = cfg.mpd_host;
  doc["mpd_port"] = cfg.mpd_port;
  if (cfg.mpd_password[0] != '\0') {
    doc["mpd_password"] = cfg.mpd_password;
  }
  doc["poll_interval"] = cfg.poll_interval;
  doc["sample_interval"] = cfg.sample_interval;
  doc["debounce_time"] = cfg.debounce_time;
  doc["long_press_time"] = cfg.long_press_time;
  doc["command_timeout"] = cfg.command_timeout;
  doc["refresh_interval"] = cfg.refresh_interval;
  doc["volume_timeout"] = cfg.volume_timeout;
  doc["error_timeout"] = cfg.error_timeout;
  doc["volume_step"] = cfg.volume_step;
  doc["default_volume"] = cfg.default_volume;
  doc["volume_button"] = buttonName(cfg.volume_button);
  doc["live_preview"] = cfg.live_preview;
  doc["follow_daemon"] = cfg.follow_daemon;
  doc["ntp_server"] = cfg.ntp_server;
  doc["timezone"] = cfg.timezone;
}

int parsePlaylistJson(const JsonDocument& doc, Playlist& playlist) {
  playlist.clear();
  if (!doc.is<JsonArrayConst>()) {
    LOGE(TAG, "Playlist is not a JSON array");
    return 0;
  }
  JsonArrayConst items = doc.as<JsonArrayConst>();
  int skipped = 0;
  for (JsonObjectConst item : items) {
    if (playlist.getCount() >= MAX_PLAYLIST_SIZE) {
      LOGW(TAG, "Playlist truncated to %d entries", MAX_PLAYLIST_SIZE);
      break;
    }
    const char* name = item["name"].as<const char*>();
    const char* url = item["url"].as<const char*>();
    if (!playlist.addItem(name, url)) {
      skipped++;
    }
  }
  LOGI(TAG, "Loaded %d stations, skipped %d", playlist.getCount(), skipped);
  return playlist.getCount();
}

int parseWiFiJson(const JsonDocument& doc, WiFiCredentials& credentials) {
  credentials.count = 0;
  if (!doc.is<JsonArrayConst>()) {
    LOGE(TAG, "WiFi credentials are not a JSON array");
    return 0;
  }
  JsonArrayConst networks = doc.as<JsonArrayConst>();
  for (JsonObjectConst network : networks) {
    if (credentials.count >= MAX_WIFI_NETWORKS) break;
    const char* ssid = network["ssid"].as<const char*>();
    if (ssid == nullptr || ssid[0] == '\0') {
      continue;
    }
    copyText(credentials.ssid[credentials.count], ssid);
    copyText(credentials.password[credentials.count], network["password"].as<const char*>());
    credentials.count++;
  }
  for (int i = 0; i < credentials.count; i++) {
    LOGI(TAG, "SSID[%d]: %s", i, credentials.ssid[i]);
  }
  return credentials.count;
}
