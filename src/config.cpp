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

#include "config.h"
#include "log.h"

static const char* TAG = "config";

void setDefaultConfig(Config& cfg) {
  cfg.rotary_a = DEFAULT_ROTARY_A;
  cfg.rotary_b = DEFAULT_ROTARY_B;
  cfg.rotary_sw = DEFAULT_ROTARY_SW;
  cfg.menu_button = DEFAULT_MENU_BUTTON;
  cfg.back_button = DEFAULT_BACK_BUTTON;
  cfg.led_pin = DEFAULT_LED_PIN;
  cfg.epd_cs = DEFAULT_EPD_CS;
  cfg.epd_dc = DEFAULT_EPD_DC;
  cfg.epd_rst = DEFAULT_EPD_RST;
  cfg.epd_busy = DEFAULT_EPD_BUSY;
  copyText(cfg.mpd_host, DEFAULT_MPD_HOST);
  cfg.mpd_port = DEFAULT_MPD_PORT;
  cfg.mpd_password[0] = '\0';
  cfg.poll_interval = DEFAULT_POLL_INTERVAL;
  cfg.sample_interval = DEFAULT_SAMPLE_INTERVAL;
  cfg.debounce_time = DEFAULT_DEBOUNCE_TIME;
  cfg.long_press_time = DEFAULT_LONG_PRESS_TIME;
  cfg.command_timeout = DEFAULT_COMMAND_TIMEOUT;
  cfg.refresh_interval = DEFAULT_REFRESH_INTERVAL;
  cfg.volume_timeout = DEFAULT_VOLUME_TIMEOUT;
  cfg.error_timeout = DEFAULT_ERROR_TIMEOUT;
  cfg.volume_step = DEFAULT_VOLUME_STEP;
  cfg.default_volume = DEFAULT_VOLUME;
  cfg.volume_button = ButtonId::Select;
  cfg.live_preview = true;
  cfg.follow_daemon = true;
  copyText(cfg.ntp_server, DEFAULT_NTP_SERVER);
  copyText(cfg.timezone, DEFAULT_TIMEZONE);
}

/**
 * @brief Clamp one integer setting
 * @return 1 if the value was changed, 0 otherwise
 */
static int clampSetting(const char* name, int& value, int low, int high) {
  int original = value;
  if (value < low) value = low;
  if (value > high) value = high;
  if (value != original) {
    LOGW(TAG, "%s out of range (%d), using %d", name, original, value);
    return 1;
  }
  return 0;
}

int validateConfig(Config& cfg) {
  int fixed = 0;
  fixed += clampSetting("mpd_port", cfg.mpd_port, 1, 65535);
  fixed += clampSetting("poll_interval", cfg.poll_interval, 100, 60000);
  fixed += clampSetting("sample_interval", cfg.sample_interval, 1, 50);
  fixed += clampSetting("debounce_time", cfg.debounce_time, 0, 200);
  fixed += clampSetting("long_press_time", cfg.long_press_time, 200, 5000);
  fixed += clampSetting("command_timeout", cfg.command_timeout, 100, 30000);
  fixed += clampSetting("refresh_interval", cfg.refresh_interval, 0, 60000);
  fixed += clampSetting("volume_timeout", cfg.volume_timeout, 500, 60000);
  fixed += clampSetting("error_timeout", cfg.error_timeout, 500, 60000);
  fixed += clampSetting("volume_step", cfg.volume_step, 1, 25);
  fixed += clampSetting("default_volume", cfg.default_volume, 0, 100);
  if (cfg.long_press_time <= cfg.debounce_time) {
    cfg.long_press_time = cfg.debounce_time + 1;
    LOGW(TAG, "long_press_time must exceed debounce_time, using %d", cfg.long_press_time);
    fixed++;
  }
  if (cfg.mpd_host[0] == '\0') {
    copyText(cfg.mpd_host, DEFAULT_MPD_HOST);
    LOGW(TAG, "Empty mpd_host, using %s", DEFAULT_MPD_HOST);
    fixed++;
  }
  return fixed;
}
