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

#ifndef CONFIG_H
#define CONFIG_H

#include "events.h"
#include "pins.h"

// String setting sizes
#define CONFIG_HOST_SIZE      64
#define CONFIG_PASSWORD_SIZE  64
#define CONFIG_NTP_SIZE       64
#define CONFIG_TZ_SIZE        48

// Default daemon and timing settings
#define DEFAULT_MPD_HOST          "mpd.local"
#define DEFAULT_MPD_PORT          6600
#define DEFAULT_POLL_INTERVAL     500   ///< Status poll period in milliseconds
#define DEFAULT_SAMPLE_INTERVAL   5     ///< Button sampling period in milliseconds
#define DEFAULT_DEBOUNCE_TIME     20    ///< Button stable time in milliseconds
#define DEFAULT_LONG_PRESS_TIME   800   ///< Long press threshold in milliseconds
#define DEFAULT_COMMAND_TIMEOUT   2000  ///< Daemon answer timeout in milliseconds
#define DEFAULT_REFRESH_INTERVAL  1000  ///< Minimum panel refresh interval in milliseconds
#define DEFAULT_VOLUME_TIMEOUT    3000  ///< Volume mode idle timeout in milliseconds
#define DEFAULT_ERROR_TIMEOUT     5000  ///< Error overlay lifetime in milliseconds
#define DEFAULT_VOLUME_STEP       5
#define DEFAULT_VOLUME            50
#define DEFAULT_NTP_SERVER        "pool.ntp.org"
#define DEFAULT_TIMEZONE          "EET-2EEST,M3.5.0/3,M10.5.0/4"

/**
 * @brief Device configuration
 * @details Loaded from /config.json at boot. Pin numbers of -1 mean the
 * function is not wired.
 */
struct Config {
  int rotary_a;          ///< Rotary encoder A pin
  int rotary_b;          ///< Rotary encoder B pin
  int rotary_sw;         ///< Rotary encoder switch pin (Select)
  int menu_button;       ///< Menu button pin
  int back_button;       ///< Back button pin
  int led_pin;           ///< LED indicator pin
  int epd_cs;            ///< E-paper chip select pin
  int epd_dc;            ///< E-paper data/command pin
  int epd_rst;           ///< E-paper reset pin
  int epd_busy;          ///< E-paper busy pin
  char mpd_host[CONFIG_HOST_SIZE];         ///< Daemon host name or address
  int mpd_port;                            ///< Daemon TCP port
  char mpd_password[CONFIG_PASSWORD_SIZE]; ///< Daemon password, empty for none
  int poll_interval;     ///< Status poll period in milliseconds
  int sample_interval;   ///< Button sampling period in milliseconds
  int debounce_time;     ///< Button debounce time in milliseconds
  int long_press_time;   ///< Long press threshold in milliseconds
  int command_timeout;   ///< Daemon command timeout in milliseconds
  int refresh_interval;  ///< Minimum display refresh interval in milliseconds
  int volume_timeout;    ///< Volume mode idle timeout in milliseconds
  int error_timeout;     ///< Error overlay lifetime in milliseconds
  int volume_step;       ///< Volume change per encoder detent
  int default_volume;    ///< Volume assumed until the daemon reports one
  ButtonId volume_button;///< Button whose long press enters volume mode
  bool live_preview;     ///< Rotation while playing switches the station at once
  bool follow_daemon;    ///< Adopt the station the daemon plays at startup
  char ntp_server[CONFIG_NTP_SIZE];        ///< NTP server for the title bar clock
  char timezone[CONFIG_TZ_SIZE];           ///< POSIX TZ string
};

/**
 * @brief Fill a configuration with the compiled-in defaults
 */
void setDefaultConfig(Config& cfg);

/**
 * @brief Clamp out of range values
 * @details Timing values are kept within usable bounds, volumes within 0-100,
 * and an empty daemon host falls back to the default.
 * @return Number of corrected fields
 */
int validateConfig(Config& cfg);

#endif // CONFIG_H
