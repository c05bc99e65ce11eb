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

#ifndef WIFI_TRANSPORT_H
#define WIFI_TRANSPORT_H

#include <Arduino.h>
#include <WiFi.h>
#include "mpd.h"

/**
 * @brief MPD transport over a WiFi TCP connection
 * @details Host names ending in ".local" are resolved with mDNS, the
 * resolved address is kept until a connection to it fails.
 */
class WiFiTransport : public MPDTransport {
private:
  WiFiClient client;
  IPAddress resolved;       ///< Cached mDNS address
  char resolvedFor[64];     ///< Host name the cached address belongs to

public:
  WiFiTransport();

  virtual bool connect(const char* host, uint16_t port, unsigned long timeoutMs);
  virtual bool connected();
  virtual void stop();
  virtual bool writeLine(const char* line);
  virtual ReadStatus readLine(char* buffer, size_t size, unsigned long timeoutMs);
  virtual unsigned long currentTime();

private:
  bool resolveLocal(const char* host, unsigned long timeoutMs, IPAddress& address);
};

#endif // WIFI_TRANSPORT_H
