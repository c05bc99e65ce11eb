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

#include "wifi_transport.h"
#include "log.h"
#include <ESPmDNS.h>

static const char* TAG = "net";

WiFiTransport::WiFiTransport() : resolved((uint32_t)0) {
  resolvedFor[0] = '\0';
}

/**
 * @brief Resolve a ".local" host name with mDNS
 * @param host Host name, with the ".local" suffix
 * @param timeoutMs Query timeout in milliseconds
 * @param address Receives the address
 * @return true if resolved
 */
bool WiFiTransport::resolveLocal(const char* host, unsigned long timeoutMs, IPAddress& address) {
  if (strcmp(resolvedFor, host) == 0 && resolved != IPAddress((uint32_t)0)) {
    address = resolved;
    return true;
  }
  char name[64];
  copyText(name, host);
  char* suffix = strstr(name, ".local");
  if (suffix != nullptr) {
    *suffix = '\0';
  }
  IPAddress ip = MDNS.queryHost(name, timeoutMs);
  if (ip == IPAddress((uint32_t)0)) {
    LOGW(TAG, "Cannot resolve %s", host);
    return false;
  }
  resolved = ip;
  copyText(resolvedFor, host);
  address = ip;
  LOGI(TAG, "Resolved %s to %s", host, ip.toString().c_str());
  return true;
}

bool WiFiTransport::connect(const char* host, uint16_t port, unsigned long timeoutMs) {
  if (WiFi.status() != WL_CONNECTED) {
    return false;
  }
  size_t len = strlen(host);
  if (len > 6 && strcmp(host + len - 6, ".local") == 0) {
    IPAddress address;
    if (!resolveLocal(host, timeoutMs, address)) {
      return false;
    }
    if (!client.connect(address, port, timeoutMs)) {
      // The address may have changed, query again next time
      resolved = IPAddress((uint32_t)0);
      return false;
    }
  } else if (!client.connect(host, port, timeoutMs)) {
    return false;
  }
  client.setNoDelay(true);
  return true;
}

bool WiFiTransport::connected() {
  return client.connected();
}

void WiFiTransport::stop() {
  client.stop();
}

bool WiFiTransport::writeLine(const char* line) {
  if (!client.connected()) {
    return false;
  }
  size_t len = strlen(line);
  if (client.write((const uint8_t*)line, len) != len) {
    return false;
  }
  return client.write((uint8_t)'\n') == 1;
}

/**
 * @brief Read one line, stripping the line terminator
 * @details Polls the socket until a newline arrives, the peer closes the
 * connection or the timeout expires.
 */
ReadStatus WiFiTransport::readLine(char* buffer, size_t size, unsigned long timeoutMs) {
  size_t pos = 0;
  unsigned long start = millis();
  while (true) {
    while (client.available() > 0) {
      int c = client.read();
      if (c < 0) {
        break;
      }
      if (c == '\n') {
        buffer[pos] = '\0';
        return ReadStatus::Ok;
      }
      if (c != '\r' && pos + 1 < size) {
        buffer[pos++] = (char)c;
      }
    }
    if (!client.connected()) {
      buffer[pos] = '\0';
      return ReadStatus::Closed;
    }
    if (millis() - start >= timeoutMs) {
      buffer[pos] = '\0';
      return ReadStatus::Timeout;
    }
    delay(1);
  }
}

unsigned long WiFiTransport::currentTime() {
  return millis();
}
