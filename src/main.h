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

#ifndef MAIN_H
#define MAIN_H

#include <Arduino.h>
#include <WiFi.h>
#include <SPIFFS.h>
#include <ArduinoJson.h>
#include <ESPmDNS.h>
#include "config.h"
#include "config_json.h"
#include "coordinator.h"
#include "display.h"
#include "events.h"
#include "mpd.h"
#include "playlist.h"
#include "render.h"
#include "rotary.h"
#include "storage.h"
#include "wifi_transport.h"

// Queue and task sizes
#define EVENT_QUEUE_LENGTH    16
#define COMMAND_QUEUE_LENGTH   1
#define RENDER_PERIOD         20   ///< Render task period in milliseconds
#define WIFI_CHECK_PERIOD  60000   ///< WiFi watchdog period in milliseconds

// Global variables
extern const char* BUILD_TIME;
extern Config config;
extern Playlist playlist;
extern WiFiCredentials wifiCredentials;
extern QueueHandle_t eventQueue;
extern QueueHandle_t commandQueue;
extern EpaperDisplay* display;
extern Renderer* renderer;
extern Coordinator* coordinator;

// Tasks
void inputTask(void *pvParameters);
void statusTask(void *pvParameters);
void commandTask(void *pvParameters);
void renderTask(void *pvParameters);
void wifiTask(void *pvParameters);

// Global functions
bool connectToWiFi();
bool postEvent(const Event& event, TickType_t wait);
int currentMinuteOfDay();

#endif // MAIN_H
