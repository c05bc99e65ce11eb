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

#include "main.h"
#include "log.h"
#include <time.h>

static const char* TAG = "main";

// Build timestamp
const char* BUILD_TIME = __DATE__ " " __TIME__;

Config config;
Playlist playlist;
WiFiCredentials wifiCredentials;
QueueHandle_t eventQueue = NULL;
QueueHandle_t commandQueue = NULL;
EpaperDisplay* display = nullptr;
Renderer* renderer = nullptr;
Coordinator* coordinator = nullptr;

// Input
static InputDebouncer inputDebouncer;
static portMUX_TYPE encoderMux = portMUX_INITIALIZER_UNLOCKED;

// One daemon connection per task
static WiFiTransport statusTransport;
static WiFiTransport commandTransport;
static MPDClient* statusClient = nullptr;
static MPDClient* commandClient = nullptr;

TaskHandle_t inputTaskHandle = NULL;
TaskHandle_t statusTaskHandle = NULL;
TaskHandle_t commandTaskHandle = NULL;
TaskHandle_t renderTaskHandle = NULL;
TaskHandle_t wifiTaskHandle = NULL;

/**
 * @brief Log sink writing to the serial console
 */
static void serialSink(LogLevel level, const char* tag, const char* message) {
  Serial.printf("[%s][%s] %s\n", logLevelLabel(level), tag ? tag : "-", message);
}

/**
 * @brief Command port feeding the command task queue
 */
class QueueCommandPort : public CommandPort {
public:
  virtual bool submit(const Command& command) {
    return xQueueSend(commandQueue, &command, 0) == pdPASS;
  }
};

/**
 * @brief Input sink feeding the coordinator event queue
 */
class QueueInputSink : public InputSink {
public:
  virtual void onInput(const InputEvent& input) {
    Event event = makeInputEvent(input.type, input.button, input.timestamp);
    if (!postEvent(event, 0)) {
      LOGW(TAG, "Event queue full, input dropped");
    }
  }
};

static QueueCommandPort commandPort;
static QueueInputSink inputSink;

bool postEvent(const Event& event, TickType_t wait) {
  return xQueueSend(eventQueue, &event, wait) == pdPASS;
}

/**
 * @brief Current wall clock minute
 * @return Minute of the day (0-1439), -1 until NTP time is known
 */
int currentMinuteOfDay() {
  struct tm timeinfo;
  if (!getLocalTime(&timeinfo, 0)) {
    return -1;
  }
  return timeinfo.tm_hour * 60 + timeinfo.tm_min;
}

/**
 * @brief Encoder pin change interrupt
 * Both encoder pins trigger it; the levels are read and fed to the decoder.
 */
void IRAM_ATTR encoderISR() {
  uint8_t pinState = (digitalRead(config.rotary_b) << 1) | digitalRead(config.rotary_a);
  portENTER_CRITICAL_ISR(&encoderMux);
  inputDebouncer.encoderChanged(pinState);
  portEXIT_CRITICAL_ISR(&encoderMux);
}

/**
 * @brief Read a button, active low
 */
static bool buttonPressed(int pin) {
  return pin >= 0 && digitalRead(pin) == LOW;
}

/**
 * @brief Input task
 * Samples the buttons at the configured interval and turns the encoder steps
 * accumulated by the interrupt into events.
 */
void inputTask(void *pvParameters) {
  TickType_t period = pdMS_TO_TICKS(config.sample_interval);
  if (period == 0) period = 1;
  TickType_t lastWake = xTaskGetTickCount();
  bool pressed[BUTTON_COUNT];
  while (true) {
    vTaskDelayUntil(&lastWake, period);
    portENTER_CRITICAL(&encoderMux);
    int steps = inputDebouncer.takeSteps();
    portEXIT_CRITICAL(&encoderMux);
    pressed[(int)ButtonId::Select] = buttonPressed(config.rotary_sw);
    pressed[(int)ButtonId::Menu] = buttonPressed(config.menu_button);
    pressed[(int)ButtonId::Back] = buttonPressed(config.back_button);
    inputDebouncer.poll(steps, pressed, millis(), inputSink);
  }
}

/**
 * @brief Status poll task
 * Polls the daemon on its own connection and posts the result, stamped with
 * the time the poll started.
 */
void statusTask(void *pvParameters) {
  TickType_t lastWake = xTaskGetTickCount();
  while (true) {
    unsigned long started = millis();
    DaemonStatus status = statusClient->pollStatus();
    Event event = makeStatusEvent(status, started);
    if (!postEvent(event, pdMS_TO_TICKS(config.poll_interval))) {
      LOGW(TAG, "Event queue full, status dropped");
    }
    vTaskDelayUntil(&lastWake, pdMS_TO_TICKS(config.poll_interval));
  }
}

/**
 * @brief Command task
 * Runs the coordinator commands one by one and posts their completion.
 */
void commandTask(void *pvParameters) {
  Command command;
  while (true) {
    if (xQueueReceive(commandQueue, &command, portMAX_DELAY) != pdPASS) {
      continue;
    }
    DaemonResult result = commandClient->execute(command);
    Event event = makeCommandDoneEvent(command, result, millis());
    // The coordinator waits for this completion, it must not be lost
    postEvent(event, portMAX_DELAY);
  }
}

/**
 * @brief Render task
 * Draws the latest requested snapshot, respecting the refresh interval.
 */
void renderTask(void *pvParameters) {
  while (true) {
    renderer->service(millis());
    vTaskDelay(pdMS_TO_TICKS(RENDER_PERIOD));
  }
}

/**
 * @brief WiFi watchdog task
 * Reconnects in the background; scanning and joining take seconds and must
 * not hold up the control loop.
 */
void wifiTask(void *pvParameters) {
  TickType_t lastWake = xTaskGetTickCount();
  while (true) {
    vTaskDelayUntil(&lastWake, pdMS_TO_TICKS(WIFI_CHECK_PERIOD));
    if (wifiCredentials.count > 0 && WiFi.status() != WL_CONNECTED) {
      LOGW(TAG, "WiFi connection lost, reconnecting");
      connectToWiFi();
    }
  }
}

/**
 * @brief Connect to WiFi networks
 * Scans for the configured networks and tries the available ones in order
 * @return true if connected to a network, false otherwise
 */
bool connectToWiFi() {
  // The panel belongs to the render task once it runs
  static bool firstConnection = true;
  bool showProgress = firstConnection;
  firstConnection = false;
  if (wifiCredentials.count == 0) {
    LOGW(TAG, "No WiFi networks configured");
    return false;
  }
  WiFi.mode(WIFI_STA);
  WiFi.setHostname("DialTuner");
  LOGI(TAG, "Scanning for available WiFi networks...");
  int n = WiFi.scanNetworks();
  LOGI(TAG, "Found %d networks", n);
  for (int i = 0; i < wifiCredentials.count; i++) {
    bool available = false;
    for (int j = 0; j < n; j++) {
      if (strcmp(WiFi.SSID(j).c_str(), wifiCredentials.ssid[i]) == 0) {
        available = true;
        break;
      }
    }
    if (!available) {
      LOGI(TAG, "Network %s is not available", wifiCredentials.ssid[i]);
      continue;
    }
    LOGI(TAG, "Attempting to connect to %s...", wifiCredentials.ssid[i]);
    if (showProgress) {
      display->showStatus("WiFi connecting", wifiCredentials.ssid[i]);
    }
    WiFi.begin(wifiCredentials.ssid[i], wifiCredentials.password[i]);
    int wifiAttempts = 0;
    const int maxAttempts = 15;
    while (WiFi.status() != WL_CONNECTED && wifiAttempts < maxAttempts) {
      delay(500);
      wifiAttempts++;
    }
    if (WiFi.status() == WL_CONNECTED) {
      LOGI(TAG, "Connected to %s, IP address %s", wifiCredentials.ssid[i],
           WiFi.localIP().toString().c_str());
      WiFi.scanDelete();
      return true;
    }
    LOGW(TAG, "Failed to connect to %s", wifiCredentials.ssid[i]);
    // Reset WiFi before trying next network
    WiFi.disconnect();
    delay(1000);
  }
  WiFi.scanDelete();
  LOGE(TAG, "Failed to connect to any configured WiFi network");
  return false;
}

/**
 * @brief Create a task and report the outcome
 */
static bool startTask(TaskFunction_t function, const char* name, uint32_t stack, UBaseType_t priority,
                      TaskHandle_t* handle, BaseType_t core) {
  BaseType_t result = xTaskCreatePinnedToCore(function, name, stack, NULL, priority, handle, core);
  if (result != pdPASS) {
    LOGE(TAG, "Failed to create %s", name);
    return false;
  }
  LOGI(TAG, "%s created", name);
  return true;
}

/**
 * @brief Arduino setup function
 * Loads the configuration and the station list, brings up the display and
 * the network, then starts the tasks feeding the coordinator.
 */
void setup() {
  Serial.begin(115200);
  setLogSink(serialSink);
  Serial.println("DialTuner - An ESP32-based e-paper internet radio remote for MPD");
  Serial.print("Build timestamp: ");
  Serial.println(BUILD_TIME);

  // Configuration, defaults if the filesystem is not usable
  if (initSPIFFS()) {
    loadConfig(config);
  } else {
    LOGE(TAG, "Failed to initialize SPIFFS, using defaults");
    setDefaultConfig(config);
  }
  // Initialize LED pin if configured
  if (config.led_pin >= 0) {
    pinMode(config.led_pin, OUTPUT);
    digitalWrite(config.led_pin, LOW);
  }
  // Buttons and encoder, active low with pull-ups
  const int inputPins[] = {config.rotary_a, config.rotary_b, config.rotary_sw,
                           config.menu_button, config.back_button};
  for (size_t i = 0; i < sizeof(inputPins) / sizeof(inputPins[0]); i++) {
    if (inputPins[i] >= 0) {
      pinMode(inputPins[i], INPUT_PULLUP);
    }
  }
  inputDebouncer.configure(config.debounce_time, config.long_press_time);

  // Display
  display = new EpaperDisplay(config.epd_cs, config.epd_dc, config.epd_rst, config.epd_busy);
  renderer = new Renderer(*display, config.refresh_interval);
  renderer->begin();

  // Stations
  loadPlaylist(playlist);

  // Network
  loadWiFiCredentials(wifiCredentials);
  if (!connectToWiFi()) {
    display->showStatus("No WiFi", "Retrying later");
  }
  if (MDNS.begin("DialTuner")) {
    LOGI(TAG, "MDNS responder started");
  } else {
    LOGE(TAG, "Error setting up MDNS responder");
  }
  configTzTime(config.timezone, config.ntp_server);

  // Daemon clients
  statusClient = new MPDClient(statusTransport, playlist, config.mpd_host, config.mpd_port,
                               config.mpd_password, config.command_timeout);
  commandClient = new MPDClient(commandTransport, playlist, config.mpd_host, config.mpd_port,
                                config.mpd_password, config.command_timeout);

  // Queues
  eventQueue = xQueueCreate(EVENT_QUEUE_LENGTH, sizeof(Event));
  commandQueue = xQueueCreate(COMMAND_QUEUE_LENGTH, sizeof(Command));
  if (eventQueue == NULL || commandQueue == NULL) {
    LOGE(TAG, "Failed to create queues");
    display->showStatus("Out of memory", "");
    return;
  }

  coordinator = new Coordinator(playlist, config, commandPort, *renderer);
  coordinator->begin(millis());

  // Encoder interrupts on both pins
  if (config.rotary_a >= 0 && config.rotary_b >= 0) {
    attachInterrupt(digitalPinToInterrupt(config.rotary_a), encoderISR, CHANGE);
    attachInterrupt(digitalPinToInterrupt(config.rotary_b), encoderISR, CHANGE);
  }

  // Tasks, the network ones on core 0 next to the WiFi stack
  startTask(inputTask, "InputTask", 3072, 3, &inputTaskHandle, 1);
  startTask(statusTask, "StatusTask", 6144, 1, &statusTaskHandle, 0);
  startTask(commandTask, "CommandTask", 6144, 2, &commandTaskHandle, 0);
  startTask(renderTask, "RenderTask", 6144, 1, &renderTaskHandle, 1);
  startTask(wifiTask, "WiFiTask", 4096, 1, &wifiTaskHandle, 0);
}

/**
 * @brief Arduino main loop function
 * The control loop: feeds queued events to the coordinator, runs its timers
 * and posts the minute clock ticks. Nothing here may block on the network.
 */
void loop() {
  if (coordinator == nullptr) {
    delay(1000);
    return;
  }
  Event event;
  if (xQueueReceive(eventQueue, &event, pdMS_TO_TICKS(50)) == pdPASS) {
    coordinator->handle(event);
  }
  unsigned long now = millis();
  coordinator->tick(now);

  // Minute clock for the title bar
  static int lastMinute = -2;
  int minute = currentMinuteOfDay();
  if (minute != lastMinute) {
    lastMinute = minute;
    Event tick = makeTickEvent(minute, now);
    if (!postEvent(tick, 0)) {
      LOGW(TAG, "Event queue full, clock tick dropped");
      lastMinute = -2;
    }
  }

  // LED on while playing
  if (config.led_pin >= 0) {
    digitalWrite(config.led_pin, coordinator->getState().mode == UiMode::Playing ? HIGH : LOW);
  }
}
