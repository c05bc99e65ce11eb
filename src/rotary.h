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

#ifndef ROTARY_H
#define ROTARY_H

#include <stdint.h>
#include "events.h"

// Interrupt handlers and their data must not live in flash on the ESP32
#if defined(ARDUINO_ARCH_ESP32)
#include <esp_attr.h>
#else
#define IRAM_ATTR
#define DRAM_ATTR
#endif

// Upper bound of encoder steps buffered between two polls
#define MAX_BUFFERED_STEPS 16

/**
 * @brief Receiver of debounced input events
 */
class InputSink {
public:
  virtual ~InputSink() {}
  virtual void onInput(const InputEvent& event) = 0;
};

/**
 * @brief Full-step quadrature decoder
 * @details Follows the encoder through its four gray code phases per detent
 * using a state table. A step is reported only when a complete, ordered
 * sequence ends back in the rest position (both pins high with pull-ups).
 *
 * Bouncing contacts make the state flip between sub-states until the signal
 * settles, and an invalid transition (for example 01 straight to 10) sends the
 * machine back to the start, so glitches are absorbed without ever producing
 * a step.
 */
class QuadratureDecoder {
private:
  volatile uint8_t state;

public:
  QuadratureDecoder();

  /**
   * @brief Feed the current pin levels
   * @param pinState Encoder levels packed as (B << 1) | A
   * @return +1 for a clockwise step, -1 for counter-clockwise, 0 otherwise
   */
  int process(uint8_t pinState);

  void reset();
};

/**
 * @brief Sampled push button with click and long press recognition
 * @details The raw level must stay unchanged for the debounce time before it
 * is accepted. A press held for the long press time produces one LongPress
 * while still held; a shorter press produces one Click on release. Never both
 * for the same press.
 */
class ButtonDebouncer {
private:
  unsigned long debounceTime;    ///< Required stable time in milliseconds
  unsigned long longPressTime;   ///< Hold time that turns a press into a long press
  bool rawPressed;               ///< Last sampled level
  unsigned long rawChangedAt;    ///< When the sampled level last changed
  bool stablePressed;            ///< Debounced level
  unsigned long pressStartedAt;  ///< Start of the current debounced press
  bool longPressSent;            ///< LongPress already reported for this press

public:
  ButtonDebouncer(unsigned long debounceMs = 20, unsigned long longPressMs = 800);

  void configure(unsigned long debounceMs, unsigned long longPressMs);

  /**
   * @brief Process one sample of the button level
   * @param pressed true when the button is pressed
   * @param now Current time in milliseconds
   * @param type Receives the recognized event type
   * @return true if an event was recognized
   */
  bool sample(bool pressed, unsigned long now, InputType& type);

  bool isPressed() const { return stablePressed; }
};

/**
 * @brief Input debouncer for one rotary encoder and the push buttons
 * @details The encoder side is driven from the pin change interrupt and only
 * accumulates steps. The poll side runs at the sampling interval from the
 * input task, turns the accumulated steps into rotation events and samples
 * the buttons.
 */
class InputDebouncer {
private:
  QuadratureDecoder decoder;
  ButtonDebouncer buttons[BUTTON_COUNT];
  volatile int pendingSteps;

public:
  InputDebouncer(unsigned long debounceMs = 20, unsigned long longPressMs = 800);

  void configure(unsigned long debounceMs, unsigned long longPressMs);

  /**
   * @brief Encoder pin change, interrupt context
   * @param pinState Encoder levels packed as (B << 1) | A
   */
  void encoderChanged(uint8_t pinState);

  /**
   * @brief Fetch and clear the accumulated encoder steps
   * @details Not atomic against encoderChanged(); the caller masks the
   * encoder interrupt around it.
   * @return Signed step count, positive for clockwise
   */
  int takeSteps();

  /**
   * @brief Emit events for one polling period
   * @param steps Encoder steps taken with takeSteps()
   * @param pressed Button levels indexed by ButtonId
   * @param now Current time in milliseconds
   * @param sink Event receiver
   */
  void poll(int steps, const bool pressed[BUTTON_COUNT], unsigned long now, InputSink& sink);
};

#endif // ROTARY_H
