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

#include "rotary.h"

// Decoder states
#define R_START      0x0
#define R_CW_FINAL   0x1
#define R_CW_BEGIN   0x2
#define R_CW_NEXT    0x3
#define R_CCW_BEGIN  0x4
#define R_CCW_FINAL  0x5
#define R_CCW_NEXT   0x6

// Emit flags, or'ed into the next state
#define DIR_CW   0x10
#define DIR_CCW  0x20

/**
 * @brief Full-step transition table
 * Row is the current state, column the pin levels 00, 01, 10, 11.
 */
static const DRAM_ATTR uint8_t rotaryTable[7][4] = {
  // R_START
  {R_START,    R_CW_BEGIN,  R_CCW_BEGIN, R_START},
  // R_CW_FINAL
  {R_CW_NEXT,  R_START,     R_CW_FINAL,  R_START | DIR_CW},
  // R_CW_BEGIN
  {R_CW_NEXT,  R_CW_BEGIN,  R_START,     R_START},
  // R_CW_NEXT
  {R_CW_NEXT,  R_CW_BEGIN,  R_CW_FINAL,  R_START},
  // R_CCW_BEGIN
  {R_CCW_NEXT, R_START,     R_CCW_BEGIN, R_START},
  // R_CCW_FINAL
  {R_CCW_NEXT, R_CCW_FINAL, R_START,     R_START | DIR_CCW},
  // R_CCW_NEXT
  {R_CCW_NEXT, R_CCW_FINAL, R_CCW_BEGIN, R_START},
};

QuadratureDecoder::QuadratureDecoder() : state(R_START) {}

int IRAM_ATTR QuadratureDecoder::process(uint8_t pinState) {
  state = rotaryTable[state & 0x0F][pinState & 0x03];
  uint8_t emit = state & 0x30;
  if (emit == DIR_CW) {
    return 1;
  }
  if (emit == DIR_CCW) {
    return -1;
  }
  return 0;
}

void QuadratureDecoder::reset() {
  state = R_START;
}

ButtonDebouncer::ButtonDebouncer(unsigned long debounceMs, unsigned long longPressMs)
  : debounceTime(debounceMs), longPressTime(longPressMs), rawPressed(false), rawChangedAt(0),
    stablePressed(false), pressStartedAt(0), longPressSent(false) {}

void ButtonDebouncer::configure(unsigned long debounceMs, unsigned long longPressMs) {
  debounceTime = debounceMs;
  longPressTime = longPressMs;
}

/**
 * @brief Process one sample of the button level
 * @details The debouncing works by:
 * 1. Restarting the debounce timer whenever the sampled level changes
 * 2. Accepting the level once it was stable for the debounce time
 * 3. Reporting a long press as soon as the accepted press is old enough
 * 4. Reporting a click on release, unless the long press was already reported
 */
bool ButtonDebouncer::sample(bool pressed, unsigned long now, InputType& type) {
  if (pressed != rawPressed) {
    rawPressed = pressed;
    rawChangedAt = now;
  }
  if (rawPressed != stablePressed && (now - rawChangedAt) >= debounceTime) {
    stablePressed = rawPressed;
    if (stablePressed) {
      pressStartedAt = rawChangedAt;
      longPressSent = false;
    } else if (!longPressSent) {
      type = InputType::Click;
      return true;
    }
  }
  if (stablePressed && !longPressSent && (now - pressStartedAt) >= longPressTime) {
    longPressSent = true;
    type = InputType::LongPress;
    return true;
  }
  return false;
}

InputDebouncer::InputDebouncer(unsigned long debounceMs, unsigned long longPressMs) : pendingSteps(0) {
  configure(debounceMs, longPressMs);
}

void InputDebouncer::configure(unsigned long debounceMs, unsigned long longPressMs) {
  for (int i = 0; i < BUTTON_COUNT; i++) {
    buttons[i].configure(debounceMs, longPressMs);
  }
}

void IRAM_ATTR InputDebouncer::encoderChanged(uint8_t pinState) {
  int step = decoder.process(pinState);
  if (step == 0) {
    return;
  }
  int steps = pendingSteps + step;
  if (steps > MAX_BUFFERED_STEPS) steps = MAX_BUFFERED_STEPS;
  if (steps < -MAX_BUFFERED_STEPS) steps = -MAX_BUFFERED_STEPS;
  pendingSteps = steps;
}

int InputDebouncer::takeSteps() {
  int steps = pendingSteps;
  pendingSteps = 0;
  return steps;
}

void InputDebouncer::poll(int steps, const bool pressed[BUTTON_COUNT], unsigned long now, InputSink& sink) {
  InputEvent event;
  event.button = ButtonId::Select;
  event.timestamp = now;
  // One event per detent, in the direction of rotation
  event.type = steps > 0 ? InputType::RotateCW : InputType::RotateCCW;
  int count = steps > 0 ? steps : -steps;
  for (int i = 0; i < count; i++) {
    sink.onInput(event);
  }
  for (int i = 0; i < BUTTON_COUNT; i++) {
    InputType type;
    if (buttons[i].sample(pressed[i], now, type)) {
      event.type = type;
      event.button = static_cast<ButtonId>(i);
      sink.onInput(event);
    }
  }
}
