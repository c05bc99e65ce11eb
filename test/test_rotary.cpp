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

#include <gtest/gtest.h>
#include "fakes.h"
#include "rotary.h"

// Pin levels packed as (B << 1) | A, rest position is both high
static const uint8_t CW_SEQUENCE[] = {0x1, 0x0, 0x2, 0x3};
static const uint8_t CCW_SEQUENCE[] = {0x2, 0x0, 0x1, 0x3};

static int feed(QuadratureDecoder& decoder, const uint8_t* sequence, size_t length) {
  int total = 0;
  for (size_t i = 0; i < length; i++) {
    total += decoder.process(sequence[i]);
  }
  return total;
}

TEST(QuadratureDecoderTest, FullClockwiseCycleIsOneStep) {
  QuadratureDecoder decoder;
  EXPECT_EQ(feed(decoder, CW_SEQUENCE, 4), 1);
  EXPECT_EQ(feed(decoder, CW_SEQUENCE, 4), 1);
}

TEST(QuadratureDecoderTest, FullCounterClockwiseCycleIsOneStep) {
  QuadratureDecoder decoder;
  EXPECT_EQ(feed(decoder, CCW_SEQUENCE, 4), -1);
}

TEST(QuadratureDecoderTest, StepIsReportedOnlyBackAtRest) {
  QuadratureDecoder decoder;
  EXPECT_EQ(decoder.process(0x1), 0);
  EXPECT_EQ(decoder.process(0x0), 0);
  EXPECT_EQ(decoder.process(0x2), 0);
  EXPECT_EQ(decoder.process(0x3), 1);
}

TEST(QuadratureDecoderTest, ContactBounceProducesNoStep) {
  QuadratureDecoder decoder;
  const uint8_t bounce[] = {0x1, 0x3, 0x1, 0x3, 0x2, 0x3};
  EXPECT_EQ(feed(decoder, bounce, sizeof(bounce)), 0);
}

TEST(QuadratureDecoderTest, InvalidTransitionRestarts) {
  QuadratureDecoder decoder;
  // 01 straight to 10 is not a valid gray code move
  const uint8_t glitch[] = {0x1, 0x2, 0x3};
  EXPECT_EQ(feed(decoder, glitch, sizeof(glitch)), 0);
  EXPECT_EQ(feed(decoder, CW_SEQUENCE, 4), 1);
}

TEST(QuadratureDecoderTest, ReversalHalfwayProducesNoStep) {
  QuadratureDecoder decoder;
  const uint8_t reversal[] = {0x1, 0x0, 0x1, 0x3};
  EXPECT_EQ(feed(decoder, reversal, sizeof(reversal)), 0);
}

TEST(ButtonDebouncerTest, ShortPressIsOneClickOnRelease) {
  ButtonDebouncer button(20, 800);
  InputType type;
  EXPECT_FALSE(button.sample(true, 1000, type));
  EXPECT_FALSE(button.sample(true, 1020, type));
  EXPECT_TRUE(button.isPressed());
  EXPECT_FALSE(button.sample(false, 1100, type));
  ASSERT_TRUE(button.sample(false, 1120, type));
  EXPECT_EQ(type, InputType::Click);
  EXPECT_FALSE(button.sample(false, 1200, type));
}

TEST(ButtonDebouncerTest, BounceShorterThanDebounceIsIgnored) {
  ButtonDebouncer button(20, 800);
  InputType type;
  unsigned long now = 1000;
  for (int i = 0; i < 10; i++) {
    EXPECT_FALSE(button.sample(i % 2 == 0, now, type));
    now += 5;
  }
  EXPECT_FALSE(button.sample(false, now + 100, type));
  EXPECT_FALSE(button.isPressed());
}

TEST(ButtonDebouncerTest, LongPressFiresOnceWhileHeldAndNoClick) {
  ButtonDebouncer button(20, 800);
  InputType type;
  int longPresses = 0;
  int clicks = 0;
  for (unsigned long now = 1000; now <= 3000; now += 5) {
    if (button.sample(true, now, type)) {
      type == InputType::LongPress ? longPresses++ : clicks++;
    }
  }
  for (unsigned long now = 3005; now <= 3100; now += 5) {
    if (button.sample(false, now, type)) {
      type == InputType::LongPress ? longPresses++ : clicks++;
    }
  }
  EXPECT_EQ(longPresses, 1);
  EXPECT_EQ(clicks, 0);
}

TEST(ButtonDebouncerTest, LongPressTimedFromPressStart) {
  ButtonDebouncer button(20, 800);
  InputType type;
  EXPECT_FALSE(button.sample(true, 1000, type));
  EXPECT_FALSE(button.sample(true, 1799, type));
  ASSERT_TRUE(button.sample(true, 1800, type));
  EXPECT_EQ(type, InputType::LongPress);
}

TEST(InputDebouncerTest, EncoderStepsBecomeRotationEvents) {
  InputDebouncer input(20, 800);
  for (int i = 0; i < 3; i++) {
    for (int j = 0; j < 4; j++) input.encoderChanged(CW_SEQUENCE[j]);
  }
  for (int j = 0; j < 4; j++) input.encoderChanged(CCW_SEQUENCE[j]);
  int steps = input.takeSteps();
  EXPECT_EQ(steps, 2);
  EXPECT_EQ(input.takeSteps(), 0);

  InputRecorder sink;
  bool pressed[BUTTON_COUNT] = {false, false, false};
  input.poll(steps, pressed, 5000, sink);
  ASSERT_EQ(sink.events.size(), 2u);
  EXPECT_EQ(sink.events[0].type, InputType::RotateCW);
  EXPECT_EQ(sink.events[1].timestamp, 5000u);
}

TEST(InputDebouncerTest, BufferedStepsAreBounded) {
  InputDebouncer input;
  for (int i = 0; i < 40; i++) {
    for (int j = 0; j < 4; j++) input.encoderChanged(CCW_SEQUENCE[j]);
  }
  EXPECT_EQ(input.takeSteps(), -MAX_BUFFERED_STEPS);
}

TEST(InputDebouncerTest, ButtonsAreReportedWithTheirId) {
  InputDebouncer input(20, 800);
  InputRecorder sink;
  bool pressed[BUTTON_COUNT] = {false, false, true};
  input.poll(0, pressed, 1000, sink);
  input.poll(0, pressed, 1020, sink);
  pressed[2] = false;
  input.poll(0, pressed, 1100, sink);
  input.poll(0, pressed, 1120, sink);
  ASSERT_EQ(sink.events.size(), 1u);
  EXPECT_EQ(sink.events[0].type, InputType::Click);
  EXPECT_EQ(sink.events[0].button, ButtonId::Back);
}
