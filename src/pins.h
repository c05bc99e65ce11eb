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

#ifndef PINS_H
#define PINS_H

// Default pin definitions with ifndef guards to prevent overwriting

#ifndef DEFAULT_LED_PIN
#define DEFAULT_LED_PIN           2  ///< ESP32 internal LED pin
#endif

#ifndef DEFAULT_ROTARY_A
#define DEFAULT_ROTARY_A         26  ///< Rotary encoder A (clock) pin
#endif

#ifndef DEFAULT_ROTARY_B
#define DEFAULT_ROTARY_B         27  ///< Rotary encoder B (data) pin
#endif

#ifndef DEFAULT_ROTARY_SW
#define DEFAULT_ROTARY_SW        25  ///< Rotary encoder switch pin
#endif

#ifndef DEFAULT_MENU_BUTTON
#define DEFAULT_MENU_BUTTON      32  ///< Auxiliary menu button pin
#endif

#ifndef DEFAULT_BACK_BUTTON
#define DEFAULT_BACK_BUTTON      33  ///< Auxiliary back button pin
#endif

#ifndef DEFAULT_EPD_CS
#define DEFAULT_EPD_CS            5  ///< E-paper SPI chip select pin
#endif

#ifndef DEFAULT_EPD_DC
#define DEFAULT_EPD_DC           17  ///< E-paper data/command pin
#endif

#ifndef DEFAULT_EPD_RST
#define DEFAULT_EPD_RST          16  ///< E-paper reset pin
#endif

#ifndef DEFAULT_EPD_BUSY
#define DEFAULT_EPD_BUSY          4  ///< E-paper busy pin
#endif

// The panel uses the default VSPI bus: SCK 18, MOSI 23

#endif // PINS_H
