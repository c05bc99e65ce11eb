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

#ifndef DISPLAY_H
#define DISPLAY_H

#include <Arduino.h>
#include <GxEPD2_BW.h>
#include "render.h"

/**
 * @brief Panel driver type, 2.9" 296x128 black and white e-paper
 */
typedef GxEPD2_BW<GxEPD2_290, GxEPD2_290::HEIGHT> EpaperDriver;

// Layout, in landscape orientation
#define EPD_TITLE_HEIGHT   18   ///< Title bar height, separator line included
#define EPD_LINE_HEIGHT    36   ///< Height of one browser line
#define EPD_FULL_REFRESH   20   ///< Partial updates between two full refreshes

/**
 * @brief E-paper display
 * 
 * Draws render snapshots on a GxEPD2 driven panel. Frames are drawn with
 * partial updates, with a periodic full refresh to clear the ghosting.
 * All calls block until the panel refresh completes, so they belong on the
 * render task.
 */
class EpaperDisplay : public Panel {
private:
    EpaperDriver* epd;       ///< Panel driver, created in begin()
    int pinCS;               ///< SPI chip select pin
    int pinDC;               ///< Data/command pin
    int pinRST;              ///< Reset pin
    int pinBUSY;             ///< Busy pin
    int partialUpdates;      ///< Partial updates since the last full refresh

public:
    /**
     * @brief Construct a new EpaperDisplay object
     * 
     * @param cs Chip select pin
     * @param dc Data/command pin
     * @param rst Reset pin
     * @param busy Busy pin
     */
    EpaperDisplay(int cs, int dc, int rst, int busy);
    ~EpaperDisplay();

    /**
     * @brief Initialize the panel and clear it
     * 
     * @return false if the pins are not configured
     */
    virtual bool begin();

    /**
     * @brief Draw a snapshot
     * 
     * @param snapshot Frame content
     * @return false if the panel is not initialized or still busy after the refresh
     */
    virtual bool show(const RenderSnapshot& snapshot);

    /**
     * @brief Show a boot message on a blank screen
     * 
     * @param line1 First line, large
     * @param line2 Second line, small, may be empty
     */
    void showStatus(const char* line1, const char* line2);

private:
    void printAt(const char* text, int x, int y, char align);
    void drawTitle(const RenderSnapshot& snapshot);
    void drawList(const RenderSnapshot& snapshot);
    void drawNowPlaying(const RenderSnapshot& snapshot);
    void drawVolume(const RenderSnapshot& snapshot);
    void drawOverlay(const RenderSnapshot& snapshot);
    bool isBusy() const;
};

#endif // DISPLAY_H
