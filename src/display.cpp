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

#include "display.h"
#include "log.h"
#include <Fonts/FreeSans9pt7b.h>
#include <Fonts/FreeSansBold12pt7b.h>
#include <Fonts/FreeSansBold18pt7b.h>

static const char* TAG = "display";

/**
 * @brief Construct a new EpaperDisplay object
 * 
 * The driver is created later, in begin(), once the pins are known to be valid.
 */
EpaperDisplay::EpaperDisplay(int cs, int dc, int rst, int busy) :
    epd(nullptr), pinCS(cs), pinDC(dc), pinRST(rst), pinBUSY(busy), partialUpdates(0) {}

EpaperDisplay::~EpaperDisplay() {
    delete epd;
}

bool EpaperDisplay::begin() {
    if (pinCS < 0 || pinDC < 0 || pinBUSY < 0) {
        LOGE(TAG, "E-paper pins not configured");
        return false;
    }
    epd = new EpaperDriver(GxEPD2_290(pinCS, pinDC, pinRST, pinBUSY));
    // No driver diagnostics on the serial console
    epd->init(0);
    epd->setRotation(1);
    epd->setTextWrap(false);
    epd->setTextColor(GxEPD_BLACK);
    showStatus("DialTuner", "Starting");
    LOGI(TAG, "E-paper panel %dx%d ready", epd->width(), epd->height());
    return true;
}

/**
 * @brief Print text with alignment
 * 
 * @param text Text to print
 * @param x Horizontal position, used for left alignment only
 * @param y Baseline
 * @param align 'l', 'c' or 'r'
 */
void EpaperDisplay::printAt(const char* text, int x, int y, char align) {
    int16_t x1, y1;
    uint16_t w, h;
    if (align == 'c' || align == 'r') {
        epd->getTextBounds(text, 0, y, &x1, &y1, &w, &h);
        if (align == 'c') {
            x = (epd->width() - w) / 2 - x1;
        } else {
            x = epd->width() - w - x1 - 2;
        }
    }
    if (x < 0) x = 0;
    epd->setCursor(x, y);
    epd->print(text);
}

void EpaperDisplay::showStatus(const char* line1, const char* line2) {
    if (!epd) {
        return;
    }
    epd->setFullWindow();
    epd->firstPage();
    do {
        epd->fillScreen(GxEPD_WHITE);
        epd->setTextColor(GxEPD_BLACK);
        epd->setFont(&FreeSansBold18pt7b);
        printAt(line1, 0, 60, 'c');
        if (line2 && line2[0]) {
            epd->setFont(&FreeSans9pt7b);
            printAt(line2, 0, 100, 'c');
        }
    } while (epd->nextPage());
    partialUpdates = 0;
}

bool EpaperDisplay::show(const RenderSnapshot& snapshot) {
    if (!epd) {
        return false;
    }
    // Full refresh now and then, partial updates leave ghosts on e-paper
    if (partialUpdates >= EPD_FULL_REFRESH) {
        epd->setFullWindow();
        partialUpdates = 0;
    } else {
        epd->setPartialWindow(0, 0, epd->width(), epd->height());
        partialUpdates++;
    }
    epd->firstPage();
    do {
        epd->fillScreen(GxEPD_WHITE);
        drawTitle(snapshot);
        switch (snapshot.layout) {
            case ScreenLayout::List:
                drawList(snapshot);
                break;
            case ScreenLayout::NowPlaying:
                drawNowPlaying(snapshot);
                break;
            case ScreenLayout::Volume:
                drawVolume(snapshot);
                break;
        }
        drawOverlay(snapshot);
    } while (epd->nextPage());
    if (isBusy()) {
        LOGW(TAG, "Panel still busy after refresh");
        return false;
    }
    return true;
}

bool EpaperDisplay::isBusy() const {
    // The IL3820 controller holds BUSY high while refreshing
    return digitalRead(pinBUSY) == HIGH;
}

void EpaperDisplay::drawTitle(const RenderSnapshot& snapshot) {
    epd->setFont(&FreeSans9pt7b);
    epd->setTextColor(GxEPD_BLACK);
    printAt(snapshot.header, 2, EPD_TITLE_HEIGHT - 5, 'l');
    if (snapshot.clock[0]) {
        printAt(snapshot.clock, 0, EPD_TITLE_HEIGHT - 5, 'r');
    }
    epd->drawFastHLine(0, EPD_TITLE_HEIGHT - 1, epd->width(), GxEPD_BLACK);
}

/**
 * @brief Three station names, the highlighted one inverted
 */
void EpaperDisplay::drawList(const RenderSnapshot& snapshot) {
    epd->setFont(&FreeSansBold12pt7b);
    for (int i = 0; i < RENDER_LINES; i++) {
        int top = EPD_TITLE_HEIGHT + 2 + i * EPD_LINE_HEIGHT;
        if (i == snapshot.highlight) {
            epd->fillRect(0, top, epd->width(), EPD_LINE_HEIGHT, GxEPD_BLACK);
            epd->setTextColor(GxEPD_WHITE);
        } else {
            epd->setTextColor(GxEPD_BLACK);
        }
        if (snapshot.lines[i][0]) {
            printAt(snapshot.lines[i], 0, top + EPD_LINE_HEIGHT - 11, 'c');
        }
    }
    epd->setTextColor(GxEPD_BLACK);
}

void EpaperDisplay::drawNowPlaying(const RenderSnapshot& snapshot) {
    epd->setTextColor(GxEPD_BLACK);
    epd->setFont(&FreeSansBold18pt7b);
    printAt(snapshot.lines[0], 0, EPD_TITLE_HEIGHT + 40, 'c');
    epd->setFont(&FreeSans9pt7b);
    printAt(snapshot.lines[1], 0, EPD_TITLE_HEIGHT + 72, 'c');
    printAt(snapshot.lines[2], 0, EPD_TITLE_HEIGHT + 102, 'c');
}

void EpaperDisplay::drawVolume(const RenderSnapshot& snapshot) {
    char text[8];
    int left = 20;
    int width = epd->width() - 2 * left;
    int level = constrain(snapshot.volume, 0, 100);
    epd->setTextColor(GxEPD_BLACK);
    epd->setFont(&FreeSansBold12pt7b);
    printAt(snapshot.lines[0], 0, EPD_TITLE_HEIGHT + 30, 'c');
    epd->drawRect(left, EPD_TITLE_HEIGHT + 44, width, 24, GxEPD_BLACK);
    epd->fillRect(left + 2, EPD_TITLE_HEIGHT + 46, (width - 4) * level / 100, 20, GxEPD_BLACK);
    snprintf(text, sizeof(text), "%d", level);
    epd->setFont(&FreeSans9pt7b);
    printAt(text, 0, EPD_TITLE_HEIGHT + 100, 'c');
}

/**
 * @brief Framed error box over the middle of the screen
 */
void EpaperDisplay::drawOverlay(const RenderSnapshot& snapshot) {
    if (!snapshot.overlay[0]) {
        return;
    }
    int top = EPD_TITLE_HEIGHT + 22;
    epd->fillRect(16, top, epd->width() - 32, 50, GxEPD_WHITE);
    epd->drawRect(16, top, epd->width() - 32, 50, GxEPD_BLACK);
    epd->drawRect(18, top + 2, epd->width() - 36, 46, GxEPD_BLACK);
    epd->setTextColor(GxEPD_BLACK);
    epd->setFont(&FreeSansBold12pt7b);
    printAt(snapshot.overlay, 0, top + 33, 'c');
}
