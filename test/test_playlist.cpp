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
#include <string>
#include "events.h"
#include "log.h"
#include "playlist.h"

TEST(PlaylistTest, AcceptsOnlyNamedHttpStations) {
  Playlist playlist;
  EXPECT_TRUE(playlist.addItem("Radio One", "http://one.example/stream"));
  EXPECT_TRUE(playlist.addItem("Radio Two", "https://two.example/stream"));
  EXPECT_FALSE(playlist.addItem("", "http://three.example/stream"));
  EXPECT_FALSE(playlist.addItem(nullptr, "http://three.example/stream"));
  EXPECT_FALSE(playlist.addItem("Local", "file:///music/a.mp3"));
  EXPECT_FALSE(playlist.addItem("Nothing", nullptr));
  ASSERT_EQ(playlist.getCount(), 2);
  EXPECT_EQ(playlist.getItem(1).index, 1);
  EXPECT_STREQ(playlist.getItem(1).name, "Radio Two");
}

TEST(PlaylistTest, RejectsUrlsThatDoNotFit) {
  Playlist playlist;
  std::string longest = "http://radio.example/" + std::string(STATION_URL_SIZE - 1 - 21, 'a');
  ASSERT_EQ(longest.size(), static_cast<size_t>(STATION_URL_SIZE - 1));
  EXPECT_TRUE(playlist.addItem("Longest", longest.c_str()));
  std::string tooLong = longest + "b";
  EXPECT_FALSE(playlist.addItem("Too long", tooLong.c_str()));
  ASSERT_EQ(playlist.getCount(), 1);
  EXPECT_EQ(playlist.findByUrl(longest.c_str()), 0);
  EXPECT_STREQ(playlist.getItem(0).url, longest.c_str());
}

TEST(PlaylistTest, StopsAtCapacity) {
  Playlist playlist;
  for (int i = 0; i < MAX_PLAYLIST_SIZE; i++) {
    std::string url = "http://radio.example/" + std::to_string(i);
    EXPECT_TRUE(playlist.addItem("Station", url.c_str()));
  }
  EXPECT_FALSE(playlist.addItem("Extra", "http://radio.example/extra"));
  EXPECT_EQ(playlist.getCount(), MAX_PLAYLIST_SIZE);
  playlist.clear();
  EXPECT_TRUE(playlist.isEmpty());
}

TEST(PlaylistTest, FindsStationsByUrl) {
  Playlist playlist;
  playlist.addItem("A", "http://a.example/");
  playlist.addItem("B", "http://b.example/");
  EXPECT_EQ(playlist.findByUrl("http://b.example/"), 1);
  EXPECT_EQ(playlist.findByUrl("http://c.example/"), -1);
  EXPECT_EQ(playlist.findByUrl(""), -1);
  EXPECT_EQ(playlist.findByUrl(nullptr), -1);
}

TEST(PlaylistTest, WrapIndexStaysInRange) {
  Playlist playlist;
  EXPECT_EQ(playlist.wrapIndex(0, 1), 0);
  playlist.addItem("A", "http://a.example/");
  playlist.addItem("B", "http://b.example/");
  playlist.addItem("C", "http://c.example/");
  EXPECT_EQ(playlist.wrapIndex(2, 1), 0);
  EXPECT_EQ(playlist.wrapIndex(0, -1), 2);
  EXPECT_EQ(playlist.wrapIndex(1, -7), 0);
  for (int delta = -10; delta <= 10; delta++) {
    int index = playlist.wrapIndex(1, delta);
    EXPECT_GE(index, 0);
    EXPECT_LT(index, 3);
  }
}

TEST(EventsTest, ButtonNamesRoundTrip) {
  ButtonId button = ButtonId::Select;
  EXPECT_TRUE(buttonFromName("back", button));
  EXPECT_EQ(button, ButtonId::Back);
  EXPECT_TRUE(buttonFromName(buttonName(ButtonId::Menu), button));
  EXPECT_EQ(button, ButtonId::Menu);
  EXPECT_FALSE(buttonFromName("volume", button));
  EXPECT_EQ(button, ButtonId::Menu);
  EXPECT_FALSE(buttonFromName(nullptr, button));
}

TEST(EventsTest, ResultsCarryTruncatedMessages) {
  DaemonResult ok = makeResult(DaemonError::None);
  EXPECT_TRUE(ok.ok());
  EXPECT_STREQ(ok.message, "OK");
  std::string longText(200, 'x');
  DaemonResult failed = makeResult(DaemonError::StreamError, longText.c_str());
  EXPECT_FALSE(failed.ok());
  EXPECT_EQ(strlen(failed.message), static_cast<size_t>(RESULT_MESSAGE_SIZE - 1));
}

TEST(EventsTest, EmptyStatusKnowsNothing) {
  DaemonStatus status = makeEmptyStatus();
  EXPECT_EQ(status.state, PlaybackState::Stopped);
  EXPECT_EQ(status.error, DaemonError::None);
  EXPECT_EQ(status.stationIndex, -1);
  EXPECT_EQ(status.volume, -1);
}

// Log capture
static std::string captured;
static int capturedCount = 0;

static void captureSink(LogLevel level, const char* tag, const char* message) {
  captured = std::string(logLevelLabel(level)) + "/" + tag + ": " + message;
  capturedCount++;
}

TEST(LogTest, FiltersBelowLevelAndFormats) {
  captured.clear();
  capturedCount = 0;
  setLogSink(captureSink);
  LogLevel saved = getLogLevel();
  setLogLevel(LogLevel::Warn);
  LOGI("test", "hidden %d", 1);
  EXPECT_EQ(capturedCount, 0);
  LOGE("test", "shown %d/%s", 2, "x");
  EXPECT_EQ(capturedCount, 1);
  EXPECT_EQ(captured, "E/test: shown 2/x");
  setLogLevel(LogLevel::None);
  LOGE("test", "muted");
  EXPECT_EQ(capturedCount, 1);
  setLogLevel(saved);
  setLogSink(nullptr);
}
