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
#include "mpd.h"

class MPDClientTest : public ::testing::Test {
protected:
  Playlist playlist;
  FakeDaemon daemon;

  void SetUp() {
    playlist.addItem("Jazz", "http://jazz.example/stream");
    playlist.addItem("Rock", "http://rock.example/stream");
    playlist.addItem("News", "http://news.example/live?fmt=\"mp3\"");
  }
};

TEST_F(MPDClientTest, SelectAndPlayReplacesQueueAndPlays) {
  MPDClient client(daemon, playlist, "mpd.local");
  DaemonResult result = client.selectAndPlay(1);
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(daemon.state, "play");
  EXPECT_EQ(daemon.file, "http://rock.example/stream");
  EXPECT_EQ(daemon.plays, 1);
  EXPECT_EQ(daemon.count("clear"), 1);
  EXPECT_EQ(daemon.count("add \"http://rock.example/stream\""), 1);
  EXPECT_EQ(client.getPlaysSent(), 1u);
  EXPECT_TRUE(client.isReady());
}

TEST_F(MPDClientTest, SelectAndPlayIsIdempotent) {
  MPDClient client(daemon, playlist, "mpd.local");
  EXPECT_TRUE(client.selectAndPlay(0).ok());
  EXPECT_TRUE(client.selectAndPlay(0).ok());
  EXPECT_EQ(daemon.plays, 1);
  EXPECT_EQ(daemon.count("play 0"), 1);
  EXPECT_EQ(client.getPlaysSent(), 1u);
  // The connection is kept between commands
  EXPECT_EQ(daemon.connects, 1);
}

TEST_F(MPDClientTest, SelectAndPlayRestartsStoppedStation) {
  MPDClient client(daemon, playlist, "mpd.local");
  EXPECT_TRUE(client.selectAndPlay(0).ok());
  EXPECT_TRUE(client.stop().ok());
  EXPECT_EQ(daemon.state, "stop");
  EXPECT_TRUE(client.selectAndPlay(0).ok());
  EXPECT_EQ(daemon.plays, 2);
}

TEST_F(MPDClientTest, QuotesUrlsWithSpecialCharacters) {
  MPDClient client(daemon, playlist, "mpd.local");
  EXPECT_TRUE(client.selectAndPlay(2).ok());
  EXPECT_EQ(daemon.count("add \"http://news.example/live?fmt=\\\"mp3\\\"\""), 1);
  EXPECT_EQ(daemon.file, "http://news.example/live?fmt=\"mp3\"");
}

TEST_F(MPDClientTest, InvalidStationIsStreamError) {
  MPDClient client(daemon, playlist, "mpd.local");
  DaemonResult result = client.selectAndPlay(7);
  EXPECT_EQ(result.error, DaemonError::StreamError);
  EXPECT_EQ(daemon.connects, 0);
}

TEST_F(MPDClientTest, RefusedConnectionIsDaemonUnavailable) {
  daemon.refuseConnect = true;
  MPDClient client(daemon, playlist, "mpd.local");
  EXPECT_EQ(client.selectAndPlay(0).error, DaemonError::DaemonUnavailable);
  EXPECT_EQ(client.stop().error, DaemonError::DaemonUnavailable);
  EXPECT_FALSE(client.isReady());
}

TEST_F(MPDClientTest, WrongGreetingIsDaemonUnavailable) {
  daemon.greeting = "SSH-2.0-OpenSSH_9.2";
  MPDClient client(daemon, playlist, "mpd.local");
  DaemonResult result = client.setVolume(10);
  EXPECT_EQ(result.error, DaemonError::DaemonUnavailable);
  EXPECT_STREQ(result.message, "Bad greeting");
  EXPECT_FALSE(daemon.connected());
}

TEST_F(MPDClientTest, EmptyHostIsDaemonUnavailable) {
  MPDClient client(daemon, playlist, "");
  EXPECT_EQ(client.stop().error, DaemonError::DaemonUnavailable);
  EXPECT_EQ(daemon.connects, 0);
}

TEST_F(MPDClientTest, SendsPasswordAfterGreeting) {
  daemon.password = "secret";
  MPDClient client(daemon, playlist, "mpd.local", MPD_DEFAULT_PORT, "secret");
  EXPECT_TRUE(client.selectAndPlay(0).ok());
  ASSERT_FALSE(daemon.received.empty());
  EXPECT_EQ(daemon.received[0], "password \"secret\"");
}

TEST_F(MPDClientTest, RejectedPasswordIsDaemonUnavailable) {
  daemon.password = "secret";
  MPDClient client(daemon, playlist, "mpd.local", MPD_DEFAULT_PORT, "guess");
  EXPECT_EQ(client.stop().error, DaemonError::DaemonUnavailable);
  EXPECT_EQ(daemon.state, "stop");
}

TEST_F(MPDClientTest, MissingPasswordIsDaemonUnavailable) {
  daemon.password = "secret";
  MPDClient client(daemon, playlist, "mpd.local");
  DaemonStatus status = client.pollStatus();
  EXPECT_EQ(status.state, PlaybackState::Error);
  EXPECT_EQ(status.error, DaemonError::DaemonUnavailable);
}

TEST_F(MPDClientTest, RefusedPlayIsStreamError) {
  daemon.failing["play"] = 50;
  MPDClient client(daemon, playlist, "mpd.local");
  DaemonResult result = client.selectAndPlay(0);
  EXPECT_EQ(result.error, DaemonError::StreamError);
  EXPECT_STREQ(result.message, "failed");
  EXPECT_EQ(client.getPlaysSent(), 0u);
  // An ACK leaves the connection usable
  EXPECT_TRUE(client.isReady());
}

TEST_F(MPDClientTest, StalledStatusReplyTimesOutAndReconnects) {
  daemon.stalling = "status";
  MPDClient client(daemon, playlist, "mpd.local", MPD_DEFAULT_PORT, nullptr, 1500);
  unsigned long start = daemon.clock;
  DaemonStatus status = client.pollStatus();
  EXPECT_EQ(status.state, PlaybackState::Error);
  EXPECT_EQ(status.error, DaemonError::Timeout);
  EXPECT_LE(daemon.clock - start, 1500u);
  EXPECT_FALSE(daemon.connected());
  EXPECT_FALSE(client.isReady());

  // The next request starts over on a new connection
  daemon.stalling.clear();
  EXPECT_EQ(client.pollStatus().state, PlaybackState::Stopped);
  EXPECT_EQ(daemon.connects, 2);
}

TEST_F(MPDClientTest, SlowRepliesShareOneTimeoutPerOperation) {
  // Every reply is within the timeout on its own, but not all of them together
  daemon.lineDelay = 1400;
  MPDClient client(daemon, playlist, "mpd.local", MPD_DEFAULT_PORT, nullptr, 1500);
  unsigned long start = daemon.clock;
  DaemonResult result = client.selectAndPlay(0);
  EXPECT_EQ(result.error, DaemonError::Timeout);
  EXPECT_LE(daemon.clock - start, 1500u);
  EXPECT_EQ(daemon.plays, 0);

  start = daemon.clock;
  DaemonStatus status = client.pollStatus();
  EXPECT_EQ(status.state, PlaybackState::Error);
  EXPECT_EQ(status.error, DaemonError::Timeout);
  EXPECT_LE(daemon.clock - start, 1500u);
}

TEST_F(MPDClientTest, SlowRepliesWithinTheTimeoutSucceed) {
  daemon.lineDelay = 400;
  MPDClient client(daemon, playlist, "mpd.local", MPD_DEFAULT_PORT, nullptr, 1500);
  unsigned long start = daemon.clock;
  EXPECT_TRUE(client.selectAndPlay(1).ok());
  EXPECT_EQ(daemon.plays, 1);
  EXPECT_LE(daemon.clock - start, 1500u);
}

TEST_F(MPDClientTest, PasswordReplyCountsAgainstTheTimeout) {
  daemon.password = "secret";
  // The greeting leaves too little time for the password reply
  daemon.lineDelay = 800;
  MPDClient client(daemon, playlist, "mpd.local", MPD_DEFAULT_PORT, "secret", 1500);
  unsigned long start = daemon.clock;
  DaemonResult result = client.stop();
  EXPECT_EQ(result.error, DaemonError::Timeout);
  EXPECT_LE(daemon.clock - start, 1500u);
  EXPECT_EQ(daemon.count("stop"), 0);
}

TEST_F(MPDClientTest, StaleConnectionIsReopenedOnce) {
  MPDClient client(daemon, playlist, "mpd.local");
  EXPECT_TRUE(client.setVolume(30).ok());
  daemon.closeOnNextWrite = true;
  EXPECT_TRUE(client.setVolume(60).ok());
  EXPECT_EQ(daemon.volume, 60);
  EXPECT_EQ(daemon.connects, 2);
}

TEST_F(MPDClientTest, ClosedFreshConnectionIsNotRetried) {
  MPDClient client(daemon, playlist, "mpd.local");
  daemon.closeOnNextWrite = true;
  DaemonResult result = client.stop();
  EXPECT_EQ(result.error, DaemonError::DaemonUnavailable);
  EXPECT_EQ(daemon.connects, 1);
}

TEST_F(MPDClientTest, SetVolumeClampsToRange) {
  MPDClient client(daemon, playlist, "mpd.local");
  EXPECT_TRUE(client.setVolume(150).ok());
  EXPECT_EQ(daemon.volume, 100);
  EXPECT_TRUE(client.setVolume(-5).ok());
  EXPECT_EQ(daemon.volume, 0);
}

TEST_F(MPDClientTest, StatusMapsDaemonStates) {
  MPDClient client(daemon, playlist, "mpd.local");
  DaemonStatus status = client.pollStatus();
  EXPECT_EQ(status.state, PlaybackState::Stopped);
  EXPECT_EQ(status.stationIndex, -1);
  EXPECT_EQ(status.volume, 40);

  daemon.state = "play";
  daemon.file = "http://jazz.example/stream";
  daemon.title = "Blue in Green";
  daemon.audio = false;
  status = client.pollStatus();
  EXPECT_EQ(status.state, PlaybackState::Buffering);
  EXPECT_EQ(status.stationIndex, 0);

  daemon.audio = true;
  status = client.pollStatus();
  EXPECT_EQ(status.state, PlaybackState::Playing);
  EXPECT_STREQ(status.title, "Blue in Green");
  EXPECT_STREQ(status.uri, "http://jazz.example/stream");

  daemon.error = "Failed to decode";
  status = client.pollStatus();
  EXPECT_EQ(status.state, PlaybackState::Error);
  EXPECT_EQ(status.error, DaemonError::StreamError);
}

TEST_F(MPDClientTest, UnknownUriHasNoStation) {
  daemon.state = "play";
  daemon.file = "http://elsewhere.example/";
  MPDClient client(daemon, playlist, "mpd.local");
  DaemonStatus status = client.pollStatus();
  EXPECT_EQ(status.state, PlaybackState::Playing);
  EXPECT_EQ(status.stationIndex, -1);
}

TEST_F(MPDClientTest, ExecuteDispatchesByKind) {
  MPDClient client(daemon, playlist, "mpd.local");
  Command command = Command();
  command.kind = CommandKind::SelectAndPlay;
  command.stationIndex = 1;
  EXPECT_TRUE(client.execute(command).ok());
  command.kind = CommandKind::SetVolume;
  command.volume = 70;
  EXPECT_TRUE(client.execute(command).ok());
  command.kind = CommandKind::Stop;
  EXPECT_TRUE(client.execute(command).ok());
  EXPECT_EQ(daemon.state, "stop");
  EXPECT_EQ(daemon.volume, 70);
}

TEST(MPDProtocolTest, QuoteArgumentEscapes) {
  char buffer[32];
  ASSERT_TRUE(MPDClient::quoteArgument("a\"b\\c", buffer, sizeof(buffer)));
  EXPECT_STREQ(buffer, "\"a\\\"b\\\\c\"");
  ASSERT_TRUE(MPDClient::quoteArgument("", buffer, sizeof(buffer)));
  EXPECT_STREQ(buffer, "\"\"");
  EXPECT_FALSE(MPDClient::quoteArgument("0123456789", buffer, 8));
}

TEST(MPDProtocolTest, ClassifyAckCodes) {
  char message[RESULT_MESSAGE_SIZE];
  EXPECT_EQ(MPDClient::classifyAck("ACK [3@0] {password} incorrect password", message),
            DaemonError::DaemonUnavailable);
  EXPECT_STREQ(message, "incorrect password");
  EXPECT_EQ(MPDClient::classifyAck("ACK [4@0] {play} you don't have permission", message),
            DaemonError::DaemonUnavailable);
  EXPECT_EQ(MPDClient::classifyAck("ACK [50@2] {play} No such song", message),
            DaemonError::StreamError);
  EXPECT_STREQ(message, "No such song");
  EXPECT_EQ(MPDClient::classifyAck("ACK garbage", message), DaemonError::StreamError);
}
