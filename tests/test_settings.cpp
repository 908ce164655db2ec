// Settings: defaults, file values, type errors and command-line overrides

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

#include "Settings.h"

namespace {

TEST(SettingsTest, DefaultsWithoutFile) {
  Settings s(::testing::TempDir() + "missing_settings.json");
  SettingsDefaults d;
  EXPECT_EQ(s.window_size().width, d.window_size_.width);
  EXPECT_EQ(s.window_size().height, d.window_size_.height);
  EXPECT_FALSE(s.fullscreen());
  EXPECT_FALSE(s.overlay());
  EXPECT_TRUE(s.audio_controls());
  EXPECT_TRUE(s.probe_audio());
  EXPECT_EQ(s.stream_file(), "streams.txt");
  EXPECT_EQ(s.reconnect_delay_ms(), 1000);
  EXPECT_EQ(s.reconnect_max_delay_ms(), 16000);
  EXPECT_EQ(s.idle_backoff_ms(), 500);
}

TEST(SettingsTest, ReadsValuesFromFile) {
  const std::string path = ::testing::TempDir() + "settings_test.json";
  std::ofstream(path) << R"({
    "window_size": [1280, 720],
    "overlay": true,
    "stream_file": "cams.json",
    "reconnect_delay_ms": 250,
    "rtsp_latency_ms": 300
  })";

  Settings s(path);
  EXPECT_EQ(s.window_size().width, 1280);
  EXPECT_EQ(s.window_size().height, 720);
  EXPECT_TRUE(s.overlay());
  EXPECT_EQ(s.stream_file(), "cams.json");
  EXPECT_EQ(s.reconnect_delay_ms(), 250);
  EXPECT_EQ(s.rtsp_latency_ms(), 300);
  EXPECT_EQ(s.path(), path);
  std::remove(path.c_str());
}

TEST(SettingsTest, BrokenFileFallsBackToDefaults) {
  const std::string path = ::testing::TempDir() + "settings_broken.json";
  std::ofstream(path) << "{ \"overlay\": tru";
  Settings s(path);
  EXPECT_FALSE(s.overlay());
  EXPECT_EQ(s.reconnect_delay_ms(), 1000);
  std::remove(path.c_str());
}

TEST(SettingsTest, WrongTypeFallsBackPerKey) {
  Settings s = Settings::fromJson({{"overlay", "yes"}, {"reconnect_delay_ms", 42}});
  EXPECT_FALSE(s.overlay());
  EXPECT_EQ(s.reconnect_delay_ms(), 42);
}

TEST(SettingsTest, WindowSizeAcceptsString) {
  Settings s = Settings::fromJson({{"window_size", "800x600"}});
  EXPECT_EQ(s.window_size().width, 800);
  EXPECT_EQ(s.window_size().height, 600);

  Settings bad = Settings::fromJson({{"window_size", "800"}});
  EXPECT_EQ(bad.window_size().width, 1920);
}

TEST(SettingsTest, ParseSize) {
  IntSize sz;
  EXPECT_TRUE(Settings::parseSize("1920x1080", sz));
  EXPECT_EQ(sz.width, 1920);
  EXPECT_EQ(sz.height, 1080);
  EXPECT_TRUE(Settings::parseSize("640X480", sz));
  EXPECT_EQ(sz.width, 640);

  EXPECT_FALSE(Settings::parseSize("", sz));
  EXPECT_FALSE(Settings::parseSize("x480", sz));
  EXPECT_FALSE(Settings::parseSize("640x", sz));
  EXPECT_FALSE(Settings::parseSize("0x480", sz));
  EXPECT_FALSE(Settings::parseSize("-640x480", sz));
  EXPECT_FALSE(Settings::parseSize("640*480", sz));
  EXPECT_EQ(sz.width, 640);
  EXPECT_EQ(sz.height, 480);
}

TEST(SettingsTest, MaxDelayNeverBelowBase) {
  Settings s = Settings::fromJson(
      {{"reconnect_delay_ms", 3000}, {"reconnect_max_delay_ms", 500}});
  EXPECT_EQ(s.reconnect_max_delay_ms(), 3000);
}

TEST(SettingsTest, SetOverridesInMemoryOnly) {
  const std::string path = ::testing::TempDir() + "settings_set.json";
  std::ofstream(path) << R"({"fullscreen": false})";

  Settings s(path);
  s.set("fullscreen", true);
  s.set("stream_file", std::string("other.txt"));
  s.set("render_interval_ms", 16);
  EXPECT_TRUE(s.fullscreen());
  EXPECT_EQ(s.stream_file(), "other.txt");
  EXPECT_EQ(s.render_interval_ms(), 16);

  Settings reread(path);
  EXPECT_FALSE(reread.fullscreen());
  std::remove(path.c_str());
}

} // namespace
