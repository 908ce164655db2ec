#pragma once
#include "Defaults.h"
#include "Types.h"
#include <nlohmann/json.hpp>
#include <string>

// Read-only view over settings.json. Every getter falls back to
// SettingsDefaults when the key is missing or has the wrong type.
class Settings {
public:
  Settings();
  explicit Settings(const std::string &json_path);
  static Settings fromJson(nlohmann::json json);

  // Display
  IntSize window_size() const;
  bool fullscreen() const;
  bool overlay() const;
  bool audio_controls() const;

  // Streams
  std::string stream_file() const;
  bool probe_audio() const;

  // Connection
  int reconnect_delay_ms() const;
  int reconnect_max_delay_ms() const;
  int open_timeout_ms() const;
  int read_timeout_ms() const;
  int rtsp_latency_ms() const;

  // Render loop
  int idle_backoff_ms() const;
  int render_interval_ms() const;

  // In-memory override (command line). Never written back to disk.
  template <typename T> void set(const std::string &key, const T &value);

  const std::string &path() const { return json_path_; }

  // Parses "WIDTHxHEIGHT" (case-insensitive x). Both sides must be > 0.
  static bool parseSize(const std::string &text, IntSize &out);

private:
  void reload();
  template <typename T>
  T value(const char *key, const T &fallback) const;

  std::string json_path_;
  SettingsDefaults defaults_;
  nlohmann::json json_;
};
