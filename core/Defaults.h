// SettingsDefaults
#pragma once

#include "Types.h"
#include <string>

struct SettingsDefaults {
  IntSize window_size_{1920, 1080};
  bool fullscreen_ = false;
  bool overlay_ = false;
  bool audio_controls_ = true;
  bool probe_audio_ = true;
  std::string stream_file_ = "streams.txt";

  // Reconnect backoff (ms): base * 2^(failures-1), capped at max
  int reconnect_delay_ms_ = 1000;
  int reconnect_max_delay_ms_ = 16000;

  int open_timeout_ms_ = 5000;
  int read_timeout_ms_ = 5000;
  int rtsp_latency_ms_ = 150;

  // Render loop
  int idle_backoff_ms_ = 500;
  int render_interval_ms_ = 33;
};
