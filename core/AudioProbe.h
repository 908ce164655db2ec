#pragma once
#include <string>

struct AudioProbeResult {
  bool has_audio = false;
  std::string encoding;
  int channels = 0;
  int rate = 0;
  bool probed = false;
};

// RTSP: DESCRIBE through rtspsrc and look for an audio pad.
// Anything else: GstDiscoverer and look for audio stream info.
// Both are bounded by timeout_ms; on timeout `probed` stays false.
AudioProbeResult probeAudio(const std::string &uri, int timeout_ms = 1500);
