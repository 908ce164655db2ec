#pragma once
#include "AudioSink.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

// Lifecycle of one stream's audio playback handle, kept apart from video
// decoding so audio failures never touch the connection.
class AudioChannel {
public:
  AudioChannel(const std::string &label, const std::string &uri,
               std::unique_ptr<AudioSink> sink);
  ~AudioChannel();

  AudioChannel(const AudioChannel &) = delete;
  AudioChannel &operator=(const AudioChannel &) = delete;

  // Opens the handle and starts playback. Only valid while the stream is
  // connected; returns false (and logs) if playback could not start.
  bool enable();

  // Stops and releases the handle, including one whose playback already
  // failed. No-op without one.
  void disable();

  // Whether playback is running. Never waits on an enable/disable in
  // progress; reports the last known state instead.
  bool active() const;

private:
  std::string label_;
  std::string uri_;
  std::unique_ptr<AudioSink> sink_;
  mutable std::mutex mtx_;
  mutable std::atomic<bool> active_{false};
};
