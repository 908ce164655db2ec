#pragma once
#include "AudioSink.h"
#include <gst/gst.h>
#include <string>

// Audio-only playbin (video and subtitles disabled). Errors that arrive
// after start() are picked up from the bus by isPlaying(): they are logged
// and the sink then reports itself stopped.
class GstAudioSink : public AudioSink {
public:
  GstAudioSink(const std::string &label, int rtspLatencyMs, int timeoutMs);
  ~GstAudioSink() override;

  GstAudioSink(const GstAudioSink &) = delete;
  GstAudioSink &operator=(const GstAudioSink &) = delete;

  bool start(const std::string &uri) override;
  void stop() override;
  bool isPlaying() const override;

private:
  void drainBus() const;

  std::string label_;
  int rtspLatencyMs_;
  int timeoutMs_;
  GstElement *playbin_ = nullptr;
  GstBus *bus_ = nullptr;
  mutable bool failed_ = false;
};
