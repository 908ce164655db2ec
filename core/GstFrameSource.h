#pragma once
#include "FrameSource.h"
#include <gst/gst.h>
#include <string>

struct GstSourceOptions {
  int openTimeoutMs = 5000;
  int readTimeoutMs = 5000;
  int rtspLatencyMs = 150;
};

// uridecodebin -> videoconvert -> BGR appsink holding at most one buffer,
// so every read() returns the newest decoded frame.
class GstFrameSource : public FrameSource {
public:
  GstFrameSource(const std::string &label, const GstSourceOptions &opts);
  ~GstFrameSource() override;

  GstFrameSource(const GstFrameSource &) = delete;
  GstFrameSource &operator=(const GstFrameSource &) = delete;

  bool open(const std::string &uri) override;
  bool isOpened() const override { return pipeline_ != nullptr; }
  bool read(cv::Mat &frame) override;
  void release() override;

private:
  bool waitUntilPlaying();
  bool drainBus(); // false if an ERROR or EOS is pending

  std::string label_;
  GstSourceOptions opts_;

  GstElement *pipeline_ = nullptr;
  GstElement *appsink_ = nullptr;
  GstBus *bus_ = nullptr;
};
