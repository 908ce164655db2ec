#pragma once
#include <functional>
#include <memory>
#include <opencv2/core.hpp>
#include <string>

// Connection handle of one stream: opened, read frame by frame, released.
// Implementations must return from open() and read() within bounded time.
class FrameSource {
public:
  virtual ~FrameSource() = default;

  virtual bool open(const std::string &uri) = 0;
  virtual bool isOpened() const = 0;

  // Fills `frame` with the next decoded frame. False on error, timeout or
  // end of stream; the caller is expected to release() and reconnect.
  virtual bool read(cv::Mat &frame) = 0;

  virtual void release() = 0;
};

// Called with the stream label, used for log lines.
using FrameSourceFactory =
    std::function<std::unique_ptr<FrameSource>(const std::string &label)>;
