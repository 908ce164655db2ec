#pragma once
#include <cstdint>
#include <mutex>
#include <opencv2/core.hpp>
#include <optional>

// Single-slot holder of the latest decoded frame of one stream.
// Written by the stream thread, read by the render loop. The lock is only
// held for the swap (store) or the copy (load), never across I/O.
class FrameCache {
public:
  // Deep-copies `frame` and replaces the cached one. Empty frames are ignored.
  void store(const cv::Mat &frame);

  // Copy of the cached frame, or nullopt if nothing was ever stored.
  std::optional<cv::Mat> load() const;

  bool empty() const;

  // Number of successful stores since construction.
  uint64_t generation() const;

private:
  mutable std::mutex mtx_;
  cv::Mat frame_;
  uint64_t generation_ = 0;
};
