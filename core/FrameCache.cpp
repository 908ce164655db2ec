#include "FrameCache.h"
#include <utility>

void FrameCache::store(const cv::Mat &frame) {
  if (frame.empty())
    return;

  // Copy outside the lock, swap under it; the old buffer is freed after.
  cv::Mat copy = frame.clone();
  {
    std::lock_guard<std::mutex> lock(mtx_);
    std::swap(frame_, copy);
    ++generation_;
  }
}

std::optional<cv::Mat> FrameCache::load() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (frame_.empty())
    return std::nullopt;
  return frame_.clone();
}

bool FrameCache::empty() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return frame_.empty();
}

uint64_t FrameCache::generation() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return generation_;
}
