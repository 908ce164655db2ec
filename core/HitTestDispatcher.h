#pragma once
#include "GridCompositor.h"
#include "RenderLoop.h"
#include <opencv2/core.hpp>
#include <optional>

class StreamManager;

// Where a canvas of size `canvas` lands when shown aspect-fit and centred in
// a widget of size `widget`.
cv::Rect letterboxRect(const cv::Size &widget, const cv::Size &canvas);

// Widget point -> canvas point; nullopt inside the letterbox bars.
std::optional<cv::Point> mapToCanvas(const cv::Point &widgetPt,
                                     const cv::Size &widget,
                                     const cv::Size &canvas);

class HitTestDispatcher {
public:
  explicit HitTestDispatcher(StreamManager &streams);

  // First index, in stream order, whose control rectangle contains `pt`.
  static std::optional<size_t> controlAt(const GridGeometry &geometry,
                                         const cv::Point &pt);
  static std::optional<size_t> tileAt(const GridGeometry &geometry,
                                      const cv::Point &pt);

  // Toggles audio of the stream whose control was clicked. Returns the index
  // toggled, nullopt when the click hit no control.
  std::optional<size_t> dispatchClick(const RenderContext &ctx,
                                      const cv::Point &canvasPt);

private:
  StreamManager &streams_;
};
