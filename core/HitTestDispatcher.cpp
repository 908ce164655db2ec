#include "HitTestDispatcher.h"
#include "StreamManager.h"
#include <algorithm>
#include <iostream>

cv::Rect letterboxRect(const cv::Size &widget, const cv::Size &canvas) {
  if (widget.width <= 0 || widget.height <= 0 || canvas.width <= 0 ||
      canvas.height <= 0)
    return cv::Rect();

  int64_t w = widget.width;
  int64_t h = canvas.height * w / canvas.width;
  if (h > widget.height) {
    h = widget.height;
    w = canvas.width * h / canvas.height;
  }
  const int x = static_cast<int>((widget.width - w) / 2);
  const int y = static_cast<int>((widget.height - h) / 2);
  return cv::Rect(x, y, static_cast<int>(w), static_cast<int>(h));
}

std::optional<cv::Point> mapToCanvas(const cv::Point &widgetPt,
                                     const cv::Size &widget,
                                     const cv::Size &canvas) {
  const cv::Rect r = letterboxRect(widget, canvas);
  if (r.empty() || !r.contains(widgetPt))
    return std::nullopt;

  const int64_t cx = int64_t(widgetPt.x - r.x) * canvas.width / r.width;
  const int64_t cy = int64_t(widgetPt.y - r.y) * canvas.height / r.height;
  return cv::Point(std::min<int>(static_cast<int>(cx), canvas.width - 1),
                   std::min<int>(static_cast<int>(cy), canvas.height - 1));
}

HitTestDispatcher::HitTestDispatcher(StreamManager &streams)
    : streams_(streams) {}

std::optional<size_t> HitTestDispatcher::controlAt(const GridGeometry &geometry,
                                                   const cv::Point &pt) {
  for (size_t i = 0; i < geometry.size(); ++i) {
    const auto &g = geometry[i];
    if (g && g->control && g->control->contains(pt))
      return i;
  }
  return std::nullopt;
}

std::optional<size_t> HitTestDispatcher::tileAt(const GridGeometry &geometry,
                                                const cv::Point &pt) {
  for (size_t i = 0; i < geometry.size(); ++i) {
    const auto &g = geometry[i];
    if (g && g->tile.contains(pt))
      return i;
  }
  return std::nullopt;
}

std::optional<size_t>
HitTestDispatcher::dispatchClick(const RenderContext &ctx,
                                 const cv::Point &canvasPt) {
  auto index = controlAt(ctx.geometry, canvasPt);
  if (!index)
    return std::nullopt;

  // The geometry may be one render behind the worker list.
  if (!streams_.toggleAudio(*index)) {
    std::cout << "[HitTest] control " << *index
              << " has no audio stream behind it" << std::endl;
    return std::nullopt;
  }
  StreamWorker *s = streams_.getStream(*index);
  std::cout << "[HitTest] " << s->label() << " audio "
            << (s->audioOn() ? "on" : "off") << std::endl;
  return index;
}
