#include "GridCompositor.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <opencv2/imgproc.hpp>

GridLayout GridLayout::compute(size_t count, const cv::Size &canvas) {
  GridLayout l;
  if (count == 0)
    return l;

  const int n = static_cast<int>(count);
  int rows = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(n))));
  // Guard against sqrt rounding on perfect squares.
  while (rows * rows < n)
    ++rows;
  while (rows > 1 && (rows - 1) * (rows - 1) >= n)
    --rows;

  l.rows = rows;
  l.cols = (n + rows - 1) / rows;
  l.cellWidth = canvas.width / l.cols;
  l.cellHeight = canvas.height / l.rows;
  return l;
}

cv::Rect GridLayout::cellRect(size_t index) const {
  if (cols <= 0)
    return cv::Rect();
  const int row = static_cast<int>(index) / cols;
  const int col = static_cast<int>(index) % cols;
  return cv::Rect(col * cellWidth, row * cellHeight, cellWidth, cellHeight);
}

bool hasAnyFrame(const std::vector<TileInput> &tiles) {
  return std::any_of(tiles.begin(), tiles.end(),
                     [](const TileInput &t) { return t.frame.has_value(); });
}

GridCompositor::GridCompositor(const cv::Size &canvas, CompositorOptions opts)
    : canvas_(canvas), opts_(opts) {}

std::optional<cv::Rect>
GridCompositor::controlRectFor(const cv::Rect &tile) const {
  const int size = opts_.controlSize;
  const int margin = opts_.controlMargin;
  if (size <= 0 || tile.width < size + 2 * margin ||
      tile.height < size + 2 * margin)
    return std::nullopt;
  return cv::Rect(tile.x + tile.width - margin - size, tile.y + margin, size,
                  size);
}

Composition GridCompositor::compose(const std::vector<TileInput> &tiles) const {
  Composition out;
  out.image = cv::Mat::zeros(canvas_, CV_8UC3);
  out.layout = GridLayout::compute(tiles.size(), canvas_);
  out.geometry.assign(tiles.size(), std::nullopt);

  if (out.layout.cellWidth <= 0 || out.layout.cellHeight <= 0)
    return out;

  const cv::Size cellSize(out.layout.cellWidth, out.layout.cellHeight);

  for (size_t i = 0; i < tiles.size(); ++i) {
    const TileInput &t = tiles[i];
    if (!t.frame || t.frame->empty())
      continue;

    const cv::Rect cell = out.layout.cellRect(i);
    cv::Mat roi = out.image(cell);

    if (t.frame->type() != CV_8UC3) {
      std::cerr << "[GridCompositor] " << t.label
                << " frame is not 8-bit BGR, skipped" << std::endl;
      continue;
    }
    try {
      cv::Mat resized;
      cv::resize(*t.frame, resized, cellSize, 0, 0, cv::INTER_AREA);
      resized.copyTo(roi);
    } catch (const cv::Exception &e) {
      std::cerr << "[GridCompositor] " << t.label
                << " resize failed: " << e.what() << std::endl;
      continue;
    }

    if (opts_.overlay)
      drawLabel(roi, t.label);

    TileGeometry g{cell, std::nullopt};
    if (opts_.audioControls && t.audioCapable) {
      g.control = controlRectFor(cell);
      if (g.control) {
        cv::Rect local(g.control->x - cell.x, g.control->y - cell.y,
                       g.control->width, g.control->height);
        drawAudioControl(roi, local, t.audioOn);
      }
    }
    out.geometry[i] = g;
  }
  return out;
}

void GridCompositor::drawLabel(cv::Mat &cell, const std::string &label) const {
  cv::putText(cell, label, opts_.labelOffset, cv::FONT_HERSHEY_SIMPLEX,
              opts_.labelScale, opts_.labelColor, opts_.labelThickness);
}

void GridCompositor::drawAudioControl(cv::Mat &cell, const cv::Rect &box,
                                      bool on) const {
  const cv::Scalar bg(40, 40, 40);
  const cv::Scalar fg(255, 255, 255);
  const cv::Scalar onColor(0, 200, 0);
  const cv::Scalar offColor(0, 0, 230);

  cv::rectangle(cell, box, bg, cv::FILLED);
  cv::rectangle(cell, box, on ? onColor : fg, 1);

  const int x = box.x;
  const int y = box.y;
  const int w = box.width;
  const int h = box.height;

  // Speaker: body + cone
  cv::rectangle(cell, cv::Point(x + w * 2 / 10, y + h * 4 / 10),
                cv::Point(x + w * 4 / 10, y + h * 6 / 10), fg, cv::FILLED);
  const cv::Point cone[] = {{x + w * 4 / 10, y + h * 4 / 10},
                            {x + w * 6 / 10, y + h * 2 / 10},
                            {x + w * 6 / 10, y + h * 8 / 10},
                            {x + w * 4 / 10, y + h * 6 / 10}};
  cv::fillConvexPoly(cell, cone, 4, fg);

  if (on) {
    const cv::Point c(x + w * 6 / 10, y + h / 2);
    cv::ellipse(cell, c, cv::Size(w / 6, h / 6), 0, -45, 45, onColor, 2);
    cv::ellipse(cell, c, cv::Size(w * 3 / 10, h * 3 / 10), 0, -45, 45,
                onColor, 2);
  } else {
    cv::line(cell, cv::Point(x + w * 7 / 10, y + h * 35 / 100),
             cv::Point(x + w * 9 / 10, y + h * 65 / 100), offColor, 2);
    cv::line(cell, cv::Point(x + w * 9 / 10, y + h * 35 / 100),
             cv::Point(x + w * 7 / 10, y + h * 65 / 100), offColor, 2);
  }
}
