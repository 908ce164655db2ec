#pragma once
#include <cstddef>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

// rows = ceil(sqrt(N)), cols = ceil(N / rows); cells are the canvas divided
// by cols/rows with integer division (the remainder stays unused).
struct GridLayout {
  int rows = 0;
  int cols = 0;
  int cellWidth = 0;
  int cellHeight = 0;

  static GridLayout compute(size_t count, const cv::Size &canvas);

  // Cell of stream `index`: row index / cols, column index % cols.
  cv::Rect cellRect(size_t index) const;
};

// Canvas coordinates. `control` lies inside `tile`.
struct TileGeometry {
  cv::Rect tile;
  std::optional<cv::Rect> control;
};

// One entry per stream, in stream order; nullopt where no frame was drawn.
using GridGeometry = std::vector<std::optional<TileGeometry>>;

struct TileInput {
  std::optional<cv::Mat> frame;
  std::string label;
  bool audioCapable = false;
  bool audioOn = false;
};

// True when at least one stream has a frame to draw.
bool hasAnyFrame(const std::vector<TileInput> &tiles);

struct Composition {
  cv::Mat image; // CV_8UC3, canvas size
  GridLayout layout;
  GridGeometry geometry;
};

struct CompositorOptions {
  bool overlay = false;      // draw stream labels
  bool audioControls = true; // draw the audio toggle on audio streams
  cv::Point labelOffset{10, 25};
  double labelScale = 0.8;
  cv::Scalar labelColor{0, 255, 0};
  int labelThickness = 2;
  int controlSize = 36;
  int controlMargin = 10; // from the cell's top-right corner
};

class GridCompositor {
public:
  explicit GridCompositor(const cv::Size &canvas,
                          CompositorOptions opts = CompositorOptions());

  // Tiles every available frame into a zero-filled canvas. The caller skips
  // this entirely when no frame is available.
  Composition compose(const std::vector<TileInput> &tiles) const;

  // Control rectangle for a tile, or nullopt when the tile is too small to
  // hold it.
  std::optional<cv::Rect> controlRectFor(const cv::Rect &tile) const;

  const cv::Size &canvas() const { return canvas_; }
  const CompositorOptions &options() const { return opts_; }

private:
  void drawLabel(cv::Mat &cell, const std::string &label) const;
  void drawAudioControl(cv::Mat &cell, const cv::Rect &box, bool on) const;

  cv::Size canvas_;
  CompositorOptions opts_;
};
