#pragma once
#include "GridCompositor.h"
#include <cstdint>
#include <opencv2/core.hpp>
#include <vector>

// Render-loop state handed explicitly to the compositor caller and the
// dispatcher. `geometry` is the one that belongs to the image on screen.
struct RenderContext {
  cv::Size canvas;
  GridLayout layout;
  GridGeometry geometry;
  uint64_t renderedFrames = 0;
};

struct RenderTiming {
  int renderIntervalMs = 33;
  int idleBackoffMs = 500;
};

struct RenderStep {
  bool rendered = false;
  cv::Mat image; // composed BGR canvas; empty when nothing was rendered
  int nextDelayMs = 0;
};

// One pass of the render loop. With no frame from any stream the compositor
// is skipped, `ctx` is left as it was and the loop backs off; otherwise the
// grid is composed, `ctx` takes its layout and geometry, and the next pass
// comes after the regular interval.
RenderStep renderStep(const GridCompositor &compositor,
                      const std::vector<TileInput> &tiles,
                      const RenderTiming &timing, RenderContext &ctx);
