#include "RenderLoop.h"

RenderStep renderStep(const GridCompositor &compositor,
                      const std::vector<TileInput> &tiles,
                      const RenderTiming &timing, RenderContext &ctx) {
  RenderStep step;
  if (!hasAnyFrame(tiles)) {
    step.nextDelayMs = timing.idleBackoffMs;
    return step;
  }

  Composition c = compositor.compose(tiles);
  ctx.canvas = compositor.canvas();
  ctx.layout = c.layout;
  ctx.geometry = std::move(c.geometry);
  ++ctx.renderedFrames;

  step.rendered = true;
  step.image = std::move(c.image);
  step.nextDelayMs = timing.renderIntervalMs;
  return step;
}
