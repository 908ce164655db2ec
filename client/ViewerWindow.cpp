#include "ViewerWindow.h"
#include "ClientSettings.h"
#include "GridSurface.h"
#include "StreamManager.h"
#include <QKeyEvent>
#include <QString>
#include <iostream>
#include <opencv2/imgproc.hpp>

namespace {

CompositorOptions compositorOptions(const Settings &settings) {
  CompositorOptions o;
  o.overlay = settings.overlay();
  o.audioControls = settings.audio_controls();
  return o;
}

cv::Size canvasSize(const Settings &settings) {
  const IntSize sz = settings.window_size();
  return cv::Size(sz.width, sz.height);
}

} // namespace

ViewerWindow::ViewerWindow(StreamManager &streams, const Settings &settings,
                           QWidget *parent)
    : QMainWindow(parent), streams_(streams),
      compositor_(canvasSize(settings), compositorOptions(settings)),
      dispatcher_(streams) {
  timing_.renderIntervalMs = settings.render_interval_ms();
  timing_.idleBackoffMs = settings.idle_backoff_ms();

  setWindowTitle(ClientSettings::WINDOW_TITLE);
  setMinimumSize(ClientSettings::VIEWER_MIN_WIDTH,
                 ClientSettings::VIEWER_MIN_HEIGHT);
  const IntSize sz = settings.window_size();
  resize(sz.width, sz.height);

  ctx_.canvas = compositor_.canvas();

  surface_ = new GridSurface(this);
  setCentralWidget(surface_);
  connect(surface_, &GridSurface::clicked, this,
          &ViewerWindow::onSurfaceClicked);

  renderTimer_ = new QTimer(this);
  renderTimer_->setSingleShot(true);
  connect(renderTimer_, &QTimer::timeout, this, &ViewerWindow::renderTick);
  renderTimer_->start(0);

  statusTimer_ = new QTimer(this);
  statusTimer_->setInterval(ClientSettings::STATUS_REFRESH_MS);
  connect(statusTimer_, &QTimer::timeout, this, &ViewerWindow::refreshTitle);
  statusTimer_->start();
}

ViewerWindow::~ViewerWindow() {
  renderTimer_->stop();
  statusTimer_->stop();
}

void ViewerWindow::renderTick() { renderTimer_->start(render()); }

int ViewerWindow::render() {
  RenderStep step =
      renderStep(compositor_, streams_.collectTiles(), timing_, ctx_);
  if (!step.rendered) {
    if (!idle_)
      std::cout << "[Viewer] No frames yet, waiting..." << std::endl;
    idle_ = true;
    return step.nextDelayMs;
  }
  if (idle_ || ctx_.renderedFrames == 1)
    std::cout << "[Viewer] Rendering (frame " << ctx_.renderedFrames << ")"
              << std::endl;
  idle_ = false;

  cv::Mat rgb;
  cv::cvtColor(step.image, rgb, cv::COLOR_BGR2RGB);
  QImage img(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step),
             QImage::Format_RGB888);
  surface_->setFrame(img.copy());
  return step.nextDelayMs;
}

void ViewerWindow::onSurfaceClicked(const QPoint &widgetPos) {
  auto pt = mapToCanvas(cv::Point(widgetPos.x(), widgetPos.y()),
                        cv::Size(surface_->width(), surface_->height()),
                        ctx_.canvas);
  if (!pt)
    return;

  if (dispatcher_.dispatchClick(ctx_, *pt)) {
    // Redraw right away so the glyph follows the click.
    render();
  }
}

void ViewerWindow::refreshTitle() {
  size_t streaming = 0;
  size_t audible = 0;
  for (size_t i = 0; i < streams_.size(); ++i) {
    const StreamStatus st = streams_.getStream(i)->status();
    if (st.state == ConnectionState::Streaming)
      ++streaming;
    if (st.audioActive)
      ++audible;
  }
  QString title = QString("%1 - %2/%3 streaming")
                      .arg(ClientSettings::WINDOW_TITLE)
                      .arg(streaming)
                      .arg(streams_.size());
  if (audible > 0)
    title += QString(", %1 with audio").arg(audible);
  setWindowTitle(title);
}

void ViewerWindow::toggleFullscreen() {
  if (isFullScreen()) {
    showNormal();
  } else {
    showFullScreen();
  }
}

void ViewerWindow::keyPressEvent(QKeyEvent *event) {
  switch (event->key()) {
  case ClientSettings::VIEWER_FULLSCREEN_KEY:
    toggleFullscreen();
    break;

  case ClientSettings::VIEWER_QUIT_KEY:
    close();
    break;

  default:
    QMainWindow::keyPressEvent(event);
    break;
  }
}
