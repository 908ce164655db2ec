#include "GridSurface.h"
#include "HitTestDispatcher.h"

GridSurface::GridSurface(QWidget *parent) : QWidget(parent) {
  setAttribute(Qt::WA_OpaquePaintEvent);
  setAutoFillBackground(false);
}

void GridSurface::setFrame(const QImage &img) {
  {
    QMutexLocker lock(&mtx_);
    frame_ = img;
  }
  update();
}

void GridSurface::paintEvent(QPaintEvent *) {
  QImage img;
  {
    QMutexLocker lock(&mtx_);
    img = frame_;
  }
  QPainter p(this);
  p.fillRect(rect(), Qt::black);
  if (img.isNull())
    return;

  // Same letterbox as the click mapping, so clicks land where they appear.
  const cv::Rect r = letterboxRect(cv::Size(width(), height()),
                                   cv::Size(img.width(), img.height()));
  p.setRenderHint(QPainter::SmoothPixmapTransform);
  p.drawImage(QRect(r.x, r.y, r.width, r.height), img);
}

void GridSurface::mousePressEvent(QMouseEvent *e) {
  if (e->button() == Qt::LeftButton)
    emit clicked(e->pos());
  QWidget::mousePressEvent(e);
}
