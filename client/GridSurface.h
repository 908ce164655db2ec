// GridSurface.h
#pragma once
#include <QImage>
#include <QMouseEvent>
#include <QMutex>
#include <QPainter>
#include <QWidget>

// Paints the composed grid aspect-fit and centred, and reports left clicks
// in widget coordinates.
class GridSurface : public QWidget {
  Q_OBJECT
public:
  explicit GridSurface(QWidget *parent = nullptr);

public slots:
  void setFrame(const QImage &img);

signals:
  void clicked(const QPoint &widgetPos);

protected:
  void paintEvent(QPaintEvent *) override;
  void mousePressEvent(QMouseEvent *e) override;

private:
  QImage frame_;
  QMutex mtx_;
};
