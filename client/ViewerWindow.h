#pragma once

#include "GridCompositor.h"
#include "HitTestDispatcher.h"
#include "RenderLoop.h"
#include "Settings.h"
#include <QMainWindow>
#include <QTimer>

class GridSurface;
class StreamManager;

// Render/input loop: polls every stream on a QTimer, composes the grid,
// shows it, and routes clicks to the hit-test dispatcher.
class ViewerWindow : public QMainWindow {
  Q_OBJECT

public:
  ViewerWindow(StreamManager &streams, const Settings &settings,
               QWidget *parent = nullptr);
  ~ViewerWindow();

public slots:
  void toggleFullscreen();

protected:
  void keyPressEvent(QKeyEvent *event) override;

private slots:
  void renderTick();
  void onSurfaceClicked(const QPoint &widgetPos);
  void refreshTitle();

private:
  int render(); // returns the delay before the next pass

  StreamManager &streams_;
  GridCompositor compositor_;
  HitTestDispatcher dispatcher_;
  RenderContext ctx_;

  GridSurface *surface_ = nullptr;
  QTimer *renderTimer_ = nullptr;
  QTimer *statusTimer_ = nullptr;
  RenderTiming timing_;
  bool idle_ = false;
};
