#include "ClientSettings.h"
#include "PathUtils.h"
#include "Settings.h"
#include "StreamList.h"
#include "StreamManager.h"
#include "ViewerWindow.h"
#include <QApplication>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>
#include <gst/gst.h>
#include <iostream>

int main(int argc, char *argv[]) {
  // Parse before QApplication so "no streams" exits without needing a display.
  QStringList args;
  for (int i = 0; i < argc; ++i)
    args << QString::fromLocal8Bit(argv[i]);

  QCommandLineParser parser;
  parser.setApplicationDescription("Multi RTSP Stream Viewer");
  parser.addHelpOption();
  QCommandLineOption fileOpt("file", "Text file with RTSP stream URLs.",
                             "path");
  QCommandLineOption settingsOpt("settings", "Settings JSON file.", "path",
                                 ClientSettings::kSettingsFile);
  QCommandLineOption fullscreenOpt("fullscreen", "Start in fullscreen.");
  QCommandLineOption overlayOpt("overlay", "Overlay stream info on each feed.");
  QCommandLineOption sizeOpt("window-size",
                             "Window resolution (e.g. 1280x720).", "WxH");
  QCommandLineOption noAudioOpt("no-audio-controls",
                                "Do not draw or probe audio controls.");
  parser.addOptions({fileOpt, settingsOpt, fullscreenOpt, overlayOpt, sizeOpt,
                     noAudioOpt});

  if (!parser.parse(args)) {
    std::cerr << parser.errorText().toStdString() << std::endl;
    return 1;
  }
  if (parser.isSet("help")) {
    std::cout << parser.helpText().toStdString();
    return 0;
  }

  Settings settings(core::PathUtils::resolveSettingsPath(
      parser.value(settingsOpt).toStdString()));

  if (parser.isSet(fileOpt))
    settings.set<std::string>("stream_file",
                              parser.value(fileOpt).toStdString());
  if (parser.isSet(fullscreenOpt))
    settings.set("fullscreen", true);
  if (parser.isSet(overlayOpt))
    settings.set("overlay", true);
  if (parser.isSet(noAudioOpt))
    settings.set("audio_controls", false);
  if (parser.isSet(sizeOpt)) {
    IntSize sz;
    const std::string text = parser.value(sizeOpt).toStdString();
    if (!Settings::parseSize(text, sz)) {
      std::cerr << "[Main] Invalid --window-size '" << text
                << "', expected WIDTHxHEIGHT" << std::endl;
      return 1;
    }
    settings.set<std::string>("window_size", text);
  }

  const auto streams = loadStreamList(settings.stream_file());
  if (streams.empty()) {
    std::cout << "No valid streams found." << std::endl;
    return 0;
  }
  std::cout << "Starting viewer with " << streams.size() << " streams."
            << std::endl;

  gst_init(&argc, &argv);
  std::cout << "[GST] gst_init done" << std::endl;

  QApplication app(argc, argv);
  std::cout << "[QT] QApplication created" << std::endl;

  StreamManager manager(settings);
  manager.addStreams(streams);

  const ReconnectPolicy policy = manager.reconnectPolicy();
  std::cout << "[Main] Reconnect backoff " << policy.baseDelayMs << "-"
            << policy.maxDelayMs << " ms, streams:";
  for (const auto &name : manager.getStreamNames())
    std::cout << " [" << name << "]";
  std::cout << std::endl;

  manager.startAll();

  ViewerWindow viewer(manager, settings);
  if (settings.fullscreen())
    viewer.showFullScreen();
  else
    viewer.show();
  std::cout << "[GUI] Viewer shown" << std::endl;

  QObject::connect(&app, &QCoreApplication::aboutToQuit, &viewer, [&]() {
    std::cout << "Shutting down..." << std::endl;
    manager.stopAll();
  });

  const int rc = app.exec();

  std::cout << "[QT] QApplication exited with " << rc << std::endl;
  return rc;
}
