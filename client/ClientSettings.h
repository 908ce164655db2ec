#pragma once
#include <Qt>
// Some client default settings
namespace ClientSettings {

inline constexpr const char *WINDOW_TITLE = "Stream Viewer";

// Viewer keys
constexpr int VIEWER_FULLSCREEN_KEY = Qt::Key_F;
constexpr int VIEWER_QUIT_KEY = Qt::Key_Escape;

// Minimum on-screen window size; the canvas itself is window_size.
constexpr int VIEWER_MIN_WIDTH = 320;
constexpr int VIEWER_MIN_HEIGHT = 180;

// How often the title bar stream summary is refreshed
inline constexpr int STATUS_REFRESH_MS = 1000;

inline constexpr const char *kSettingsFile = "settings.json";
} // namespace ClientSettings
