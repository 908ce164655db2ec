#pragma once

#include <string>

namespace core {

class PathUtils {
public:
  // Returns the directory where the currently-running executable is located.
  static std::string getExecutableDir();

  // STREAMGRID_SETTINGS wins, then `requested` if it exists, then the same
  // file name next to the executable. Falls back to `requested`.
  static std::string resolveSettingsPath(const std::string &requested);

  // Platform detection utilities
  static bool isWSLEnvironment();
};

} // namespace core
