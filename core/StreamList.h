#pragma once
#include <optional>
#include <string>
#include <vector>

struct StreamIdentity {
  std::string label;
  std::string uri;
  // Forces the audio capability on or off; unset means "probe if enabled".
  std::optional<bool> audio;
};

// Plain text: one URI per line, whitespace trimmed, blank lines and lines
// starting with '#' skipped. Labels are "Cam <n>" in list order.
std::vector<StreamIdentity> parseStreamList(const std::string &text);

// JSON: {"streams": [{"name": "...", "uri": "...", "audio": true}, ...]}
// Entries without a uri are skipped; a missing name becomes "Cam <n>".
std::vector<StreamIdentity> parseStreamListJson(const std::string &text);

// Loads either format (by .json extension). A missing or unreadable file is
// reported and yields an empty list.
std::vector<StreamIdentity> loadStreamList(const std::string &path);
