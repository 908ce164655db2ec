#include "StreamList.h"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n\f\v";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos)
    return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

std::string defaultLabel(size_t index) {
  return "Cam " + std::to_string(index + 1);
}

bool endsWith(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<StreamIdentity> parseStreamList(const std::string &text) {
  std::vector<StreamIdentity> streams;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    std::string uri = trim(line);
    if (uri.empty() || uri[0] == '#')
      continue;
    streams.push_back({defaultLabel(streams.size()), uri, std::nullopt});
  }
  return streams;
}

std::vector<StreamIdentity> parseStreamListJson(const std::string &text) {
  std::vector<StreamIdentity> streams;
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[StreamList] Failed to parse stream list: " << e.what()
              << std::endl;
    return streams;
  }

  if (!j.is_object() || !j.contains("streams") || !j["streams"].is_array()) {
    std::cerr << "[StreamList] Expected an object with a 'streams' array"
              << std::endl;
    return streams;
  }

  for (const auto &entry : j["streams"]) {
    if (!entry.is_object())
      continue;
    std::string uri = trim(entry.value("uri", std::string()));
    if (uri.empty()) {
      std::cerr << "[StreamList] Skipping entry without uri" << std::endl;
      continue;
    }
    std::string name = trim(entry.value("name", std::string()));
    StreamIdentity id{name.empty() ? defaultLabel(streams.size()) : name, uri,
                      std::nullopt};
    if (entry.contains("audio") && entry["audio"].is_boolean())
      id.audio = entry["audio"].get<bool>();
    streams.push_back(std::move(id));
  }
  return streams;
}

std::vector<StreamIdentity> loadStreamList(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    std::cerr << "[StreamList] File not found: " << path << std::endl;
    return {};
  }
  std::stringstream buffer;
  buffer << f.rdbuf();

  auto streams = endsWith(path, ".json") ? parseStreamListJson(buffer.str())
                                         : parseStreamList(buffer.str());
  std::cout << "[StreamList] " << streams.size() << " stream(s) in " << path
            << std::endl;
  return streams;
}
