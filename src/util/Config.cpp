#include "sea/util/Config.hpp"
#include "sea/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>

namespace sea {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::parseBool(const std::string& v, bool fallback) {
  std::string x = v;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "1" || x == "true" || x == "yes" || x == "on")  return true;
  if (x == "0" || x == "false" || x == "no" || x == "off") return false;
  return fallback;
}

bool Config::set(const std::string& key, const std::string& val) {
  if      (key == "logLevel")         logLevel         = val;
  else if (key == "logJson")          logJson          = parseBool(val, logJson);
  else if (key == "logFile")          logFile          = val;
  else if (key == "persistKeyPrefix") persistKeyPrefix = val;
  else if (key == "trackLoading")     trackLoading     = parseBool(val, trackLoading);
  else if (key == "loadingSuffix")    loadingSuffix    = val;
  else return false;
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // key=value per line, '#' or ';' start comments.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  while (true) {
    char tmp[1024];
    if (!std::fgets(tmp, sizeof(tmp), f)) break;
    line.assign(tmp);

    // Strip CR/LF
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;

    if (!set(key, val)) {
      logger().log(LogLevel::Debug, "Ignoring unknown config key", { {"key", key} });
    }
  }

  std::fclose(f);

  // An empty suffix would make the loading flag collide with the action name.
  if (loadingSuffix.empty()) loadingSuffix = "Loading";

  return true;
}

} // namespace util
} // namespace sea
