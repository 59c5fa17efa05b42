#pragma once

#include <string>

namespace sea {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Apply a single key/value pair. Returns false for unknown keys.
  bool set(const std::string& key, const std::string& value);

  // --- Logging ---
  std::string logLevel = "info";   // trace|debug|info|warn|error
  bool        logJson  = false;    // JSON lines instead of text
  std::string logFile;             // empty -> stdout

  // --- Persistence ---
  std::string persistKeyPrefix = "sea_";  // default medium key is prefix + store id

  // --- Actions ---
  bool        trackLoading  = true;       // async actions toggle "<name><suffix>"
  std::string loadingSuffix = "Loading";

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static bool parseBool(const std::string& v, bool fallback);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace sea
