#include "sea/util/Logger.hpp"
#include "sea/util/Config.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace sea::util {

static thread_local std::map<std::string, std::string> t_ctx;

const char* toString(LogLevel l) {
  switch (l) { case LogLevel::Trace: return "TRACE";
               case LogLevel::Debug: return "DEBUG";
               case LogLevel::Info:  return "INFO";
               case LogLevel::Warn:  return "WARN";
               case LogLevel::Error: return "ERROR"; }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x = s;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "trace") return LogLevel::Trace;
  if (x == "debug") return LogLevel::Debug;
  if (x == "info")  return LogLevel::Info;
  if (x == "warn" || x == "warning") return LogLevel::Warn;
  if (x == "error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger L;
  return L;
}

void configureLogging(const Config& cfg) {
  auto& L = logger();
  L.setLevel(parseLevel(cfg.logLevel));
  L.setFormatJson(cfg.logJson);
  L.setFile(cfg.logFile);
}

Logger::Logger() {}

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = nullptr;
}

void Logger::setLevel(LogLevel lvl) {
  std::lock_guard<std::mutex> lk(mx_);
  lvl_ = lvl;
}

void Logger::setFormatJson(bool json) {
  std::lock_guard<std::mutex> lk(mx_);
  json_ = json;
}

void Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = path.empty() ? stdout : static_cast<void*>(std::fopen(path.c_str(), "a"));
  if (!file_) file_ = stdout;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lk(mx_);
  return lvl_;
}

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  writeLine(lvl, msg, fields);
}

static std::string nowIso() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm;
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

// Explicit fields win over thread context entries of the same name.
static bool overridden(const std::string& key, const std::vector<Field>& fields) {
  for (auto& f : fields) {
    if (f.k == key) return true;
  }
  return false;
}

void Logger::writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  std::lock_guard<std::mutex> lk(mx_);
  FILE* f = static_cast<FILE*>(file_ ? file_ : stdout);

  if (json_) {
    rapidjson::StringBuffer buf;
    rapidjson::Writer<rapidjson::StringBuffer> w(buf);
    const std::string ts = nowIso();
    w.StartObject();
    w.Key("ts");  w.String(ts.c_str(), static_cast<rapidjson::SizeType>(ts.size()));
    w.Key("lvl"); w.String(toString(lvl));
    w.Key("msg"); w.String(msg.c_str(), static_cast<rapidjson::SizeType>(msg.size()));
    for (auto& kv : t_ctx) {
      if (overridden(kv.first, fields)) continue;
      w.Key(kv.first.c_str(), static_cast<rapidjson::SizeType>(kv.first.size()));
      w.String(kv.second.c_str(), static_cast<rapidjson::SizeType>(kv.second.size()));
    }
    for (auto& kv : fields) {
      w.Key(kv.k.c_str(), static_cast<rapidjson::SizeType>(kv.k.size()));
      w.String(kv.v.c_str(), static_cast<rapidjson::SizeType>(kv.v.size()));
    }
    w.EndObject();
    std::fwrite(buf.GetString(), 1, buf.GetSize(), f);
    std::fputc('\n', f);
  } else {
    std::fprintf(f, "[%s] %-5s %s", nowIso().c_str(), toString(lvl), msg.c_str());
    for (auto& kv : t_ctx) {
      if (overridden(kv.first, fields)) continue;
      std::fprintf(f, " %s=%s", kv.first.c_str(), kv.second.c_str());
    }
    for (auto& kv : fields) std::fprintf(f, " %s=%s", kv.k.c_str(), kv.v.c_str());
    std::fputc('\n', f);
  }
  std::fflush(f);
}

Logger::Scoped::Scoped(const std::vector<Field>& add) {
  saved_.reserve(add.size());
  for (auto& kv : add) {
    auto it = t_ctx.find(kv.k);
    if (it == t_ctx.end()) {
      saved_.emplace_back(kv.k, std::nullopt);
    } else {
      saved_.emplace_back(kv.k, it->second);
    }
    t_ctx[kv.k] = kv.v;
  }
}

Logger::Scoped::~Scoped() {
  // restore in reverse so a key added twice in one scope ends up as before
  for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
    if (it->second) t_ctx[it->first] = *it->second;
    else t_ctx.erase(it->first);
  }
}

} // namespace sea::util
