#include "sea/persist/FileStorage.hpp"
#include "sea/util/Logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace sea::persist {

namespace {

bool validKey(const std::string& key) {
  if (key.empty() || key == "." || key == "..") return false;
  for (char c : key) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_' || c == '-' || c == '.';
    if (!ok) return false;
  }
  return true;
}

std::runtime_error ioError(const std::string& what, const std::string& file) {
  return std::runtime_error(what + " '" + file + "': " + std::strerror(errno));
}

} // namespace

FileStorage::FileStorage(std::string dir) : dir_(std::move(dir)) {
  if (dir_.empty()) throw std::invalid_argument("FileStorage needs a directory");
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) throw std::runtime_error("cannot create storage directory '" + dir_ + "': " + ec.message());
}

std::string FileStorage::fileFor(const std::string& key) const {
  if (!validKey(key)) throw std::invalid_argument("invalid storage key '" + key + "'");
  return (std::filesystem::path(dir_) / (key + ".json")).string();
}

std::optional<std::string> FileStorage::get(const std::string& key) {
  const std::string file = fileFor(key);
  FILE* f = std::fopen(file.c_str(), "rb");
  if (!f) {
    if (errno == ENOENT) return std::nullopt;
    throw ioError("cannot open", file);
  }

  std::string out;
  char buf[4096];
  std::size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
  const bool failed = std::ferror(f) != 0;
  std::fclose(f);
  if (failed) throw ioError("cannot read", file);
  return out;
}

void FileStorage::set(const std::string& key, const std::string& value) {
  const std::string file = fileFor(key);
  const std::string tmp = file + ".tmp";

  FILE* f = std::fopen(tmp.c_str(), "wb");
  if (!f) throw ioError("cannot open", tmp);
  const bool wrote = std::fwrite(value.data(), 1, value.size(), f) == value.size();
  const bool closed = std::fclose(f) == 0;
  if (!wrote || !closed) {
    std::remove(tmp.c_str());
    throw ioError("cannot write", tmp);
  }

  if (std::rename(tmp.c_str(), file.c_str()) != 0) {
    std::remove(tmp.c_str());
    throw ioError("cannot replace", file);
  }

  util::logger().log(util::LogLevel::Trace, "Storage key written",
                     { {"key", key}, {"bytes", std::to_string(value.size())} });
}

} // namespace sea::persist
