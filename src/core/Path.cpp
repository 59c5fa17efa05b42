#include "sea/Path.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>

namespace sea::path {

std::vector<std::string> split(const std::string& path) {
  std::vector<std::string> out;
  std::string cur;
  cur.reserve(16);
  auto flush = [&]{ if (!cur.empty()) out.push_back(cur); cur.clear(); };
  for (char c : path) {
    if (c == '.' || c == '[' || c == ']') flush();
    else cur.push_back(c);
  }
  flush();
  return out;
}

std::string join(const std::vector<std::string>& segs, std::size_t count) {
  std::string out;
  const std::size_t n = count < segs.size() ? count : segs.size();
  for (std::size_t i = 0; i < n; ++i) {
    if (i) out.push_back('.');
    out += segs[i];
  }
  return out;
}

std::string normalize(const std::string& path) {
  return join(split(path));
}

std::string child(const std::string& parent, const std::string& key) {
  return parent.empty() ? key : parent + "." + key;
}

std::string topLevel(const std::string& path) {
  auto segs = split(path);
  return segs.empty() ? std::string{} : segs.front();
}

std::vector<std::string> prefixes(const std::string& path) {
  auto segs = split(path);
  std::vector<std::string> out;
  out.reserve(segs.size());
  std::string cur;
  for (auto& s : segs) {
    cur = child(cur, s);
    out.push_back(cur);
  }
  return out;
}

bool isIndex(const std::string& seg) {
  if (seg.empty()) return false;
  for (char c : seg) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

namespace {

constexpr std::size_t kMaxIndex =
    static_cast<std::size_t>(std::numeric_limits<rapidjson::SizeType>::max()) - 1;

// nullopt when the segment does not fit a RapidJSON array index.
std::optional<std::size_t> toIndex(const std::string& seg) {
  errno = 0;
  const unsigned long long v = std::strtoull(seg.c_str(), nullptr, 10);
  if (errno == ERANGE || v > kMaxIndex) return std::nullopt;
  return static_cast<std::size_t>(v);
}

} // namespace

const Value* find(const Value& root, const std::vector<std::string>& segs) {
  const Value* cur = &root;
  for (auto& s : segs) {
    if (cur->IsObject()) {
      cur = json::member(*cur, s);
      if (!cur) return nullptr;
    } else if (cur->IsArray()) {
      if (!isIndex(s)) return nullptr;
      auto idx = toIndex(s);
      if (!idx || *idx >= cur->Size()) return nullptr;
      cur = &(*cur)[static_cast<rapidjson::SizeType>(*idx)];
    } else {
      return nullptr;
    }
  }
  return cur;
}

const Value* find(const Value& root, const std::string& path) {
  return find(root, split(path));
}

Value& ensure(Value& root, const std::vector<std::string>& segs) {
  if (segs.empty()) throw std::invalid_argument("empty path");

  Value* cur = &root;
  for (std::size_t i = 0; i < segs.size(); ++i) {
    const std::string& s = segs[i];
    const bool last = (i + 1 == segs.size());

    if (!cur->IsObject() && !cur->IsArray()) {
      // Scalars along the way are replaced, same as a fresh intermediate.
      *cur = isIndex(s) ? json::array() : json::object();
    }

    Value* next = nullptr;
    if (cur->IsObject()) {
      Value name(rapidjson::StringRef(s.c_str(), static_cast<rapidjson::SizeType>(s.size())));
      auto it = cur->FindMember(name);
      if (it == cur->MemberEnd()) {
        json::setMember(*cur, s, Value());
        it = cur->FindMember(name);
      }
      next = &it->value;
    } else {
      if (!isIndex(s)) {
        throw std::invalid_argument("segment '" + s + "' addresses an array in path '" + join(segs) + "'");
      }
      auto idx = toIndex(s);
      if (!idx) {
        throw std::invalid_argument("index '" + s + "' out of range in path '" + join(segs) + "'");
      }
      if (*idx > cur->Size() + kMaxArrayPadding) {
        throw std::invalid_argument("index " + s + " is more than " + std::to_string(kMaxArrayPadding) +
                                    " past the end of the array in path '" + join(segs) + "'");
      }
      while (cur->Size() <= *idx) cur->PushBack(Value(), json::allocator());
      next = &(*cur)[static_cast<rapidjson::SizeType>(*idx)];
    }

    if (!last && !next->IsObject() && !next->IsArray()) {
      *next = isIndex(segs[i + 1]) ? json::array() : json::object();
    }
    cur = next;
  }
  return *cur;
}

Value& ensure(Value& root, const std::string& path) {
  return ensure(root, split(path));
}

void assign(Value& root, const std::string& path, Value v) {
  ensure(root, path) = std::move(v);
}

const std::vector<std::string>& PathTable::segments(const std::string& path) {
  auto it = table_.find(path);
  if (it != table_.end()) return it->second;
  return table_.emplace(path, split(path)).first->second;
}

} // namespace sea::path
