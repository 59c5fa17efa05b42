#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "sea/Json.hpp"

namespace sea::path {

// "items[0].id" -> {"items", "0", "id"}; empty segments are dropped.
std::vector<std::string> split(const std::string& path);

std::string join(const std::vector<std::string>& segs, std::size_t count = static_cast<std::size_t>(-1));

// Bracket indices rewritten as dotted numeric segments.
std::string normalize(const std::string& path);

std::string child(const std::string& parent, const std::string& key);
std::string topLevel(const std::string& path);

// "a.b.c" -> {"a", "a.b", "a.b.c"}
std::vector<std::string> prefixes(const std::string& path);

bool isIndex(const std::string& seg);

// Writes may pad an array with nulls by at most this many slots.
constexpr std::size_t kMaxArrayPadding = 4096;

// nullptr when a segment is missing or a scalar is traversed.
const Value* find(const Value& root, const std::vector<std::string>& segs);
const Value* find(const Value& root, const std::string& path);

// Creates missing intermediates (array when the next segment is numeric,
// object otherwise) and returns the addressed slot. Throws
// std::invalid_argument for a non-numeric segment inside an array, an index
// RapidJSON cannot address, an index more than kMaxArrayPadding past the end
// of the array, or an empty path.
Value& ensure(Value& root, const std::vector<std::string>& segs);
Value& ensure(Value& root, const std::string& path);

void assign(Value& root, const std::string& path, Value v);

// Interns split segments per path string.
class PathTable {
public:
  const std::vector<std::string>& segments(const std::string& path);
  std::size_t size() const { return table_.size(); }

private:
  std::unordered_map<std::string, std::vector<std::string>> table_;
};

} // namespace sea::path
