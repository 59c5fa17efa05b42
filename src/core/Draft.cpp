#include "sea/Draft.hpp"
#include "sea/Path.hpp"

#include <algorithm>
#include <stdexcept>

namespace sea {

Draft::Draft(const Value& base) : base_(base), overlay_(json::object()) {}

const Value& Draft::get(const std::string& p) const {
  auto segs = path::split(p);
  if (segs.empty()) return json::null();
  const Value& root = json::member(overlay_, segs.front()) ? overlay_ : base_;
  const Value* v = path::find(root, segs);
  return v ? *v : json::null();
}

bool Draft::has(const std::string& p) const {
  auto segs = path::split(p);
  if (segs.empty()) return false;
  const Value& root = json::member(overlay_, segs.front()) ? overlay_ : base_;
  return path::find(root, segs) != nullptr;
}

Value& Draft::own(const std::string& topKey) {
  if (std::find(touched_.begin(), touched_.end(), topKey) == touched_.end()) {
    touched_.push_back(topKey);
    const Value* cur = json::member(base_, topKey);
    json::setMember(overlay_, topKey, cur ? json::clone(*cur) : Value());
  }
  return overlay_;
}

void Draft::set(const std::string& p, Value v) {
  edit(p) = std::move(v);
}

Value& Draft::edit(const std::string& p) {
  auto segs = path::split(p);
  if (segs.empty()) throw std::invalid_argument("draft write needs a non-empty path");
  Value& root = own(segs.front());
  return path::ensure(root, segs);
}

Value Draft::take() {
  Value out = json::object();
  out.Swap(overlay_);
  touched_.clear();
  return out;
}

} // namespace sea
