#include "sea/Json.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <stdexcept>

namespace sea::json {

JsonAllocator& allocator() {
  static JsonAllocator alloc;
  return alloc;
}

const Value& null() {
  static const Value n;
  return n;
}

Value clone(const Value& v) {
  return Value(v, allocator());
}

Value string(const std::string& s) {
  return Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator());
}

Value object() { return Value(rapidjson::kObjectType); }
Value array()  { return Value(rapidjson::kArrayType); }

bool equal(const Value& a, const Value& b) {
  return a == b;
}

bool equal(const Value* a, const std::optional<Value>& b) {
  if (!a || !b) return !a && !b;
  return *a == *b;
}

const Value* member(const Value& obj, const std::string& key) {
  if (!obj.IsObject()) return nullptr;
  Value name(rapidjson::StringRef(key.c_str(), static_cast<rapidjson::SizeType>(key.size())));
  auto it = obj.FindMember(name);
  return it == obj.MemberEnd() ? nullptr : &it->value;
}

void setMember(Value& obj, const std::string& key, Value v) {
  if (!obj.IsObject()) throw std::invalid_argument("setMember on non-object value (key '" + key + "')");
  Value name(rapidjson::StringRef(key.c_str(), static_cast<rapidjson::SizeType>(key.size())));
  auto it = obj.FindMember(name);
  if (it != obj.MemberEnd()) {
    it->value = std::move(v);
    return;
  }
  Value owned = string(key);
  obj.AddMember(owned, v, allocator());
}

Value mergeDeep(const Value& base, const Value& patch) {
  if (!base.IsObject() || !patch.IsObject()) return clone(patch);

  Value out = clone(base);
  for (auto m = patch.MemberBegin(); m != patch.MemberEnd(); ++m) {
    const std::string key(m->name.GetString(), m->name.GetStringLength());
    const Value* cur = member(out, key);
    if (cur && cur->IsObject() && m->value.IsObject()) {
      setMember(out, key, mergeDeep(*cur, m->value));
    } else {
      setMember(out, key, clone(m->value));
    }
  }
  return out;
}

Result<Value> parse(const std::string& text) {
  Document doc;
  doc.Parse(text.c_str(), text.size());
  if (doc.HasParseError()) {
    return Error{ rapidjson::GetParseError_En(doc.GetParseError()),
                  "offset " + std::to_string(doc.GetErrorOffset()) };
  }
  Value out;
  out.Swap(doc);
  return Result<Value>(std::move(out));
}

Value fromString(const std::string& text) {
  auto r = parse(text);
  if (!r) throw std::invalid_argument("invalid JSON: " + r.error().describe());
  return std::move(r.value());
}

std::string stringify(const Value& v) {
  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> w(buf);
  v.Accept(w);
  return std::string(buf.GetString(), buf.GetSize());
}

} // namespace sea::json
