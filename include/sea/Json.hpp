#pragma once

#include <rapidjson/document.h>

#include <optional>
#include <string>

#include "sea/Result.hpp"

namespace sea {

// State trees use the CRT allocator so replaced subtrees are released right
// away instead of piling up in a memory pool for the lifetime of the store.
using JsonAllocator = rapidjson::CrtAllocator;
using Value         = rapidjson::GenericValue<rapidjson::UTF8<>, JsonAllocator>;
using Document      = rapidjson::GenericDocument<rapidjson::UTF8<>, JsonAllocator>;

namespace json {

JsonAllocator& allocator();

// Shared immutable null, returned for reads of absent locations.
const Value& null();

Value clone(const Value& v);
Value string(const std::string& s);
Value object();
Value array();

// Deep equality; objects compare member-order-insensitively.
bool equal(const Value& a, const Value& b);
bool equal(const Value* a, const std::optional<Value>& b);

// Insert or replace a member of an object value.
void setMember(Value& obj, const std::string& key, Value v);
const Value* member(const Value& obj, const std::string& key);

// Objects are merged key by key (recursively); arrays and scalars in `patch`
// replace whatever is in `base`.
Value mergeDeep(const Value& base, const Value& patch);

Result<Value> parse(const std::string& text);

// Throws std::invalid_argument on malformed text.
Value fromString(const std::string& text);

std::string stringify(const Value& v);

} // namespace json
} // namespace sea
