#pragma once

#include <functional>
#include <memory>
#include <string>

#include "sea/Json.hpp"

namespace boost::asio { class io_context; }

namespace sea {

class Draft;
class Store;

/**
 * Receiver passed to action bodies. Reads see the live state, writes are
 * routed through Store::patch so every write bumps the version and
 * invalidates dependent getters. Cheap to copy; copies keep the store alive,
 * so async continuations can capture it by value.
 */
class ActionContext {
public:
  explicit ActionContext(std::shared_ptr<Store> store);

  Value get(const std::string& path) const;
  bool has(const std::string& path) const;
  void set(const std::string& path, Value v) const;

  Value getter(const std::string& name) const;

  // Sibling actions; each emits its own event.
  Value call(const std::string& action, Value args = json::array()) const;
  void callAsync(const std::string& action, Value args,
                 std::function<void(std::exception_ptr, Value)> handler) const;

  void setState(const Value& partial) const;
  void patch(const Value& partial) const;
  void patch(const std::function<void(Draft&)>& fn) const;
  void reset() const;

  Store& store() const noexcept { return *store_; }

  // The registry's io_context. Throws std::logic_error when none is attached.
  boost::asio::io_context& executor() const;

private:
  std::shared_ptr<Store> store_;
};

} // namespace sea
