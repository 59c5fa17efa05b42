#pragma once

#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "sea/ActionContext.hpp"
#include "sea/ActionEvent.hpp"
#include "sea/Json.hpp"

namespace sea {

class Store;
class ActionDispatcher;

namespace detail { class PendingAction; }

// asio-style completion signature: (error, result)
using AsyncHandler = std::function<void(std::exception_ptr, Value)>;

/**
 * Settles one asynchronous dispatch. Copies share the same state; the first
 * resolve/reject wins. If every copy is destroyed before settling, the
 * dispatch is recorded as cancelled (operation_aborted) and its handler is
 * not invoked.
 */
class ActionCompletion {
public:
  void resolve(Value result) const;
  void reject(std::exception_ptr error) const;

  template <typename E>
  void fail(E&& e) const { reject(std::make_exception_ptr(std::forward<E>(e))); }

  bool settled() const;

private:
  friend class ActionDispatcher;
  explicit ActionCompletion(std::shared_ptr<detail::PendingAction> pending);

  std::shared_ptr<detail::PendingAction> pending_;
};

using ActionFn      = std::function<Value(ActionContext&, const Value& args)>;
using AsyncActionFn = std::function<void(ActionContext&, const Value& args, ActionCompletion done)>;

class ActionDispatcher {
public:
  struct Settings {
    bool        trackLoading  = true;
    std::string loadingSuffix = "Loading";
  };

  ActionDispatcher(Store& store, Settings settings);

  void define(const std::string& name, ActionFn fn);
  void defineAsync(const std::string& name, AsyncActionFn fn);

  bool contains(const std::string& name) const;
  bool isAsync(const std::string& name) const;
  std::vector<std::string> names() const;

  // Runs a synchronous action. Errors are rethrown after the event is emitted.
  Value invoke(const std::string& name, Value args);

  // Starts an asynchronous action; `handler` runs once it settles.
  void invokeAsync(const std::string& name, Value args, AsyncHandler handler);

  std::string loadingKey(const std::string& name) const { return name + settings_.loadingSuffix; }

private:
  friend class detail::PendingAction;

  ActionEvent begin(const std::string& name, Value args, bool async) const;
  bool raiseLoading(const std::string& name);
  void lowerLoading(const std::string& name);
  void finish(ActionEvent& ev, bool loadingSet);

  Store& store_;
  Settings settings_;
  std::map<std::string, ActionFn> actions_;
  std::map<std::string, AsyncActionFn> async_;
};

} // namespace sea
