#include "sea/ActionDispatcher.hpp"
#include "sea/Store.hpp"
#include "sea/util/Logger.hpp"
#include "sea/util/Metrics.hpp"

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <stdexcept>

namespace sea {

std::string describeError(const std::exception_ptr& error) {
  if (!error) return {};
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

namespace detail {

class PendingAction {
public:
  PendingAction(std::shared_ptr<Store> store, ActionDispatcher& dispatcher,
                ActionEvent ev, AsyncHandler handler)
    : event(std::move(ev)), store_(std::move(store)), dispatcher_(dispatcher),
      handler_(std::move(handler)) {}

  ~PendingAction() {
    if (settled) return;
    try {
      settle(std::make_exception_ptr(boost::system::system_error(boost::asio::error::operation_aborted)),
             Value(), true);
    } catch (const std::exception& e) {
      util::logger().log(util::LogLevel::Error, "Cancelled action bookkeeping failed",
                         { {"store", event.storeId}, {"action", event.name}, {"error", e.what()} });
    } catch (...) {
      util::logger().log(util::LogLevel::Error, "Cancelled action bookkeeping failed",
                         { {"store", event.storeId}, {"action", event.name}, {"error", "non-standard exception"} });
    }
  }

  void settle(std::exception_ptr err, Value result, bool cancelled) {
    if (settled) {
      util::logger().log(util::LogLevel::Warn, "Async action settled more than once; ignoring",
                         { {"store", event.storeId}, {"action", event.name} });
      return;
    }
    settled = true;
    event.cancelled = cancelled;
    if (err) event.error = err;
    else     event.result = json::clone(result);

    dispatcher_.finish(event, loadingSet);

    if (!cancelled && handler_) handler_(err, std::move(result));
  }

  ActionEvent event;
  bool settled    = false;
  bool loadingSet = false;

private:
  std::shared_ptr<Store> store_;   // keeps dispatcher_ alive
  ActionDispatcher& dispatcher_;
  AsyncHandler handler_;
};

} // namespace detail

// ----------------- ActionCompletion -----------------

ActionCompletion::ActionCompletion(std::shared_ptr<detail::PendingAction> pending)
  : pending_(std::move(pending)) {}

void ActionCompletion::resolve(Value result) const {
  pending_->settle(nullptr, std::move(result), false);
}

void ActionCompletion::reject(std::exception_ptr error) const {
  if (!error) error = std::make_exception_ptr(std::runtime_error("rejected without an error"));
  pending_->settle(error, Value(), false);
}

bool ActionCompletion::settled() const {
  return pending_->settled;
}

// ----------------- ActionDispatcher -----------------

ActionDispatcher::ActionDispatcher(Store& store, Settings settings)
  : store_(store), settings_(std::move(settings)) {}

void ActionDispatcher::define(const std::string& name, ActionFn fn) {
  async_.erase(name);
  actions_[name] = std::move(fn);
}

void ActionDispatcher::defineAsync(const std::string& name, AsyncActionFn fn) {
  actions_.erase(name);
  async_[name] = std::move(fn);
}

bool ActionDispatcher::contains(const std::string& name) const {
  return actions_.count(name) > 0 || async_.count(name) > 0;
}

bool ActionDispatcher::isAsync(const std::string& name) const {
  return async_.count(name) > 0;
}

std::vector<std::string> ActionDispatcher::names() const {
  std::vector<std::string> out;
  for (auto& kv : actions_) out.push_back(kv.first);
  for (auto& kv : async_) out.push_back(kv.first);
  return out;
}

ActionEvent ActionDispatcher::begin(const std::string& name, Value args, bool async) const {
  ActionEvent ev;
  ev.storeId = store_.id();
  ev.name = name;
  ev.async = async;
  if (args.IsArray()) {
    ev.args = std::move(args);
  } else if (!args.IsNull()) {
    ev.args.PushBack(args, json::allocator());
  }
  ev.startTime = ActionEvent::Clock::now();
  return ev;
}

bool ActionDispatcher::raiseLoading(const std::string& name) {
  if (!settings_.trackLoading) return false;
  const std::string key = loadingKey(name);
  const Value cur = store_.get(key);
  if (cur.IsBool() && cur.GetBool()) return false;

  Value partial = json::object();
  json::setMember(partial, key, Value(true));
  store_.setStateWhenIdle(std::move(partial));
  return true;
}

void ActionDispatcher::lowerLoading(const std::string& name) {
  const std::string key = loadingKey(name);
  // Mid-update the raise may itself still be queued, so the lower is queued
  // behind it unconditionally.
  if (!store_.updating_) {
    const Value cur = store_.get(key);
    if (!cur.IsBool() || !cur.GetBool()) return;
  }

  Value partial = json::object();
  json::setMember(partial, key, Value(false));
  store_.setStateWhenIdle(std::move(partial));
}

void ActionDispatcher::finish(ActionEvent& ev, bool loadingSet) {
  ev.endTime = ActionEvent::Clock::now();
  ev.duration = ev.endTime - ev.startTime;

  store_.metrics_.incActions();
  SEA_METRIC_HIT("sea.action.dispatched");

  if (ev.error) {
    ev.errorMessage = describeError(ev.error);
    store_.metrics_.incActionErrors();
    SEA_METRIC_HIT("sea.action.failed");
    util::logger().log(util::LogLevel::Error, ev.cancelled ? "Action cancelled" : "Action failed",
                       { {"store", ev.storeId}, {"action", ev.name}, {"error", ev.errorMessage} });
  } else {
    util::logger().log(util::LogLevel::Debug, "Action completed",
                       { {"store", ev.storeId}, {"action", ev.name},
                         {"ms", std::to_string(ev.durationMs())} });
  }

  if (loadingSet) lowerLoading(ev.name);
  store_.emitAction(ev);
}

Value ActionDispatcher::invoke(const std::string& name, Value args) {
  auto it = actions_.find(name);
  if (it == actions_.end()) {
    if (async_.count(name)) {
      throw std::invalid_argument("action '" + name + "' is asynchronous; use dispatchAsync");
    }
    throw std::out_of_range("unknown action '" + name + "' on store '" + store_.id() + "'");
  }
  ActionFn fn = it->second;

  ActionEvent ev = begin(name, std::move(args), false);
  util::Logger::Scoped scope({ {"store", store_.id()}, {"action", name} });
  ActionContext ctx(store_.shared_from_this());

  Value result;
  try {
    result = fn(ctx, ev.args);
  } catch (...) {
    ev.error = std::current_exception();
    finish(ev, false);
    throw;
  }
  ev.result = json::clone(result);
  finish(ev, false);
  return result;
}

void ActionDispatcher::invokeAsync(const std::string& name, Value args, AsyncHandler handler) {
  auto it = async_.find(name);
  if (it == async_.end()) {
    if (actions_.count(name)) {
      throw std::invalid_argument("action '" + name + "' is synchronous; use dispatch");
    }
    throw std::out_of_range("unknown action '" + name + "' on store '" + store_.id() + "'");
  }
  AsyncActionFn fn = it->second;

  auto pending = std::make_shared<detail::PendingAction>(
      store_.shared_from_this(), *this, begin(name, std::move(args), true), std::move(handler));
  pending->loadingSet = raiseLoading(name);

  util::Logger::Scoped scope({ {"store", store_.id()}, {"action", name} });
  ActionContext ctx(store_.shared_from_this());
  ActionCompletion done(pending);

  try {
    fn(ctx, pending->event.args, done);
  } catch (...) {
    // Thrown before settling: the error goes to the handler like a rejection.
    if (!pending->settled) done.reject(std::current_exception());
    else throw;
  }
}

} // namespace sea
