#include "sea/ActionContext.hpp"
#include "sea/Draft.hpp"
#include "sea/Registry.hpp"
#include "sea/Store.hpp"

#include <stdexcept>

namespace sea {

ActionContext::ActionContext(std::shared_ptr<Store> store) : store_(std::move(store)) {
  if (!store_) throw std::invalid_argument("ActionContext needs a store");
}

Value ActionContext::get(const std::string& path) const { return store_->get(path); }
bool ActionContext::has(const std::string& path) const { return store_->has(path); }

void ActionContext::set(const std::string& path, Value v) const {
  store_->patch([&](Draft& d) { d.set(path, std::move(v)); });
}

Value ActionContext::getter(const std::string& name) const { return store_->getter(name); }

Value ActionContext::call(const std::string& action, Value args) const {
  return store_->dispatch(action, std::move(args));
}

void ActionContext::callAsync(const std::string& action, Value args,
                              std::function<void(std::exception_ptr, Value)> handler) const {
  store_->dispatchAsync(action, std::move(args), std::move(handler));
}

void ActionContext::setState(const Value& partial) const { store_->setState(partial); }
void ActionContext::patch(const Value& partial) const { store_->patch(partial); }
void ActionContext::patch(const std::function<void(Draft&)>& fn) const { store_->patch(fn); }
void ActionContext::reset() const { store_->reset(); }

boost::asio::io_context& ActionContext::executor() const {
  auto reg = store_->registry();
  if (!reg || !reg->executor()) {
    throw std::logic_error("store '" + store_->id() + "' has no io_context; call Registry::setExecutor");
  }
  return *reg->executor();
}

} // namespace sea
