#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "sea/ActionEvent.hpp"
#include "sea/Plugin.hpp"
#include "sea/Store.hpp"
#include "sea/StoreOptions.hpp"
#include "sea/util/Config.hpp"

namespace boost::asio { class io_context; }

namespace sea {

/**
 * Owns the stores of one application, the installed plugins and the action
 * event bus. Not thread-safe: use a registry and its stores from one thread
 * (the one running the attached io_context when async actions are used).
 */
class Registry : public std::enable_shared_from_this<Registry> {
public:
  using Unsubscribe    = std::function<void()>;
  using ActionListener = std::function<void(const ActionEvent&)>;

  static std::shared_ptr<Registry> create();
  // Also applies the logging knobs of `cfg` to the process logger.
  static std::shared_ptr<Registry> create(const util::Config& cfg);

  ~Registry();

  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  // Returns false (and logs a warning) when a plugin with the same name is
  // already installed.
  bool use(std::shared_ptr<Plugin> plugin);
  bool hasPlugin(const std::string& name) const;

  // Existing store for a known id (options ignored), otherwise a new one.
  std::shared_ptr<Store> defineStore(const std::string& id, StoreOptions opts);
  // Throws ConfigError when `id` is taken.
  std::shared_ptr<Store> createStore(const std::string& id, StoreOptions opts);

  std::shared_ptr<Store> getStore(const std::string& id) const;
  std::vector<std::string> storeIds() const;

  Unsubscribe onAction(ActionListener cb);
  void emitAction(const ActionEvent& ev);

  // Commits inside `fn` apply at once; notifications are held back and sent
  // once per touched store when the outermost batch returns (or throws).
  void batch(const std::function<void()>& fn);
  bool batching() const noexcept { return batchDepth_ > 0; }

  void setExecutor(boost::asio::io_context& io) noexcept { io_ = &io; }
  boost::asio::io_context* executor() const noexcept { return io_; }

  const util::Config& config() const noexcept { return config_; }

private:
  friend class Store;

  explicit Registry(util::Config cfg);

  std::shared_ptr<Store> build(const std::string& id, StoreOptions& opts);
  void enqueueFlush(std::shared_ptr<Store> store);
  void flushBatches();

  util::Config config_;
  std::map<std::string, std::shared_ptr<Store>> stores_;
  std::vector<std::shared_ptr<Plugin>> plugins_;

  std::uint64_t nextListenerId_ = 1;
  std::map<std::uint64_t, ActionListener> actionListeners_;

  int batchDepth_ = 0;
  std::vector<std::shared_ptr<Store>> pendingFlush_;

  boost::asio::io_context* io_ = nullptr;
};

} // namespace sea
