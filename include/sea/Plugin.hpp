#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace sea {

class Registry;
class Store;

/**
 * Registry extension. Installed once per registry (unique by name); gets a
 * storeCreated() call for every store defined after installation. Hooks may
 * attach properties and actions to the store they receive.
 */
class Plugin {
public:
  Plugin() = default;
  virtual ~Plugin() = default;

  Plugin(const Plugin&) = delete;
  Plugin& operator=(const Plugin&) = delete;

  virtual std::string name() const = 0;
  virtual void install(Registry& registry) { (void)registry; }
  virtual void storeCreated(Store& store) = 0;
};

// Lambda adapter for plugins that only need the hooks.
class FunctionalPlugin : public Plugin {
public:
  using InstallFn      = std::function<void(Registry&)>;
  using StoreCreatedFn = std::function<void(Store&)>;

  FunctionalPlugin(std::string name, StoreCreatedFn onStore, InstallFn onInstall = {})
  : name_(std::move(name)), onStore_(std::move(onStore)), onInstall_(std::move(onInstall)) {}

  std::string name() const override { return name_; }
  void install(Registry& registry) override { if (onInstall_) onInstall_(registry); }
  void storeCreated(Store& store) override { if (onStore_) onStore_(store); }

private:
  std::string name_;
  StoreCreatedFn onStore_;
  InstallFn onInstall_;
};

std::shared_ptr<Plugin> makePlugin(std::string name,
                                   FunctionalPlugin::StoreCreatedFn onStore,
                                   FunctionalPlugin::InstallFn onInstall = {});

} // namespace sea
