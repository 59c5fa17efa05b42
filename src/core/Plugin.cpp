#include "sea/Plugin.hpp"

#include <stdexcept>

namespace sea {

std::shared_ptr<Plugin> makePlugin(std::string name,
                                   FunctionalPlugin::StoreCreatedFn onStore,
                                   FunctionalPlugin::InstallFn onInstall) {
  if (name.empty()) throw std::invalid_argument("plugin name must not be empty");
  return std::make_shared<FunctionalPlugin>(std::move(name), std::move(onStore), std::move(onInstall));
}

} // namespace sea
