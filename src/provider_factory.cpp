
#include "provider_factory.hpp"

#include "consul_provider.hpp"
#include "mdns_provider.hpp"
#include "nacos_provider.hpp"

#include <functional>
#include <utility>

namespace {

using Constructor = std::function<std::unique_ptr<DiscoveryProvider>()>;

// New backends are added here.
const std::vector<std::pair<std::string, Constructor>>& registry() {
  static const std::vector<std::pair<std::string, Constructor>> providers = {
      {"nacos", [] { return std::make_unique<NacosProvider>(); }},
      {"consul", [] { return std::make_unique<ConsulProvider>(); }},
      {"mdns", [] { return std::make_unique<MdnsProvider>(); }},
  };
  return providers;
}

} // namespace

std::vector<std::string> supported_providers() {
  std::vector<std::string> names;
  for (const auto& [name, ctor] : registry()) {
    names.push_back(name);
  }
  return names;
}

std::unique_ptr<DiscoveryProvider> new_provider(const std::string& name) {
  for (const auto& [registered, ctor] : registry()) {
    if (registered == name) {
      return ctor();
    }
  }

  std::string supported;
  for (const auto& candidate : supported_providers()) {
    if (!supported.empty()) {
      supported += ", ";
    }
    supported += candidate;
  }
  throw ConfigError("unknown service discovery provider: '" + name +
                    "'. supported providers are: " + supported);
}
