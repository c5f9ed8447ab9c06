// dynamic_upstreams.hpp

#pragma once
#include "discovery_provider.hpp"

#include <memory>

// The upstream source the proxy holds. It does no discovery itself; it owns
// the one configured provider and forwards every call to it.
class DynamicUpstreams {
public:
  DynamicUpstreams() = default;
  explicit DynamicUpstreams(std::unique_ptr<DiscoveryProvider> provider)
      : provider_(std::move(provider)) {}

  // Parses
  //
  //   dynamic_sd {
  //       provider <name> {
  //           ...
  //       }
  //   }
  void unmarshal(ConfigDispenser& d);

  // Parses {"provider": "<name>", ...provider fields...}.
  void unmarshal_json(const json& j);

  void provision(const Logger& logger);
  void validate();
  void cleanup();
  UpstreamStore::Snapshot get_upstreams() const;

  bool has_provider() const { return provider_ != nullptr; }
  DiscoveryProvider* provider() const { return provider_.get(); }

private:
  void select(std::unique_ptr<DiscoveryProvider> provider);

  std::unique_ptr<DiscoveryProvider> provider_;
};
