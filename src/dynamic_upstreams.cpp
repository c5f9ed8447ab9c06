
#include "dynamic_upstreams.hpp"

#include "provider_factory.hpp"

void DynamicUpstreams::select(std::unique_ptr<DiscoveryProvider> provider) {
  if (provider_) {
    throw ConfigError("a service discovery provider is already configured ('" +
                      provider_->name() + "')");
  }
  provider_ = std::move(provider);
}

void DynamicUpstreams::unmarshal(ConfigDispenser& d) {
  while (d.next()) { // module name
    if (d.next_arg()) {
      throw d.arg_err();
    }

    for (int nesting = d.nesting(); d.next_block(nesting);) {
      if (d.val() != "provider") {
        throw d.err("unrecognized subdirective '" + d.val() +
                    "', expected 'provider'");
      }
      auto name = expect_arg(d);

      std::unique_ptr<DiscoveryProvider> provider;
      try {
        provider = new_provider(name);
        select(std::move(provider));
      } catch (const ConfigError& e) {
        throw d.err("error creating provider '" + name + "': " + e.what());
      }

      // The provider parses its own block.
      provider_->unmarshal(d);
    }
  }
}

void DynamicUpstreams::unmarshal_json(const json& j) {
  if (!j.is_object()) {
    throw ConfigError("dynamic_sd config must be a JSON object");
  }
  if (!j.contains("provider") || !j["provider"].is_string()) {
    throw ConfigError("dynamic_sd config: 'provider' name is required");
  }
  auto name = j["provider"].get<std::string>();
  select(new_provider(name));
  provider_->unmarshal_json(j);
}

void DynamicUpstreams::provision(const Logger& logger) {
  if (!provider_) {
    throw NoProviderError();
  }
  provider_->provision(logger.named(provider_->name()));
}

void DynamicUpstreams::validate() {
  if (!provider_) {
    throw NoProviderError();
  }
  provider_->validate();
}

void DynamicUpstreams::cleanup() {
  if (!provider_) {
    throw NoProviderError();
  }
  provider_->cleanup();
}

UpstreamStore::Snapshot DynamicUpstreams::get_upstreams() const {
  if (!provider_) {
    throw NoProviderError();
  }
  return provider_->get_upstreams();
}
