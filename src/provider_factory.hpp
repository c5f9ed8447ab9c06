// provider_factory.hpp

#pragma once
#include "discovery_provider.hpp"

#include <memory>
#include <string>
#include <vector>

// Names accepted by new_provider, in registration order.
std::vector<std::string> supported_providers();

// Returns a fresh, unconfigured provider. Throws ConfigError for unknown
// names.
std::unique_ptr<DiscoveryProvider> new_provider(const std::string& name);
