// errors.hpp

#pragma once
#include <stdexcept>
#include <string>

// Bad or missing configuration: always fatal to startup.
struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The provider could not start (client construction, initial subscription).
struct ProvisionError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The store is empty at fetch time.
struct UpstreamsUnavailable : std::runtime_error {
  explicit UpstreamsUnavailable(const std::string& service)
      : std::runtime_error("no upstreams available for service: " + service) {}
};

struct CleanupError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct NoProviderError : std::runtime_error {
  NoProviderError()
      : std::runtime_error("no service discovery provider is configured") {}
};
