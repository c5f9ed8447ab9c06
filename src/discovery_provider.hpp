// discovery_provider.hpp

#pragma once
#include "config_dispenser.hpp"
#include "logger.hpp"
#include "upstream_store.hpp"

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// A service discovery backend. Every provider owns one UpstreamStore and a
// background mechanism that keeps it current; the request path only reads.
//
// Lifecycle: Unconfigured -> Provisioned (validate) -> Running (provision)
// -> Stopped (cleanup). provision() validates first when needed, since the
// host provisions modules before validating them.
class DiscoveryProvider {
public:
  enum class State { Unconfigured, Provisioned, Running, Stopped };

  virtual ~DiscoveryProvider() = default;

  // Name of the backend, as used in the "provider" directive.
  virtual std::string name() const = 0;

  // Parses the provider's own block; the dispenser sits on the provider
  // name when called.
  virtual void unmarshal(ConfigDispenser& d) = 0;

  // Same settings as a JSON object; the "provider" key is ignored.
  virtual void unmarshal_json(const json& j) = 0;

  void validate();
  void provision(Logger logger);
  void cleanup();

  // Current snapshot. Never empty: an empty store raises
  // UpstreamsUnavailable.
  UpstreamStore::Snapshot get_upstreams() const;

  State state() const;

protected:
  virtual const std::string& service_name() const = 0;

  // Throws ConfigError naming the first missing or invalid field.
  virtual void check_config() const = 0;

  // Launches the background refresh. Throws ProvisionError on fatal
  // failures.
  virtual void start() = 0;

  // Stops the background refresh and waits for it where possible.
  virtual void stop() = 0;

  const Logger& logger() const { return logger_; }

  UpstreamStore store_;

private:
  Logger logger_;
  State state_ = State::Unconfigured;
  mutable std::mutex state_mutex_;
};

// Reads a field of a JSON provider object, rethrowing type errors as
// ConfigError naming the key.
template <typename T>
T json_field(const json& j, const std::string& provider, const std::string& key) {
  try {
    return j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(provider + " provider: invalid value for " + key + ": " +
                      e.what());
  }
}

std::chrono::milliseconds json_duration(const json& j,
                                        const std::string& provider,
                                        const std::string& key);
