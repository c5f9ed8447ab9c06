
#include "discovery_provider.hpp"

#include <stdexcept>

void DiscoveryProvider::validate() {
  std::scoped_lock lock(state_mutex_);
  check_config();
  if (state_ == State::Unconfigured) {
    state_ = State::Provisioned;
  }
}

void DiscoveryProvider::provision(Logger logger) {
  std::scoped_lock lock(state_mutex_);
  if (state_ == State::Running || state_ == State::Stopped) {
    throw std::logic_error(name() + " provider: already provisioned");
  }
  if (state_ == State::Unconfigured) {
    check_config();
    state_ = State::Provisioned;
  }

  logger_ = std::move(logger);
  start();
  state_ = State::Running;
}

void DiscoveryProvider::cleanup() {
  std::scoped_lock lock(state_mutex_);
  auto previous = state_;
  state_ = State::Stopped;
  if (previous == State::Running) {
    stop();
  }
}

UpstreamStore::Snapshot DiscoveryProvider::get_upstreams() const {
  auto snapshot = store_.current();
  if (snapshot->empty()) {
    throw UpstreamsUnavailable(service_name());
  }
  return snapshot;
}

DiscoveryProvider::State DiscoveryProvider::state() const {
  std::scoped_lock lock(state_mutex_);
  return state_;
}

std::chrono::milliseconds json_duration(const json& j,
                                        const std::string& provider,
                                        const std::string& key) {
  const auto& value = j.at(key);
  try {
    if (value.is_number_integer()) {
      // Plain numbers are nanoseconds.
      return std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::nanoseconds(value.get<int64_t>()));
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        parse_duration(value.get<std::string>()));
  } catch (const json::exception& e) {
    throw ConfigError(provider + " provider: invalid duration for " + key +
                      ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw ConfigError(provider + " provider: invalid duration for " + key +
                      ": " + e.what());
  }
}
