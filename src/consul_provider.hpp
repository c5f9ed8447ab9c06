// consul_provider.hpp

#pragma once
#include "consul_client.hpp"
#include "discovery_provider.hpp"

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

struct ConsulConfig {
  std::string address;
  std::string service_name;
  std::vector<std::string> tags;
  bool passing_only = true;
  std::chrono::milliseconds poll_interval{std::chrono::seconds(10)};
  std::string token;
};

// Polls the Consul health API on a fixed interval.
class ConsulProvider : public DiscoveryProvider {
public:
  using ClientFactory = std::function<std::unique_ptr<ConsulHealthClient>(
      const ConsulClientConfig&)>;

  static constexpr const char* default_address = "127.0.0.1:8500";

  ConsulProvider();
  explicit ConsulProvider(ClientFactory factory);
  ~ConsulProvider() override;

  std::string name() const override { return "consul"; }
  void unmarshal(ConfigDispenser& d) override;
  void unmarshal_json(const json& j) override;

  const ConsulConfig& config() const { return config_; }

protected:
  const std::string& service_name() const override {
    return config_.service_name;
  }
  void check_config() const override;
  void start() override;
  void stop() override;

private:
  ConsulClientConfig client_config() const;
  net::awaitable<void> update_upstreams();
  net::awaitable<void> watch_service_changes();
  void shutdown_worker();

  ConsulConfig config_;
  ClientFactory client_factory_;
  std::unique_ptr<ConsulHealthClient> client_;

  net::io_context ioc_;
  net::steady_timer timer_{ioc_};
  std::atomic<bool> stopping_{false};
  std::thread worker_;
};
