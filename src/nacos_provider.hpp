// nacos_provider.hpp

#pragma once
#include "discovery_provider.hpp"
#include "nacos_client.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct NacosConfig {
  std::string server_addr;
  uint64_t server_port = 0;
  std::string namespace_id;
  std::string service_name;
  std::string group_name = "DEFAULT_GROUP";
  std::vector<std::string> clusters;
  std::chrono::milliseconds timeout{std::chrono::seconds(5)};
  std::string cache_dir;
};

// Subscribes to a Nacos service; the naming client pushes membership
// changes into the store.
class NacosProvider : public DiscoveryProvider {
public:
  using ClientFactory =
      std::function<std::unique_ptr<NamingClient>(const NacosClientConfig&)>;

  NacosProvider();
  explicit NacosProvider(ClientFactory factory);
  ~NacosProvider() override;

  std::string name() const override { return "nacos"; }
  void unmarshal(ConfigDispenser& d) override;
  void unmarshal_json(const json& j) override;

  const NacosConfig& config() const { return config_; }

protected:
  const std::string& service_name() const override {
    return config_.service_name;
  }
  void check_config() const override;
  void start() override;
  void stop() override;

private:
  SubscribeParam subscribe_param();
  void on_instances(const std::vector<NacosInstance>& instances,
                    std::exception_ptr err);

  NacosConfig config_;
  ClientFactory client_factory_;
  std::unique_ptr<NamingClient> client_;
};
