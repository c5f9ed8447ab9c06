// mdns_provider.hpp

#pragma once
#include "discovery_provider.hpp"
#include "mdns_resolver.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>

struct MdnsConfig {
  std::string service_name;
  std::string domain = "local.";
  // Bounds how long resolving one announced instance may take.
  std::chrono::milliseconds browse_timeout{std::chrono::seconds(5)};
};

// Discovers upstreams by browsing mDNS/DNS-SD announcements on the local
// network.
class MdnsProvider : public DiscoveryProvider {
public:
  using ResolverFactory = std::function<std::unique_ptr<MdnsResolver>(
      const MdnsConfig&, const Logger&)>;

  MdnsProvider();
  explicit MdnsProvider(ResolverFactory factory);
  ~MdnsProvider() override;

  std::string name() const override { return "mdns"; }
  void unmarshal(ConfigDispenser& d) override;
  void unmarshal_json(const json& j) override;

  const MdnsConfig& config() const { return config_; }

protected:
  const std::string& service_name() const override {
    return config_.service_name;
  }
  void check_config() const override;
  void start() override;
  void stop() override;

private:
  void run_discovery(std::stop_token stop);
  void consume_entries(ServiceEntryQueue& entries);
  void update_upstreams(const std::map<std::string, Endpoint>& active);

  MdnsConfig config_;
  ResolverFactory resolver_factory_;
  std::jthread browser_;
};
