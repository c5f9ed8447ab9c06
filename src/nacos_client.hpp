// nacos_client.hpp

#pragma once
#include "http_client.hpp"
#include "logger.hpp"

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct NacosInstance {
  std::string instance_id;
  std::string ip;
  uint64_t port = 0;
  double weight = 1.0;
  bool healthy = false;
  bool enabled = false;
  std::string cluster_name;

  bool operator==(const NacosInstance&) const = default;
};

struct NacosServiceInfo {
  std::vector<NacosInstance> hosts;
  std::chrono::milliseconds cache_millis{std::chrono::seconds(10)};
};

// Parses the body of /nacos/v1/ns/instance/list.
NacosServiceInfo parse_instance_list(const std::string& body);

// Invoked with the full instance list on change, or with an error and an
// empty list when a refresh failed.
using SubscribeCallback =
    std::function<void(const std::vector<NacosInstance>&, std::exception_ptr)>;

struct SubscribeParam {
  std::string service_name;
  std::string group_name;
  std::vector<std::string> clusters;
  SubscribeCallback callback;
};

class NamingClient {
public:
  virtual ~NamingClient() = default;

  // Callbacks run on the client's own delivery thread.
  virtual void subscribe(const SubscribeParam& param) = 0;

  // Matches on service and group only.
  virtual void unsubscribe(const SubscribeParam& param) = 0;

  // Stops delivery and releases the connection. Safe to call twice.
  virtual void close() = 0;
};

struct NacosClientConfig {
  std::string server_addr;
  uint64_t server_port = 0;
  std::string namespace_id;
  std::chrono::milliseconds timeout{std::chrono::seconds(5)};
  // Failover cache location. Empty disables the cache.
  std::string cache_dir;
  Logger logger;
};

// Naming client over the Nacos open API. Each subscription is a coroutine
// on the client's worker thread that re-queries the server every
// cacheMillis and reports changes.
class NacosNamingClient : public NamingClient {
public:
  explicit NacosNamingClient(const NacosClientConfig& config);
  ~NacosNamingClient() override;

  NacosNamingClient(const NacosNamingClient&) = delete;
  NacosNamingClient& operator=(const NacosNamingClient&) = delete;

  void subscribe(const SubscribeParam& param) override;
  void unsubscribe(const SubscribeParam& param) override;
  void close() override;

private:
  struct Subscription {
    Subscription(net::io_context& ioc, SubscribeParam p)
        : param(std::move(p)), timer(ioc) {}

    SubscribeParam param;
    net::steady_timer timer;
    std::atomic<bool> cancelled{false};
    std::optional<std::vector<NacosInstance>> last;
  };

  static std::string subscription_key(const SubscribeParam& param);

  net::awaitable<void> run_subscription(std::shared_ptr<Subscription> sub);
  std::string query_target(const SubscribeParam& param) const;
  std::filesystem::path cache_file(const SubscribeParam& param) const;
  void write_cache(const SubscribeParam& param, const std::string& body) const;
  std::optional<NacosServiceInfo> read_cache(const SubscribeParam& param) const;

  NacosClientConfig config_;
  HttpAddress address_;

  net::io_context ioc_;
  net::executor_work_guard<net::io_context::executor_type> work_;
  std::thread worker_;

  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Subscription>> subscriptions_;
  bool closed_ = false;
};
