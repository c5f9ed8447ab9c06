
#include "nacos_client.hpp"

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

constexpr std::chrono::milliseconds min_refresh_interval{1000};

} // namespace

NacosServiceInfo parse_instance_list(const std::string& body) {
  auto j = json::parse(body);
  if (!j.is_object()) {
    throw std::runtime_error("nacos instance list is not an object");
  }

  NacosServiceInfo info;
  auto cache_millis = j.value("cacheMillis", int64_t{10000});
  if (cache_millis > 0) {
    info.cache_millis = std::chrono::milliseconds(cache_millis);
  }

  if (j.contains("hosts") && j["hosts"].is_array()) {
    for (const auto& host : j["hosts"]) {
      NacosInstance instance;
      instance.instance_id = host.value("instanceId", "");
      instance.ip = host.value("ip", "");
      instance.port = host.value("port", uint64_t{0});
      instance.weight = host.value("weight", 1.0);
      instance.healthy = host.value("healthy", false);
      instance.enabled = host.value("enabled", false);
      instance.cluster_name = host.value("clusterName", "");
      info.hosts.push_back(std::move(instance));
    }
  }
  return info;
}

NacosNamingClient::NacosNamingClient(const NacosClientConfig& config)
    : config_(config), work_(net::make_work_guard(ioc_)) {
  if (config_.server_addr.empty()) {
    throw std::invalid_argument("nacos server address is empty");
  }
  if (config_.server_port == 0 || config_.server_port > 65535) {
    throw std::invalid_argument("nacos server port out of range: " +
                                std::to_string(config_.server_port));
  }
  address_ = parse_http_address(config_.server_addr,
                                std::to_string(config_.server_port));
  worker_ = std::thread([this] { ioc_.run(); });
}

NacosNamingClient::~NacosNamingClient() { close(); }

std::string NacosNamingClient::subscription_key(const SubscribeParam& param) {
  return param.group_name + "@@" + param.service_name;
}

void NacosNamingClient::subscribe(const SubscribeParam& param) {
  if (!param.callback) {
    throw std::invalid_argument("subscribe without a callback");
  }

  auto key = subscription_key(param);
  auto sub = std::make_shared<Subscription>(ioc_, param);
  {
    std::scoped_lock lock(mutex_);
    if (closed_) {
      throw std::runtime_error("nacos naming client is closed");
    }
    if (!subscriptions_.emplace(key, sub).second) {
      throw std::runtime_error("already subscribed to " + key);
    }
  }

  net::co_spawn(ioc_, run_subscription(sub),
                [logger = config_.logger, key](std::exception_ptr ep) {
                  if (!ep) {
                    return;
                  }
                  try {
                    std::rethrow_exception(ep);
                  } catch (const std::exception& e) {
                    logger.error("nacos subscription terminated",
                                 {{"key", key}, {"error", e.what()}});
                  }
                });
}

void NacosNamingClient::unsubscribe(const SubscribeParam& param) {
  auto key = subscription_key(param);
  std::shared_ptr<Subscription> sub;
  {
    std::scoped_lock lock(mutex_);
    auto it = subscriptions_.find(key);
    if (it == subscriptions_.end()) {
      throw std::runtime_error("not subscribed to " + key);
    }
    sub = it->second;
    subscriptions_.erase(it);
  }

  sub->cancelled = true;
  net::post(ioc_, [sub] { sub->timer.cancel(); });
}

void NacosNamingClient::close() {
  std::map<std::string, std::shared_ptr<Subscription>> remaining;
  {
    std::scoped_lock lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    remaining.swap(subscriptions_);
  }

  for (auto& [key, sub] : remaining) {
    sub->cancelled = true;
  }
  net::post(ioc_, [remaining] {
    for (auto& [key, sub] : remaining) {
      sub->timer.cancel();
    }
  });

  work_.reset();
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::string NacosNamingClient::query_target(const SubscribeParam& param) const {
  std::string target = "/nacos/v1/ns/instance/list?serviceName=" +
                       url_encode(subscription_key(param)) +
                       "&groupName=" + url_encode(param.group_name) +
                       "&healthyOnly=false";
  if (!config_.namespace_id.empty()) {
    target += "&namespaceId=" + url_encode(config_.namespace_id);
  }
  if (!param.clusters.empty()) {
    std::string joined;
    for (const auto& cluster : param.clusters) {
      if (!joined.empty()) {
        joined += ",";
      }
      joined += cluster;
    }
    target += "&clusters=" + url_encode(joined);
  }
  return target;
}

net::awaitable<void>
NacosNamingClient::run_subscription(std::shared_ptr<Subscription> sub) {
  while (!sub->cancelled) {
    auto wait = std::chrono::milliseconds(std::chrono::seconds(10));
    std::optional<std::vector<NacosInstance>> changed;
    std::exception_ptr error;

    try {
      auto body = co_await http_get(address_, query_target(sub->param), {},
                                    config_.timeout);
      auto info = parse_instance_list(body);
      wait = std::max(info.cache_millis, min_refresh_interval);
      write_cache(sub->param, body);
      if (!sub->last || *sub->last != info.hosts) {
        sub->last = info.hosts;
        changed = std::move(info.hosts);
      }
    } catch (const std::exception&) {
      error = std::current_exception();
    }

    // Nothing delivered yet: fall back to the last list persisted on disk.
    if (error && !sub->last) {
      if (auto cached = read_cache(sub->param)) {
        config_.logger.info(
            "serving nacos instances from failover cache",
            {{"service", sub->param.service_name},
             {"count", std::to_string(cached->hosts.size())}});
        sub->last = cached->hosts;
        changed = std::move(cached->hosts);
        error = nullptr;
      }
    }

    if (!sub->cancelled) {
      if (changed) {
        sub->param.callback(*changed, nullptr);
      } else if (error) {
        sub->param.callback({}, error);
      }
    }

    if (sub->cancelled) {
      break;
    }
    sub->timer.expires_after(wait);
    boost::system::error_code ec;
    co_await sub->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
  }
}

std::filesystem::path
NacosNamingClient::cache_file(const SubscribeParam& param) const {
  auto ns = config_.namespace_id.empty() ? std::string("public")
                                         : config_.namespace_id;
  return std::filesystem::path(config_.cache_dir) / ns /
         (subscription_key(param) + ".json");
}

void NacosNamingClient::write_cache(const SubscribeParam& param,
                                    const std::string& body) const {
  if (config_.cache_dir.empty()) {
    return;
  }
  auto path = cache_file(param);
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    config_.logger.error("creating nacos cache directory failed",
                         {{"path", path.parent_path().string()},
                          {"error", ec.message()}});
    return;
  }
  std::ofstream out(path, std::ios::trunc);
  out << body;
  if (!out) {
    config_.logger.error("writing nacos cache file failed",
                         {{"path", path.string()}});
  }
}

std::optional<NacosServiceInfo>
NacosNamingClient::read_cache(const SubscribeParam& param) const {
  if (config_.cache_dir.empty()) {
    return std::nullopt;
  }
  std::ifstream in(cache_file(param));
  if (!in) {
    return std::nullopt;
  }
  std::stringstream body;
  body << in.rdbuf();
  try {
    return parse_instance_list(body.str());
  } catch (const std::exception& e) {
    config_.logger.error("ignoring unreadable nacos cache file",
                         {{"path", cache_file(param).string()},
                          {"error", e.what()}});
    return std::nullopt;
  }
}
