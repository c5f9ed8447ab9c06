
#include "consul_provider.hpp"

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <cstdlib>
#include <exception>
#include <stdexcept>

namespace {

std::string env_or(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return (value && *value) ? std::string(value) : fallback;
}

} // namespace

ConsulProvider::ConsulProvider()
    : ConsulProvider([](const ConsulClientConfig& config) {
        return std::make_unique<ConsulHttpClient>(config);
      }) {}

ConsulProvider::ConsulProvider(ClientFactory factory)
    : client_factory_(std::move(factory)) {}

ConsulProvider::~ConsulProvider() { shutdown_worker(); }

ConsulClientConfig ConsulProvider::client_config() const {
  ConsulClientConfig cc;
  cc.address = config_.address.empty()
                   ? env_or("CONSUL_HTTP_ADDR", default_address)
                   : config_.address;
  cc.token = config_.token.empty() ? env_or("CONSUL_HTTP_TOKEN", "")
                                   : config_.token;
  // An in-flight query never outlives one poll period.
  cc.timeout = config_.poll_interval;
  return cc;
}

void ConsulProvider::start() {
  auto cc = client_config();
  logger().info("provisioning consul service discovery provider",
                {{"service", config_.service_name}, {"address", cc.address}});

  try {
    client_ = client_factory_(cc);
  } catch (const std::exception& e) {
    throw ProvisionError("creating consul client: " + std::string(e.what()));
  }

  // Fetch once right away so the first request after startup has data.
  auto initial = net::co_spawn(ioc_, update_upstreams(), net::use_future);
  ioc_.run();
  ioc_.restart();
  try {
    initial.get();
  } catch (const std::exception& e) {
    // Not fatal: the poll loop may recover once the agent is reachable.
    logger().error("initial fetch from consul failed", {{"error", e.what()}});
  }

  stopping_ = false;
  net::co_spawn(ioc_, watch_service_changes(),
                [logger = logger()](std::exception_ptr ep) {
                  if (!ep) {
                    return;
                  }
                  try {
                    std::rethrow_exception(ep);
                  } catch (const std::exception& e) {
                    logger.error("consul watcher terminated",
                                 {{"error", e.what()}});
                  }
                });
  worker_ = std::thread([this] { ioc_.run(); });
}

net::awaitable<void> ConsulProvider::update_upstreams() {
  std::vector<ConsulServiceEntry> entries;
  try {
    entries = co_await client_->health_service(
        config_.service_name, config_.tags, config_.passing_only);
  } catch (const std::exception& e) {
    throw std::runtime_error("querying consul for service '" +
                             config_.service_name + "': " + e.what());
  }

  UpstreamList upstreams;
  upstreams.reserve(entries.size());
  for (const auto& entry : entries) {
    const auto& addr = entry.service_address.empty() ? entry.node_address
                                                     : entry.service_address;
    try {
      upstreams.emplace_back(
          addr, static_cast<uint64_t>(std::max(entry.service_port, 0)));
    } catch (const std::invalid_argument& e) {
      logger().debug("skipping consul entry",
                     {{"id", entry.service_id}, {"error", e.what()}});
    }
  }

  auto count = upstreams.size();
  store_.replace(std::move(upstreams));
  logger().debug("updated upstreams from consul",
                 {{"service", config_.service_name},
                  {"count", std::to_string(count)}});
}

net::awaitable<void> ConsulProvider::watch_service_changes() {
  timer_.expires_after(config_.poll_interval);
  while (!stopping_) {
    boost::system::error_code ec;
    co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
    if (stopping_) {
      break;
    }
    // Fixed rate, like a ticker: the next tick is measured from this one.
    timer_.expires_at(timer_.expiry() + config_.poll_interval);

    try {
      co_await update_upstreams();
    } catch (const std::exception& e) {
      logger().error("failed to update upstreams from consul",
                     {{"error", e.what()}});
    }
  }
  logger().info("stopping consul service watcher",
                {{"service", config_.service_name}});
}

void ConsulProvider::stop() {
  logger().info("cleaning up consul provider",
                {{"service", config_.service_name}});
  shutdown_worker();
}

void ConsulProvider::shutdown_worker() {
  if (!worker_.joinable()) {
    return;
  }
  stopping_ = true;
  net::post(ioc_, [this] { timer_.cancel(); });
  worker_.join();
}

void ConsulProvider::check_config() const {
  if (config_.service_name.empty()) {
    throw ConfigError("consul provider: service_name is required");
  }
  if (config_.poll_interval.count() <= 0) {
    throw ConfigError("consul provider: poll_interval must be positive");
  }
}

void ConsulProvider::unmarshal(ConfigDispenser& d) {
  for (int nesting = d.nesting(); d.next_block(nesting);) {
    const std::string directive = d.val();
    if (directive == "address") {
      config_.address = expect_arg(d);
    } else if (directive == "service_name") {
      config_.service_name = expect_arg(d);
    } else if (directive == "tags") {
      config_.tags = d.remaining_args();
    } else if (directive == "passing_only") {
      auto value = expect_arg(d);
      try {
        config_.passing_only = parse_bool(value);
      } catch (const std::invalid_argument& e) {
        throw d.err("invalid boolean for passing_only: " +
                    std::string(e.what()));
      }
    } else if (directive == "poll_interval") {
      auto value = expect_arg(d);
      try {
        config_.poll_interval =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                parse_duration(value));
      } catch (const std::invalid_argument& e) {
        throw d.err("invalid duration for poll_interval: " +
                    std::string(e.what()));
      }
    } else if (directive == "token") {
      config_.token = expect_arg(d);
    } else {
      throw d.err("unrecognized consul subdirective '" + directive + "'");
    }
  }
}

void ConsulProvider::unmarshal_json(const json& j) {
  for (const auto& item : j.items()) {
    const auto& key = item.key();
    if (key == "provider") {
      continue;
    } else if (key == "address") {
      config_.address = json_field<std::string>(j, "consul", key);
    } else if (key == "service_name") {
      config_.service_name = json_field<std::string>(j, "consul", key);
    } else if (key == "tags") {
      config_.tags = json_field<std::vector<std::string>>(j, "consul", key);
    } else if (key == "passing_only") {
      config_.passing_only = json_field<bool>(j, "consul", key);
    } else if (key == "poll_interval") {
      config_.poll_interval = json_duration(j, "consul", key);
    } else if (key == "token") {
      config_.token = json_field<std::string>(j, "consul", key);
    } else {
      throw ConfigError("unrecognized consul field '" + key + "'");
    }
  }
}
