
#include "mdns_provider.hpp"

#include "avahi_resolver.hpp"

#include <stdexcept>

MdnsProvider::MdnsProvider()
    : MdnsProvider([](const MdnsConfig& config, const Logger& logger) {
        return std::make_unique<AvahiResolver>(config.browse_timeout,
                                               logger.named("avahi"));
      }) {}

MdnsProvider::MdnsProvider(ResolverFactory factory)
    : resolver_factory_(std::move(factory)) {}

MdnsProvider::~MdnsProvider() {
  if (browser_.joinable()) {
    browser_.request_stop();
    browser_.join();
  }
}

void MdnsProvider::start() {
  logger().info("provisioning mDNS service discovery provider",
                {{"service", config_.service_name},
                 {"domain", config_.domain}});

  browser_ = std::jthread(
      [this](std::stop_token stop) { run_discovery(std::move(stop)); });
}

void MdnsProvider::run_discovery(std::stop_token stop) {
  std::unique_ptr<MdnsResolver> resolver;
  try {
    resolver = resolver_factory_(config_, logger());
  } catch (const std::exception& e) {
    logger().error("failed to initialize mDNS resolver", {{"error", e.what()}});
    return;
  }

  ServiceEntryQueue entries;
  std::thread consumer([this, &entries] { consume_entries(entries); });

  logger().info("starting mDNS browser",
                {{"service", config_.service_name}});
  try {
    resolver->browse(config_.service_name, config_.domain, entries, stop);
  } catch (const std::exception& e) {
    logger().error("mDNS browse failed", {{"error", e.what()}});
  }

  // Browse has returned: close the stream so the consumer drains and exits.
  entries.close();
  consumer.join();
  logger().info("mDNS browser stopped", {{"service", config_.service_name}});
}

void MdnsProvider::consume_entries(ServiceEntryQueue& entries) {
  std::map<std::string, Endpoint> active;

  while (auto entry = entries.pop()) {
    if (entry->ttl == 0) {
      if (active.erase(entry->instance) > 0) {
        logger().info("mDNS service instance left",
                      {{"instance", entry->instance}});
        update_upstreams(active);
      }
      continue;
    }

    std::string addr;
    if (!entry->addr_ipv4.empty()) {
      addr = entry->addr_ipv4.front();
    } else if (!entry->addr_ipv6.empty()) {
      addr = entry->addr_ipv6.front();
    }
    if (addr.empty()) {
      continue;
    }

    try {
      Endpoint upstream(addr, entry->port);
      logger().info("mDNS service instance found/updated",
                    {{"instance", entry->instance},
                     {"address", upstream.dial()}});
      active.insert_or_assign(entry->instance, std::move(upstream));
    } catch (const std::invalid_argument& e) {
      logger().debug("skipping mDNS entry",
                     {{"instance", entry->instance}, {"error", e.what()}});
      continue;
    }
    update_upstreams(active);
  }
}

void MdnsProvider::update_upstreams(
    const std::map<std::string, Endpoint>& active) {
  UpstreamList upstreams;
  upstreams.reserve(active.size());
  for (const auto& [instance, upstream] : active) {
    upstreams.push_back(upstream);
  }
  auto count = upstreams.size();
  store_.replace(std::move(upstreams));
  logger().debug("updated upstreams from mDNS",
                 {{"count", std::to_string(count)}});
}

void MdnsProvider::stop() {
  logger().info("cleaning up mDNS provider",
                {{"service", config_.service_name}});
  if (browser_.joinable()) {
    browser_.request_stop();
    browser_.join();
  }
}

void MdnsProvider::check_config() const {
  if (config_.service_name.empty()) {
    throw ConfigError(
        "mdns provider: service_name is required (e.g., '_http._tcp')");
  }
  if (config_.browse_timeout.count() <= 0) {
    throw ConfigError("mdns provider: browse_timeout must be positive");
  }
}

void MdnsProvider::unmarshal(ConfigDispenser& d) {
  for (int nesting = d.nesting(); d.next_block(nesting);) {
    const std::string directive = d.val();
    if (directive == "service_name") {
      config_.service_name = expect_arg(d);
    } else if (directive == "domain") {
      config_.domain = expect_arg(d);
    } else if (directive == "browse_timeout") {
      auto value = expect_arg(d);
      try {
        config_.browse_timeout =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                parse_duration(value));
      } catch (const std::invalid_argument& e) {
        throw d.err("invalid duration for browse_timeout: " +
                    std::string(e.what()));
      }
    } else {
      throw d.err("unrecognized mdns subdirective '" + directive + "'");
    }
  }
}

void MdnsProvider::unmarshal_json(const json& j) {
  for (const auto& item : j.items()) {
    const auto& key = item.key();
    if (key == "provider") {
      continue;
    } else if (key == "service_name") {
      config_.service_name = json_field<std::string>(j, "mdns", key);
    } else if (key == "domain") {
      config_.domain = json_field<std::string>(j, "mdns", key);
    } else if (key == "browse_timeout") {
      config_.browse_timeout = json_duration(j, "mdns", key);
    } else {
      throw ConfigError("unrecognized mdns field '" + key + "'");
    }
  }
}
