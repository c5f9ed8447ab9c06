
#include "nacos_provider.hpp"

#include <stdexcept>

NacosProvider::NacosProvider()
    : NacosProvider([](const NacosClientConfig& config) {
        return std::make_unique<NacosNamingClient>(config);
      }) {}

NacosProvider::NacosProvider(ClientFactory factory)
    : client_factory_(std::move(factory)) {}

NacosProvider::~NacosProvider() {
  if (client_) {
    client_->close();
  }
}

void NacosProvider::start() {
  logger().info("provisioning nacos service discovery provider",
                {{"service", config_.service_name},
                 {"group", config_.group_name}});

  NacosClientConfig cc;
  cc.server_addr = config_.server_addr;
  cc.server_port = config_.server_port;
  cc.namespace_id = config_.namespace_id;
  cc.timeout = config_.timeout;
  cc.cache_dir = config_.cache_dir;
  cc.logger = logger().named("client");

  try {
    client_ = client_factory_(cc);
  } catch (const std::exception& e) {
    throw ProvisionError("creating nacos naming client: " +
                         std::string(e.what()));
  }

  try {
    client_->subscribe(subscribe_param());
  } catch (const std::exception& e) {
    client_->close();
    client_.reset();
    throw ProvisionError("subscribing to nacos service '" +
                         config_.service_name + "': " + e.what());
  }
}

SubscribeParam NacosProvider::subscribe_param() {
  SubscribeParam param;
  param.service_name = config_.service_name;
  param.group_name = config_.group_name;
  param.clusters = config_.clusters;
  param.callback = [this](const std::vector<NacosInstance>& instances,
                          std::exception_ptr err) {
    on_instances(instances, err);
  };
  return param;
}

void NacosProvider::on_instances(const std::vector<NacosInstance>& instances,
                                 std::exception_ptr err) {
  if (err) {
    // Keep serving the last good list.
    try {
      std::rethrow_exception(err);
    } catch (const std::exception& e) {
      logger().error("nacos subscription callback error",
                     {{"error", e.what()}});
    }
    return;
  }

  UpstreamList upstreams;
  for (const auto& instance : instances) {
    if (!instance.enabled || !instance.healthy) {
      continue;
    }
    try {
      upstreams.emplace_back(instance.ip, instance.port);
    } catch (const std::invalid_argument& e) {
      logger().debug("skipping nacos instance",
                     {{"id", instance.instance_id}, {"error", e.what()}});
    }
  }

  auto count = upstreams.size();
  store_.replace(std::move(upstreams));
  logger().debug("updated upstreams from nacos",
                 {{"service", config_.service_name},
                  {"count", std::to_string(count)}});
}

void NacosProvider::stop() {
  logger().info("cleaning up nacos provider",
                {{"service", config_.service_name}});
  if (!client_) {
    return;
  }

  std::string unsubscribe_error;
  try {
    client_->unsubscribe(subscribe_param());
  } catch (const std::exception& e) {
    unsubscribe_error = e.what();
  }

  client_->close();
  client_.reset();

  if (!unsubscribe_error.empty()) {
    throw CleanupError("unsubscribing from nacos service '" +
                       config_.service_name + "': " + unsubscribe_error);
  }
}

void NacosProvider::check_config() const {
  if (config_.server_addr.empty()) {
    throw ConfigError("nacos provider: server_addr is required");
  }
  if (config_.server_port == 0) {
    throw ConfigError("nacos provider: server_port is required");
  }
  if (config_.server_port > 65535) {
    throw ConfigError("nacos provider: server_port out of range: " +
                      std::to_string(config_.server_port));
  }
  if (config_.service_name.empty()) {
    throw ConfigError("nacos provider: service_name is required");
  }
  if (config_.timeout.count() <= 0) {
    throw ConfigError("nacos provider: timeout must be positive");
  }
}

void NacosProvider::unmarshal(ConfigDispenser& d) {
  for (int nesting = d.nesting(); d.next_block(nesting);) {
    const std::string directive = d.val();
    if (directive == "server_addr") {
      config_.server_addr = expect_arg(d);
    } else if (directive == "server_port") {
      auto value = expect_arg(d);
      try {
        config_.server_port = parse_uint(value);
      } catch (const std::invalid_argument& e) {
        throw d.err("invalid port '" + value + "': " + e.what());
      }
    } else if (directive == "namespace_id") {
      config_.namespace_id = expect_arg(d);
    } else if (directive == "service_name") {
      config_.service_name = expect_arg(d);
    } else if (directive == "group_name") {
      config_.group_name = expect_arg(d);
    } else if (directive == "clusters") {
      config_.clusters = d.remaining_args();
    } else if (directive == "timeout") {
      auto value = expect_arg(d);
      try {
        config_.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
            parse_duration(value));
      } catch (const std::invalid_argument& e) {
        throw d.err("invalid duration for timeout: " + std::string(e.what()));
      }
    } else if (directive == "cache_dir") {
      config_.cache_dir = expect_arg(d);
    } else {
      throw d.err("unrecognized nacos subdirective '" + directive + "'");
    }
  }
}

void NacosProvider::unmarshal_json(const json& j) {
  for (const auto& item : j.items()) {
    const auto& key = item.key();
    if (key == "provider") {
      continue;
    } else if (key == "server_addr") {
      config_.server_addr = json_field<std::string>(j, "nacos", key);
    } else if (key == "server_port") {
      config_.server_port = json_field<uint64_t>(j, "nacos", key);
    } else if (key == "namespace_id") {
      config_.namespace_id = json_field<std::string>(j, "nacos", key);
    } else if (key == "service_name") {
      config_.service_name = json_field<std::string>(j, "nacos", key);
    } else if (key == "group_name") {
      config_.group_name = json_field<std::string>(j, "nacos", key);
    } else if (key == "clusters") {
      config_.clusters = json_field<std::vector<std::string>>(j, "nacos", key);
    } else if (key == "timeout") {
      config_.timeout = json_duration(j, "nacos", key);
    } else if (key == "cache_dir") {
      config_.cache_dir = json_field<std::string>(j, "nacos", key);
    } else {
      throw ConfigError("unrecognized nacos field '" + key + "'");
    }
  }
}
