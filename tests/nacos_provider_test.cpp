#include "nacos_provider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

namespace {

// What a fake naming client saw, shared with the test after the provider
// takes ownership of the client.
struct FakeNamingState {
  NacosClientConfig config;
  SubscribeCallback callback;
  SubscribeParam subscribed;
  int unsubscribes = 0;
  int closes = 0;
  bool fail_subscribe = false;
  bool fail_unsubscribe = false;
};

class FakeNamingClient : public NamingClient {
public:
  explicit FakeNamingClient(std::shared_ptr<FakeNamingState> state)
      : state_(std::move(state)) {}

  void subscribe(const SubscribeParam& param) override {
    if (state_->fail_subscribe) {
      throw std::runtime_error("server refused subscription");
    }
    state_->subscribed = param;
    state_->callback = param.callback;
  }

  void unsubscribe(const SubscribeParam&) override {
    ++state_->unsubscribes;
    if (state_->fail_unsubscribe) {
      throw std::runtime_error("server unreachable");
    }
  }

  void close() override { ++state_->closes; }

private:
  std::shared_ptr<FakeNamingState> state_;
};

NacosInstance instance(const std::string& ip, uint64_t port, bool healthy,
                       bool enabled = true) {
  NacosInstance i;
  i.instance_id = ip + "#" + std::to_string(port);
  i.ip = ip;
  i.port = port;
  i.healthy = healthy;
  i.enabled = enabled;
  return i;
}

std::unique_ptr<NacosProvider> make_provider(
    const std::shared_ptr<FakeNamingState>& state) {
  auto provider = std::make_unique<NacosProvider>(
      [state](const NacosClientConfig& config) {
        state->config = config;
        return std::make_unique<FakeNamingClient>(state);
      });
  auto d = ConfigDispenser::from_string(R"(nacos {
    server_addr 127.0.0.1
    server_port 8848
    namespace_id dev
    service_name orders
    clusters a b
})");
  d.next();
  provider->unmarshal(d);
  return provider;
}

Logger quiet_logger() { return Logger("test.nacos"); }

} // namespace

TEST(NacosProvider, ParsesDirectives) {
  auto state = std::make_shared<FakeNamingState>();
  auto provider = make_provider(state);

  const auto& config = provider->config();
  EXPECT_EQ(config.server_addr, "127.0.0.1");
  EXPECT_EQ(config.server_port, 8848u);
  EXPECT_EQ(config.namespace_id, "dev");
  EXPECT_EQ(config.service_name, "orders");
  EXPECT_EQ(config.group_name, "DEFAULT_GROUP");
  EXPECT_EQ(config.clusters, (std::vector<std::string>{"a", "b"}));
}

TEST(NacosProvider, RejectsUnknownDirective) {
  NacosProvider provider;
  auto d = ConfigDispenser::from_string("nacos {\n  weight 3\n}");
  d.next();
  EXPECT_THROW(provider.unmarshal(d), ConfigError);
}

TEST(NacosProvider, RejectsBadPort) {
  NacosProvider provider;
  auto d = ConfigDispenser::from_string("nacos {\n  server_port abc\n}");
  d.next();
  EXPECT_THROW(provider.unmarshal(d), ConfigError);
}

TEST(NacosProvider, ValidateRequiresServerAndService) {
  NacosProvider provider;
  try {
    provider.validate();
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_STREQ(e.what(), "nacos provider: server_addr is required");
  }
}

TEST(NacosProvider, ValidateRejectsBadPortAndTimeout) {
  auto state = std::make_shared<FakeNamingState>();

  auto provider = make_provider(state);
  auto d = ConfigDispenser::from_string("nacos {\n  server_port 70000\n}");
  d.next();
  provider->unmarshal(d);
  EXPECT_THROW(provider->validate(), ConfigError);

  auto zero = make_provider(state);
  auto z = ConfigDispenser::from_string("nacos {\n  timeout 0\n}");
  z.next();
  zero->unmarshal(z);
  try {
    zero->validate();
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_STREQ(e.what(), "nacos provider: timeout must be positive");
  }

  auto negative = make_provider(state);
  auto n = ConfigDispenser::from_string("nacos {\n  timeout -1s\n}");
  n.next();
  negative->unmarshal(n);
  EXPECT_THROW(negative->validate(), ConfigError);

  // Rejected at configuration time, before any client is built.
  EXPECT_THROW(zero->provision(quiet_logger()), ConfigError);
  EXPECT_EQ(state->closes, 0);
  EXPECT_FALSE(state->callback);
}

TEST(NacosProvider, KeepsOnlyHealthyEnabledInstances) {
  auto state = std::make_shared<FakeNamingState>();
  auto provider = make_provider(state);
  provider->provision(quiet_logger());

  ASSERT_TRUE(state->callback);
  EXPECT_EQ(state->subscribed.service_name, "orders");
  EXPECT_EQ(state->subscribed.group_name, "DEFAULT_GROUP");
  EXPECT_EQ(state->config.namespace_id, "dev");

  state->callback({instance("10.0.0.1", 8080, true),
                   instance("10.0.0.2", 8080, false),
                   instance("10.0.0.3", 8080, true, false)},
                  nullptr);

  auto upstreams = provider->get_upstreams();
  ASSERT_EQ(upstreams->size(), 1u);
  EXPECT_EQ((*upstreams)[0].dial(), "10.0.0.1:8080");

  provider->cleanup();
}

TEST(NacosProvider, UnavailableBeforeFirstPush) {
  auto state = std::make_shared<FakeNamingState>();
  auto provider = make_provider(state);
  provider->provision(quiet_logger());

  try {
    provider->get_upstreams();
    FAIL() << "expected UpstreamsUnavailable";
  } catch (const UpstreamsUnavailable& e) {
    EXPECT_STREQ(e.what(), "no upstreams available for service: orders");
  }
  provider->cleanup();
}

TEST(NacosProvider, CallbackErrorKeepsLastList) {
  auto state = std::make_shared<FakeNamingState>();
  auto provider = make_provider(state);
  provider->provision(quiet_logger());

  state->callback({instance("10.0.0.1", 8080, true)}, nullptr);
  state->callback({}, std::make_exception_ptr(
                          std::runtime_error("server returned 500")));

  auto upstreams = provider->get_upstreams();
  ASSERT_EQ(upstreams->size(), 1u);
  EXPECT_EQ((*upstreams)[0].dial(), "10.0.0.1:8080");
  provider->cleanup();
}

TEST(NacosProvider, EmptyPushEmptiesStore) {
  auto state = std::make_shared<FakeNamingState>();
  auto provider = make_provider(state);
  provider->provision(quiet_logger());

  state->callback({instance("10.0.0.1", 8080, true)}, nullptr);
  state->callback({}, nullptr);
  EXPECT_THROW(provider->get_upstreams(), UpstreamsUnavailable);
  provider->cleanup();
}

TEST(NacosProvider, SubscribeFailureIsProvisionError) {
  auto state = std::make_shared<FakeNamingState>();
  state->fail_subscribe = true;
  auto provider = make_provider(state);

  EXPECT_THROW(provider->provision(quiet_logger()), ProvisionError);
  EXPECT_EQ(state->closes, 1);
}

TEST(NacosProvider, UnsubscribeFailureStillClosesClient) {
  auto state = std::make_shared<FakeNamingState>();
  state->fail_unsubscribe = true;
  auto provider = make_provider(state);
  provider->provision(quiet_logger());

  EXPECT_THROW(provider->cleanup(), CleanupError);
  EXPECT_EQ(state->unsubscribes, 1);
  EXPECT_EQ(state->closes, 1);
  EXPECT_EQ(provider->state(), DiscoveryProvider::State::Stopped);

  // A second cleanup has nothing left to stop.
  EXPECT_NO_THROW(provider->cleanup());
  EXPECT_EQ(state->unsubscribes, 1);
}

TEST(NacosProvider, ReadsJsonConfig) {
  NacosProvider provider;
  provider.unmarshal_json(json::parse(R"({
    "provider": "nacos",
    "server_addr": "nacos.internal",
    "server_port": 8848,
    "service_name": "orders",
    "group_name": "PAY",
    "timeout": "3s"
  })"));
  EXPECT_EQ(provider.config().server_addr, "nacos.internal");
  EXPECT_EQ(provider.config().group_name, "PAY");
  EXPECT_EQ(provider.config().timeout, std::chrono::seconds(3));
  EXPECT_NO_THROW(provider.validate());
}

TEST(NacosInstanceList, ParsesOpenApiBody) {
  auto info = parse_instance_list(R"({
    "name": "DEFAULT_GROUP@@orders",
    "cacheMillis": 3000,
    "hosts": [
      {"instanceId": "i1", "ip": "10.0.0.1", "port": 8080, "weight": 2.0,
       "healthy": true, "enabled": true, "clusterName": "a"},
      {"ip": "10.0.0.2", "port": 8081}
    ]
  })");
  EXPECT_EQ(info.cache_millis, std::chrono::milliseconds(3000));
  ASSERT_EQ(info.hosts.size(), 2u);
  EXPECT_EQ(info.hosts[0].instance_id, "i1");
  EXPECT_TRUE(info.hosts[0].healthy);
  EXPECT_EQ(info.hosts[0].cluster_name, "a");
  EXPECT_EQ(info.hosts[1].port, 8081u);
  EXPECT_FALSE(info.hosts[1].enabled);
}
