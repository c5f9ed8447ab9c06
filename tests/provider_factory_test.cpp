#include "provider_factory.hpp"

#include "consul_provider.hpp"
#include "mdns_provider.hpp"
#include "nacos_provider.hpp"

#include <gtest/gtest.h>

TEST(ProviderFactory, ListsSupportedProviders) {
  EXPECT_EQ(supported_providers(),
            (std::vector<std::string>{"nacos", "consul", "mdns"}));
}

TEST(ProviderFactory, BuildsEachBackend) {
  auto nacos = new_provider("nacos");
  auto consul = new_provider("consul");
  auto mdns = new_provider("mdns");

  EXPECT_NE(dynamic_cast<NacosProvider*>(nacos.get()), nullptr);
  EXPECT_NE(dynamic_cast<ConsulProvider*>(consul.get()), nullptr);
  EXPECT_NE(dynamic_cast<MdnsProvider*>(mdns.get()), nullptr);

  EXPECT_EQ(nacos->name(), "nacos");
  EXPECT_EQ(consul->name(), "consul");
  EXPECT_EQ(mdns->name(), "mdns");
  EXPECT_EQ(consul->state(), DiscoveryProvider::State::Unconfigured);
}

TEST(ProviderFactory, ReturnsIndependentInstances) {
  auto first = new_provider("consul");
  auto second = new_provider("consul");
  EXPECT_NE(first.get(), second.get());

  auto d = ConfigDispenser::from_string(
      "consul {\n  service_name web\n  poll_interval 3s\n  tags blue\n}");
  d.next();
  first->unmarshal(d);

  const auto& configured = dynamic_cast<ConsulProvider&>(*first).config();
  const auto& untouched = dynamic_cast<ConsulProvider&>(*second).config();
  EXPECT_EQ(configured.service_name, "web");
  EXPECT_EQ(configured.poll_interval, std::chrono::seconds(3));
  EXPECT_TRUE(untouched.service_name.empty());
  EXPECT_EQ(untouched.poll_interval, std::chrono::seconds(10));
  EXPECT_TRUE(untouched.tags.empty());

  first->validate();
  EXPECT_EQ(first->state(), DiscoveryProvider::State::Provisioned);
  EXPECT_EQ(second->state(), DiscoveryProvider::State::Unconfigured);
  EXPECT_THROW(second->validate(), ConfigError);
}

TEST(ProviderFactory, UnknownNameListsSupportedProviders) {
  try {
    new_provider("etcd");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_STREQ(e.what(), "unknown service discovery provider: 'etcd'. "
                           "supported providers are: nacos, consul, mdns");
  }
}

TEST(ProviderFactory, NamesAreCaseSensitive) {
  EXPECT_THROW(new_provider("Consul"), ConfigError);
  EXPECT_THROW(new_provider(""), ConfigError);
}
