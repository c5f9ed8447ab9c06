#include "consul_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {

struct FakeConsulState {
  std::mutex mutex;
  ConsulClientConfig config;
  std::vector<ConsulServiceEntry> entries;
  bool fail = false;
  int calls = 0;
  std::string last_service;
  std::vector<std::string> last_tags;
  bool last_passing_only = false;

  void set(std::vector<ConsulServiceEntry> next, bool failing) {
    std::scoped_lock lock(mutex);
    entries = std::move(next);
    fail = failing;
  }

  int call_count() {
    std::scoped_lock lock(mutex);
    return calls;
  }
};

class FakeConsulClient : public ConsulHealthClient {
public:
  explicit FakeConsulClient(std::shared_ptr<FakeConsulState> state)
      : state_(std::move(state)) {}

  net::awaitable<std::vector<ConsulServiceEntry>>
  health_service(const std::string& service,
                 const std::vector<std::string>& tags,
                 bool passing_only) override {
    std::vector<ConsulServiceEntry> entries;
    bool fail = false;
    {
      std::scoped_lock lock(state_->mutex);
      ++state_->calls;
      state_->last_service = service;
      state_->last_tags = tags;
      state_->last_passing_only = passing_only;
      entries = state_->entries;
      fail = state_->fail;
    }
    if (fail) {
      throw std::runtime_error("connection refused");
    }
    co_return entries;
  }

private:
  std::shared_ptr<FakeConsulState> state_;
};

ConsulServiceEntry entry(const std::string& node, const std::string& address,
                         int port) {
  ConsulServiceEntry e;
  e.node_address = node;
  e.service_id = address + ":" + std::to_string(port);
  e.service_address = address;
  e.service_port = port;
  return e;
}

std::unique_ptr<ConsulProvider>
make_provider(const std::shared_ptr<FakeConsulState>& state,
              const std::string& block) {
  auto provider = std::make_unique<ConsulProvider>(
      [state](const ConsulClientConfig& config) {
        {
          std::scoped_lock lock(state->mutex);
          state->config = config;
        }
        return std::make_unique<FakeConsulClient>(state);
      });
  auto d = ConfigDispenser::from_string(block);
  d.next();
  provider->unmarshal(d);
  return provider;
}

bool wait_until(const std::function<bool()>& done,
                std::chrono::milliseconds limit = 5s) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return done();
}

std::string first_dial(const DiscoveryProvider& provider) {
  try {
    return provider.get_upstreams()->front().dial();
  } catch (const UpstreamsUnavailable&) {
    return "";
  }
}

} // namespace

TEST(ConsulProvider, ParsesDirectives) {
  auto state = std::make_shared<FakeConsulState>();
  auto provider = make_provider(state, R"(consul {
    address consul.internal:8500
    service_name web
    tags primary v2
    passing_only false
    poll_interval 30s
    token secret
})");

  const auto& config = provider->config();
  EXPECT_EQ(config.address, "consul.internal:8500");
  EXPECT_EQ(config.service_name, "web");
  EXPECT_EQ(config.tags, (std::vector<std::string>{"primary", "v2"}));
  EXPECT_FALSE(config.passing_only);
  EXPECT_EQ(config.poll_interval, 30s);
  EXPECT_EQ(config.token, "secret");
}

TEST(ConsulProvider, RejectsBadValues) {
  auto state = std::make_shared<FakeConsulState>();
  EXPECT_THROW(make_provider(state, "consul {\n  poll_interval soon\n}"),
               ConfigError);
  EXPECT_THROW(make_provider(state, "consul {\n  passing_only maybe\n}"),
               ConfigError);
  EXPECT_THROW(make_provider(state, "consul {\n  datacenter dc1\n}"),
               ConfigError);
  EXPECT_THROW(make_provider(state, "consul {\n  service_name\n}"),
               ConfigError);
}

TEST(ConsulProvider, ValidateRequiresServiceName) {
  auto state = std::make_shared<FakeConsulState>();
  auto provider = make_provider(state, "consul {\n  address 10.0.0.1\n}");
  EXPECT_THROW(provider->validate(), ConfigError);

  auto zero = make_provider(
      state, "consul {\n  service_name web\n  poll_interval 0\n}");
  EXPECT_THROW(zero->validate(), ConfigError);
}

TEST(ConsulProvider, InitialFetchPopulatesStore) {
  auto state = std::make_shared<FakeConsulState>();
  state->set({entry("10.0.0.9", "10.0.0.5", 9000)}, false);
  auto provider = make_provider(
      state, "consul {\n  service_name web\n  tags primary\n  poll_interval 1h\n}");

  provider->provision(Logger("test.consul"));

  // No poll tick has happened yet; the data comes from the initial fetch.
  auto upstreams = provider->get_upstreams();
  ASSERT_EQ(upstreams->size(), 1u);
  EXPECT_EQ((*upstreams)[0].dial(), "10.0.0.5:9000");
  EXPECT_EQ(state->last_service, "web");
  EXPECT_EQ(state->last_tags, (std::vector<std::string>{"primary"}));
  EXPECT_TRUE(state->last_passing_only);

  auto started = std::chrono::steady_clock::now();
  provider->cleanup();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
  EXPECT_EQ(provider->state(), DiscoveryProvider::State::Stopped);
}

TEST(ConsulProvider, FallsBackToNodeAddress) {
  auto state = std::make_shared<FakeConsulState>();
  state->set({entry("10.0.0.5", "", 9000), entry("", "", 7001),
              entry("10.0.0.8", "10.0.0.7", 0)},
             false);
  auto provider = make_provider(
      state, "consul {\n  service_name web\n  poll_interval 1h\n}");
  provider->provision(Logger("test.consul"));

  // Entries without a usable host or port are skipped.
  auto upstreams = provider->get_upstreams();
  ASSERT_EQ(upstreams->size(), 1u);
  EXPECT_EQ((*upstreams)[0].dial(), "10.0.0.5:9000");
  provider->cleanup();
}

TEST(ConsulProvider, PollPicksUpChanges) {
  auto state = std::make_shared<FakeConsulState>();
  state->set({entry("", "10.0.0.5", 9000)}, false);
  auto provider = make_provider(
      state, "consul {\n  service_name web\n  poll_interval 20ms\n}");
  provider->provision(Logger("test.consul"));
  EXPECT_EQ(first_dial(*provider), "10.0.0.5:9000");

  state->set({entry("", "10.0.0.6", 9001)}, false);
  EXPECT_TRUE(wait_until(
      [&] { return first_dial(*provider) == "10.0.0.6:9001"; }));
  provider->cleanup();
}

TEST(ConsulProvider, FailedPollKeepsPreviousSnapshot) {
  auto state = std::make_shared<FakeConsulState>();
  state->set({entry("", "10.0.0.5", 9000)}, false);
  auto provider = make_provider(
      state, "consul {\n  service_name web\n  poll_interval 20ms\n}");
  provider->provision(Logger("test.consul"));

  state->set({}, true);
  int before = state->call_count();
  ASSERT_TRUE(wait_until([&] { return state->call_count() >= before + 3; }));
  EXPECT_EQ(first_dial(*provider), "10.0.0.5:9000");
  provider->cleanup();
}

TEST(ConsulProvider, InitialFailureIsNotFatal) {
  auto state = std::make_shared<FakeConsulState>();
  state->set({}, true);
  auto provider = make_provider(
      state, "consul {\n  service_name web\n  poll_interval 20ms\n}");

  EXPECT_NO_THROW(provider->provision(Logger("test.consul")));
  EXPECT_THROW(provider->get_upstreams(), UpstreamsUnavailable);

  // The agent comes back.
  state->set({entry("", "10.0.0.5", 9000)}, false);
  EXPECT_TRUE(wait_until(
      [&] { return first_dial(*provider) == "10.0.0.5:9000"; }));
  provider->cleanup();
}

TEST(ConsulProvider, ClientCreationFailureIsProvisionError) {
  ConsulProvider provider([](const ConsulClientConfig&)
                              -> std::unique_ptr<ConsulHealthClient> {
    throw std::invalid_argument("bad address");
  });
  auto d = ConfigDispenser::from_string("consul {\n  service_name web\n}");
  d.next();
  provider.unmarshal(d);

  EXPECT_THROW(provider.provision(Logger("test.consul")), ProvisionError);
}

TEST(ConsulProvider, AddressAndTokenFallBackToEnvironment) {
  ::setenv("CONSUL_HTTP_ADDR", "10.1.1.1:8500", 1);
  ::setenv("CONSUL_HTTP_TOKEN", "from-env", 1);

  auto state = std::make_shared<FakeConsulState>();
  state->set({entry("", "10.0.0.5", 9000)}, false);
  auto provider = make_provider(
      state, "consul {\n  service_name web\n  poll_interval 1h\n}");
  provider->provision(Logger("test.consul"));
  provider->cleanup();

  ::unsetenv("CONSUL_HTTP_ADDR");
  ::unsetenv("CONSUL_HTTP_TOKEN");

  EXPECT_EQ(state->config.address, "10.1.1.1:8500");
  EXPECT_EQ(state->config.token, "from-env");
  EXPECT_EQ(state->config.timeout, 1h);
}

TEST(ConsulProvider, DefaultAddressWithoutEnvironment) {
  ::unsetenv("CONSUL_HTTP_ADDR");
  auto state = std::make_shared<FakeConsulState>();
  auto provider = make_provider(
      state, "consul {\n  service_name web\n  poll_interval 1h\n}");
  provider->provision(Logger("test.consul"));
  provider->cleanup();

  EXPECT_EQ(state->config.address, ConsulProvider::default_address);
}

TEST(ConsulHealthEntries, ParsesHealthApiBody) {
  auto entries = parse_health_entries(R"([
    {"Node": {"Node": "n1", "Address": "10.0.0.9"},
     "Service": {"ID": "web-1", "Service": "web", "Address": "10.0.0.5",
                 "Port": 9000}},
    {"Node": {"Address": "10.0.0.8"},
     "Service": {"ID": "web-2", "Port": 9001}}
  ])");
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].service_id, "web-1");
  EXPECT_EQ(entries[0].service_address, "10.0.0.5");
  EXPECT_EQ(entries[0].service_port, 9000);
  EXPECT_EQ(entries[1].node_address, "10.0.0.8");
  EXPECT_TRUE(entries[1].service_address.empty());
}

TEST(ConsulHealthEntries, RejectsNonArray) {
  EXPECT_THROW(parse_health_entries(R"({"error": "x"})"), std::runtime_error);
}
