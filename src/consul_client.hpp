// consul_client.hpp

#pragma once
#include "http_client.hpp"

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <string>
#include <vector>

struct ConsulServiceEntry {
  std::string node_address;
  std::string service_id;
  std::string service_address;
  int service_port = 0;
};

// Parses the body of /v1/health/service/<name>. Throws on malformed JSON.
std::vector<ConsulServiceEntry> parse_health_entries(const std::string& body);

class ConsulHealthClient {
public:
  virtual ~ConsulHealthClient() = default;

  virtual net::awaitable<std::vector<ConsulServiceEntry>>
  health_service(const std::string& service,
                 const std::vector<std::string>& tags, bool passing_only) = 0;
};

struct ConsulClientConfig {
  std::string address;
  std::string token;
  std::chrono::milliseconds timeout{std::chrono::seconds(10)};
};

class ConsulHttpClient : public ConsulHealthClient {
public:
  explicit ConsulHttpClient(const ConsulClientConfig& config);

  net::awaitable<std::vector<ConsulServiceEntry>>
  health_service(const std::string& service,
                 const std::vector<std::string>& tags,
                 bool passing_only) override;

private:
  HttpAddress address_;
  std::string token_;
  std::chrono::milliseconds timeout_;
};
