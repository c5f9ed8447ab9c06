
#include "consul_client.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

std::vector<ConsulServiceEntry> parse_health_entries(const std::string& body) {
  auto j = json::parse(body);
  if (!j.is_array()) {
    throw std::runtime_error("consul health response is not an array");
  }

  std::vector<ConsulServiceEntry> entries;
  entries.reserve(j.size());
  for (const auto& item : j) {
    ConsulServiceEntry entry;
    if (item.contains("Node") && item["Node"].is_object()) {
      entry.node_address = item["Node"].value("Address", "");
    }
    if (item.contains("Service") && item["Service"].is_object()) {
      const auto& service = item["Service"];
      entry.service_id = service.value("ID", "");
      entry.service_address = service.value("Address", "");
      entry.service_port = service.value("Port", 0);
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

ConsulHttpClient::ConsulHttpClient(const ConsulClientConfig& config)
    : address_(parse_http_address(config.address, "8500")),
      token_(config.token), timeout_(config.timeout) {
  if (address_.host.empty()) {
    throw std::invalid_argument("consul address has no host: '" +
                                config.address + "'");
  }
}

net::awaitable<std::vector<ConsulServiceEntry>>
ConsulHttpClient::health_service(const std::string& service,
                                 const std::vector<std::string>& tags,
                                 bool passing_only) {
  std::string target = "/v1/health/service/" + url_encode(service);
  std::string query;
  if (passing_only) {
    query += "passing=1";
  }
  for (const auto& tag : tags) {
    if (!query.empty()) {
      query += "&";
    }
    query += "tag=" + url_encode(tag);
  }
  if (!query.empty()) {
    target += "?" + query;
  }

  HttpHeaders headers;
  if (!token_.empty()) {
    headers.emplace_back("X-Consul-Token", token_);
  }

  auto body = co_await http_get(address_, target, headers, timeout_);
  co_return parse_health_entries(body);
}
