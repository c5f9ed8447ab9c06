// endpoint.hpp

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

inline std::string join_host_port(const std::string& host, uint64_t port) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

// One reachable backend. The dial target is fixed at construction.
class Endpoint {
public:
  Endpoint(const std::string& host, uint64_t port) {
    if (host.empty()) {
      throw std::invalid_argument("endpoint host is empty");
    }
    if (port == 0 || port > 65535) {
      throw std::invalid_argument("endpoint port out of range: " +
                                  std::to_string(port));
    }
    dial_ = join_host_port(host, port);
  }

  const std::string& dial() const { return dial_; }

  bool operator==(const Endpoint& other) const { return dial_ == other.dial_; }
  bool operator!=(const Endpoint& other) const { return !(*this == other); }

private:
  std::string dial_;
};

using UpstreamList = std::vector<Endpoint>;
