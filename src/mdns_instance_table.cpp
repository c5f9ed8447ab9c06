
#include "mdns_instance_table.hpp"

#include <algorithm>
#include <vector>

namespace {

void add_unique(std::vector<std::string>& addrs, const std::string& addr) {
  if (std::find(addrs.begin(), addrs.end(), addr) == addrs.end()) {
    addrs.push_back(addr);
  }
}

} // namespace

bool MdnsInstanceTable::announce(const std::string& instance, Link link) {
  auto& state = instances_[instance];
  return state.links.try_emplace(link).second;
}

std::optional<ServiceEntry>
MdnsInstanceTable::resolved(const std::string& instance, Link link,
                            const std::string& host_name,
                            const std::string& address, bool ipv6,
                            uint16_t port) {
  auto it = instances_.find(instance);
  if (it == instances_.end()) {
    return std::nullopt;
  }
  auto link_it = it->second.links.find(link);
  if (link_it == it->second.links.end()) {
    return std::nullopt;
  }

  Resolution resolution;
  resolution.host_name = host_name;
  resolution.address = address;
  resolution.ipv6 = ipv6;
  resolution.port = port;
  resolution.sequence = ++sequence_;
  link_it->second = std::move(resolution);
  return rebuild(instance, it->second);
}

std::optional<ServiceEntry>
MdnsInstanceTable::unresolved(const std::string& instance, Link link) {
  auto it = instances_.find(instance);
  if (it == instances_.end()) {
    return std::nullopt;
  }
  auto link_it = it->second.links.find(link);
  if (link_it == it->second.links.end() || !link_it->second) {
    return std::nullopt;
  }
  link_it->second.reset();
  return rebuild(instance, it->second);
}

std::optional<ServiceEntry>
MdnsInstanceTable::withdraw(const std::string& instance, Link link) {
  auto it = instances_.find(instance);
  if (it == instances_.end() || it->second.links.erase(link) == 0) {
    return std::nullopt;
  }

  if (it->second.links.empty()) {
    bool visible = it->second.visible;
    instances_.erase(it);
    if (!visible) {
      return std::nullopt;
    }
    ServiceEntry gone;
    gone.instance = instance;
    gone.ttl = 0;
    return gone;
  }
  return rebuild(instance, it->second);
}

bool MdnsInstanceTable::contains(const std::string& instance,
                                 Link link) const {
  auto it = instances_.find(instance);
  return it != instances_.end() && it->second.links.count(link) > 0;
}

std::optional<ServiceEntry>
MdnsInstanceTable::rebuild(const std::string& instance, Instance& state) {
  ServiceEntry entry;
  entry.instance = instance;

  uint64_t newest = 0;
  for (const auto& [link, resolution] : state.links) {
    if (!resolution) {
      continue;
    }
    if (resolution->ipv6) {
      add_unique(entry.addr_ipv6, resolution->address);
    } else {
      add_unique(entry.addr_ipv4, resolution->address);
    }
    if (resolution->sequence > newest) {
      newest = resolution->sequence;
      entry.host_name = resolution->host_name;
      entry.port = resolution->port;
    }
  }

  if (newest == 0) {
    // Announced but no address known: the instance is unreachable for now.
    if (!state.visible) {
      return std::nullopt;
    }
    state.visible = false;
    entry.ttl = 0;
    return entry;
  }

  state.visible = true;
  entry.ttl = announced_ttl;
  return entry;
}
