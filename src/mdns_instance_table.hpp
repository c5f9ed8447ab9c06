// mdns_instance_table.hpp

#pragma once
#include "mdns_resolver.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>

// Folds per-link mDNS events into per-instance ServiceEntry updates. An
// instance may be announced on several (interface, protocol) links; each
// link carries the address its own resolver last reported.
class MdnsInstanceTable {
public:
  // mDNS records announce a 120s TTL for service and host records.
  static constexpr uint32_t announced_ttl = 120;

  struct Link {
    int interface = 0;
    int protocol = 0;

    bool operator<(const Link& other) const {
      return std::tie(interface, protocol) <
             std::tie(other.interface, other.protocol);
    }
    bool operator==(const Link& other) const {
      return interface == other.interface && protocol == other.protocol;
    }
  };

  // Records an announcement. Returns false if the link was already known.
  bool announce(const std::string& instance, Link link);

  // A resolver reported the records of one link, for the first time or
  // after a change. Returns the instance's updated entry, or nothing if the
  // link has been withdrawn meanwhile.
  std::optional<ServiceEntry> resolved(const std::string& instance, Link link,
                                       const std::string& host_name,
                                       const std::string& address, bool ipv6,
                                       uint16_t port);

  // The resolver of a link gave up; its address no longer counts.
  std::optional<ServiceEntry> unresolved(const std::string& instance,
                                         Link link);

  // Removes one link. Returns the rebuilt entry while other links still
  // have addresses, a ttl-0 entry once none has, and nothing for unknown
  // links.
  std::optional<ServiceEntry> withdraw(const std::string& instance, Link link);

  bool contains(const std::string& instance, Link link) const;
  void clear() { instances_.clear(); }

private:
  struct Resolution {
    std::string host_name;
    std::string address;
    bool ipv6 = false;
    uint16_t port = 0;
    // Order of the reports, so the newest port wins.
    uint64_t sequence = 0;
  };

  struct Instance {
    std::map<Link, std::optional<Resolution>> links;
    // Whether an entry with ttl > 0 has been emitted since the last ttl 0.
    bool visible = false;
  };

  std::optional<ServiceEntry> rebuild(const std::string& instance,
                                      Instance& state);

  std::map<std::string, Instance> instances_;
  uint64_t sequence_ = 0;
};
