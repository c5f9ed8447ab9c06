// avahi_resolver.hpp

#pragma once
#include "logger.hpp"
#include "mdns_instance_table.hpp"
#include "mdns_resolver.hpp"

#include <chrono>
#include <memory>

// Browses DNS-SD services through the Avahi daemon.
class AvahiResolver : public MdnsResolver {
public:
  // Connects to the daemon; throws if it is unreachable.
  AvahiResolver(std::chrono::milliseconds resolve_timeout, Logger logger);
  ~AvahiResolver() override;

  AvahiResolver(const AvahiResolver&) = delete;
  AvahiResolver& operator=(const AvahiResolver&) = delete;

  void browse(const std::string& service, const std::string& domain,
              ServiceEntryQueue& entries, std::stop_token stop) override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
