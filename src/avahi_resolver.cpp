
#include "avahi_resolver.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/simple-watch.h>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Upper bound on one poll iteration, so a stop request is seen promptly.
constexpr int poll_slice_ms = 100;

} // namespace

struct AvahiResolver::Impl {
  using Link = MdnsInstanceTable::Link;

  // One resolver per announced (instance, interface, protocol). It stays
  // alive until the announcement is withdrawn and reports record changes.
  struct LinkKey {
    std::string instance;
    Link link;

    bool operator<(const LinkKey& other) const {
      if (instance != other.instance) {
        return instance < other.instance;
      }
      return link < other.link;
    }
  };

  struct LinkResolver {
    AvahiServiceResolver* resolver = nullptr;
    std::chrono::steady_clock::time_point started;
    bool found = false;
  };

  Impl(std::chrono::milliseconds timeout, Logger log)
      : resolve_timeout(timeout), logger(std::move(log)) {}

  ~Impl() {
    release_resolvers();
    if (browser) {
      avahi_service_browser_free(browser);
    }
    if (client) {
      avahi_client_free(client);
    }
    if (poll) {
      avahi_simple_poll_free(poll);
    }
  }

  void fail(const std::string& why) {
    if (failure.empty()) {
      failure = why;
    }
    avahi_simple_poll_quit(poll);
  }

  void publish(std::optional<ServiceEntry> entry) {
    if (entry) {
      entries->push(std::move(*entry));
    }
  }

  void release_resolvers() {
    for (auto& [key, lr] : resolvers) {
      avahi_service_resolver_free(lr.resolver);
    }
    resolvers.clear();
  }

  // browse_timeout bounds the first resolution only; a resolver that has
  // reported once keeps watching.
  void expire_resolves() {
    auto now = std::chrono::steady_clock::now();
    auto it = resolvers.begin();
    while (it != resolvers.end()) {
      if (!it->second.found && now - it->second.started > resolve_timeout) {
        logger.debug("abandoning slow mDNS resolve",
                     {{"instance", it->first.instance}});
        avahi_service_resolver_free(it->second.resolver);
        it = resolvers.erase(it);
      } else {
        ++it;
      }
    }
  }

  static void on_client_event(AvahiClient* c, AvahiClientState state,
                              void* userdata) {
    auto* self = static_cast<Impl*>(userdata);
    if (state == AVAHI_CLIENT_FAILURE) {
      self->fail(std::string("avahi client failure: ") +
                 avahi_strerror(avahi_client_errno(c)));
    }
  }

  static void on_browse_event(AvahiServiceBrowser* b, AvahiIfIndex interface,
                              AvahiProtocol protocol, AvahiBrowserEvent event,
                              const char* name, const char* type,
                              const char* domain, AvahiLookupResultFlags,
                              void* userdata) {
    auto* self = static_cast<Impl*>(userdata);
    switch (event) {
    case AVAHI_BROWSER_NEW: {
      LinkKey key{name, Link{interface, protocol}};
      if (!self->table.announce(key.instance, key.link)) {
        break;
      }

      // Resolve in the family the announcement arrived on, so each link
      // contributes one address of its own family.
      auto* r = avahi_service_resolver_new(
          self->client, interface, protocol, name, type, domain, protocol,
          static_cast<AvahiLookupFlags>(0), &Impl::on_resolve_event, self);
      if (!r) {
        self->logger.error(
            "failed to resolve mDNS service",
            {{"instance", name},
             {"error", avahi_strerror(avahi_client_errno(self->client))}});
        break;
      }
      self->resolvers[key] = {r, std::chrono::steady_clock::now(), false};
      break;
    }
    case AVAHI_BROWSER_REMOVE: {
      LinkKey key{name, Link{interface, protocol}};
      auto it = self->resolvers.find(key);
      if (it != self->resolvers.end()) {
        avahi_service_resolver_free(it->second.resolver);
        self->resolvers.erase(it);
      }
      self->publish(self->table.withdraw(key.instance, key.link));
      break;
    }
    case AVAHI_BROWSER_FAILURE:
      self->fail(std::string("avahi browser failure: ") +
                 avahi_strerror(avahi_client_errno(
                     avahi_service_browser_get_client(b))));
      break;
    case AVAHI_BROWSER_ALL_FOR_NOW:
    case AVAHI_BROWSER_CACHE_EXHAUSTED:
      break;
    }
  }

  static void on_resolve_event(AvahiServiceResolver* r, AvahiIfIndex interface,
                               AvahiProtocol protocol, AvahiResolverEvent event,
                               const char* name, const char*, const char*,
                               const char* host_name, const AvahiAddress* a,
                               uint16_t port, AvahiStringList*,
                               AvahiLookupResultFlags, void* userdata) {
    auto* self = static_cast<Impl*>(userdata);
    LinkKey key{name, Link{interface, protocol}};
    auto it = self->resolvers.find(key);
    if (it == self->resolvers.end() || it->second.resolver != r) {
      return;
    }

    if (event == AVAHI_RESOLVER_FOUND) {
      char addr[AVAHI_ADDRESS_STR_MAX];
      avahi_address_snprint(addr, sizeof(addr), a);
      it->second.found = true;
      self->publish(self->table.resolved(key.instance, key.link,
                                         host_name ? host_name : "", addr,
                                         a->proto != AVAHI_PROTO_INET, port));
      return;
    }

    self->logger.error(
        "mDNS resolve failed",
        {{"instance", name},
         {"error", avahi_strerror(avahi_client_errno(
                       avahi_service_resolver_get_client(r)))}});
    avahi_service_resolver_free(r);
    self->resolvers.erase(it);
    self->publish(self->table.unresolved(key.instance, key.link));
  }

  AvahiSimplePoll* poll = nullptr;
  AvahiClient* client = nullptr;
  AvahiServiceBrowser* browser = nullptr;

  std::chrono::milliseconds resolve_timeout;
  Logger logger;
  ServiceEntryQueue* entries = nullptr;
  MdnsInstanceTable table;
  std::map<LinkKey, LinkResolver> resolvers;
  std::string failure;
};

AvahiResolver::AvahiResolver(std::chrono::milliseconds resolve_timeout,
                             Logger logger)
    : impl_(std::make_unique<Impl>(resolve_timeout, std::move(logger))) {
  impl_->poll = avahi_simple_poll_new();
  if (!impl_->poll) {
    throw std::runtime_error("creating avahi poll object failed");
  }

  int error = 0;
  impl_->client =
      avahi_client_new(avahi_simple_poll_get(impl_->poll),
                       static_cast<AvahiClientFlags>(0),
                       &Impl::on_client_event, impl_.get(), &error);
  if (!impl_->client) {
    throw std::runtime_error(std::string("creating avahi client: ") +
                             avahi_strerror(error));
  }
}

AvahiResolver::~AvahiResolver() = default;

void AvahiResolver::browse(const std::string& service,
                           const std::string& domain,
                           ServiceEntryQueue& entries, std::stop_token stop) {
  impl_->entries = &entries;
  impl_->failure.clear();

  impl_->browser = avahi_service_browser_new(
      impl_->client, AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC, service.c_str(),
      domain.empty() ? nullptr : domain.c_str(),
      static_cast<AvahiLookupFlags>(0), &Impl::on_browse_event, impl_.get());
  if (!impl_->browser) {
    impl_->entries = nullptr;
    throw std::runtime_error(
        std::string("creating avahi service browser: ") +
        avahi_strerror(avahi_client_errno(impl_->client)));
  }

  while (!stop.stop_requested() && impl_->failure.empty()) {
    int rc = avahi_simple_poll_iterate(impl_->poll, poll_slice_ms);
    if (rc < 0) {
      impl_->failure = "avahi poll iteration failed";
      break;
    }
    if (rc > 0) {
      break;
    }
    impl_->expire_resolves();
  }

  impl_->release_resolvers();
  avahi_service_browser_free(impl_->browser);
  impl_->browser = nullptr;
  impl_->table.clear();
  impl_->entries = nullptr;

  if (!impl_->failure.empty()) {
    throw std::runtime_error(impl_->failure);
  }
}
