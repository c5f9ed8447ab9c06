// mdns_resolver.hpp

#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

// One announcement or withdrawal seen on the local network. A ttl of zero
// means the instance left.
struct ServiceEntry {
  std::string instance;
  std::string host_name;
  uint16_t port = 0;
  std::vector<std::string> addr_ipv4;
  std::vector<std::string> addr_ipv6;
  uint32_t ttl = 0;
};

// Unbounded hand-off between the browse task and its consumer.
class ServiceEntryQueue {
public:
  // Returns false once the queue has been closed.
  bool push(ServiceEntry entry) {
    {
      std::scoped_lock lock(mutex_);
      if (closed_) {
        return false;
      }
      entries_.push_back(std::move(entry));
    }
    ready_.notify_one();
    return true;
  }

  // Blocks for the next entry. Empty once closed and drained.
  std::optional<ServiceEntry> pop() {
    std::unique_lock lock(mutex_);
    ready_.wait(lock, [this] { return closed_ || !entries_.empty(); });
    if (entries_.empty()) {
      return std::nullopt;
    }
    auto entry = std::move(entries_.front());
    entries_.pop_front();
    return entry;
  }

  void close() {
    {
      std::scoped_lock lock(mutex_);
      closed_ = true;
    }
    ready_.notify_all();
  }

private:
  std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<ServiceEntry> entries_;
  bool closed_ = false;
};

class MdnsResolver {
public:
  virtual ~MdnsResolver() = default;

  // Streams entries for the service type until stop is requested. Throws
  // if browsing cannot start or the resolver fails.
  virtual void browse(const std::string& service, const std::string& domain,
                      ServiceEntryQueue& entries, std::stop_token stop) = 0;
};
