// upstream_store.hpp

#pragma once
#include "endpoint.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

// Holds the current upstream snapshot. Snapshots are immutable and swapped
// whole, so a reader sees either the old list or the new one.
class UpstreamStore {
public:
  using Snapshot = std::shared_ptr<const UpstreamList>;

  void replace(UpstreamList upstreams) {
    auto next = std::make_shared<const UpstreamList>(std::move(upstreams));
    std::scoped_lock lock(mutex_);
    current_ = std::move(next);
    ++version_;
  }

  Snapshot current() const {
    std::scoped_lock lock(mutex_);
    return current_;
  }

  // Number of replace calls so far.
  uint64_t version() const {
    std::scoped_lock lock(mutex_);
    return version_;
  }

private:
  Snapshot current_ = std::make_shared<const UpstreamList>();
  uint64_t version_ = 0;
  mutable std::mutex mutex_;
};
