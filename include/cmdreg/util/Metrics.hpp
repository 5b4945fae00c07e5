#pragma once

#include <atomic>
#include <cstdint>

namespace cmdreg {
namespace util {

struct MetricsSnapshot {
  uint64_t adds       = 0;   // committed add operations
  uint64_t removes    = 0;   // committed remove operations (no-ops included)
  uint64_t lookups    = 0;
  uint64_t snapshots  = 0;   // listAll calls
  uint64_t collisions = 0;   // rejected by LeafCollision
};

// Per-table counters. Relaxed ordering; values are advisory.
class Metrics {
public:
  void incAdds()       { adds_.fetch_add(1, std::memory_order_relaxed); }
  void incRemoves()    { removes_.fetch_add(1, std::memory_order_relaxed); }
  void incLookups()    { lookups_.fetch_add(1, std::memory_order_relaxed); }
  void incSnapshots()  { snapshots_.fetch_add(1, std::memory_order_relaxed); }
  void incCollisions() { collisions_.fetch_add(1, std::memory_order_relaxed); }

  MetricsSnapshot snapshot() const {
    MetricsSnapshot s;
    s.adds       = adds_.load(std::memory_order_relaxed);
    s.removes    = removes_.load(std::memory_order_relaxed);
    s.lookups    = lookups_.load(std::memory_order_relaxed);
    s.snapshots  = snapshots_.load(std::memory_order_relaxed);
    s.collisions = collisions_.load(std::memory_order_relaxed);
    return s;
  }

private:
  std::atomic<uint64_t> adds_{0};
  std::atomic<uint64_t> removes_{0};
  std::atomic<uint64_t> lookups_{0};
  std::atomic<uint64_t> snapshots_{0};
  std::atomic<uint64_t> collisions_{0};
};

} // namespace util
} // namespace cmdreg
