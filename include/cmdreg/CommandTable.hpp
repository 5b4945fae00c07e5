#pragma once

#include "cmdreg/Entry.hpp"
#include "cmdreg/util/Metrics.hpp"

#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>

namespace cmdreg {

struct TableOptions {
  bool concurrentReads  = true;  // readers share the lock
  bool orderedKeys      = true;  // keys are always kept ordered; false only drops the promise
  bool publiclyWritable = true;  // false: only the creating thread may write
  bool globallyNamed    = true;  // resolvable through TableDirectory
};

// Process-wide store of top-level name -> Entry.
//
// Every method is a single indivisible read or write of one key (or of the
// whole map for snapshot). There is no read-modify-write primitive: callers
// that derive a new value from an old one race with other writers of the
// same key.
class CommandTable {
public:
  CommandTable(std::string name, TableOptions options = {});

  CommandTable(const CommandTable&)            = delete;
  CommandTable& operator=(const CommandTable&) = delete;

  const std::string& name() const { return name_; }
  const TableOptions& options() const { return options_; }

  std::optional<Entry> get(const std::string& key) const;
  void put(const std::string& key, Entry entry);
  void erase(const std::string& key);

  Group snapshot() const;
  size_t size() const;

  // Drop every entry. Any later access throws TableClosedError.
  void close();
  bool closed() const;

  util::Metrics& metrics() const { return metrics_; }

  // Advisory per-key writer lock (striped). The table never takes it itself;
  // writers that want read-modify-write atomicity hold it across both steps.
  std::unique_lock<std::mutex> lockKey(const std::string& key) const;

private:
  template <typename Fn>
  auto read(Fn&& fn) const {
    if (options_.concurrentReads) {
      std::shared_lock lock(mx_);
      checkOpen();
      return fn();
    }
    std::unique_lock lock(mx_);
    checkOpen();
    return fn();
  }

  void checkOpen() const;
  void checkWritable() const;

private:
  const std::string name_;
  const TableOptions options_;
  const std::thread::id owner_;

  mutable std::shared_mutex mx_;
  Group data_;
  bool closed_ = false;

  static constexpr size_t kKeyStripes = 64;
  mutable std::array<std::mutex, kKeyStripes> keyLocks_;

  mutable util::Metrics metrics_;
};

using TableHandle = std::shared_ptr<CommandTable>;

} // namespace cmdreg
