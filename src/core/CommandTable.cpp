#include "cmdreg/CommandTable.hpp"

#include "cmdreg/Result.hpp"
#include "cmdreg/util/Logger.hpp"

#include <functional>
#include <utility>

namespace cmdreg {

CommandTable::CommandTable(std::string name, TableOptions options)
  : name_(std::move(name)),
    options_(options),
    owner_(std::this_thread::get_id()) {}

void CommandTable::checkOpen() const {
  if (closed_) throw TableClosedError(name_);
}

void CommandTable::checkWritable() const {
  if (options_.publiclyWritable || std::this_thread::get_id() == owner_) return;

  util::logger().log(
    util::LogLevel::Warn,
    "Rejected write from non-owner thread",
    { {"table", name_} }
  );
  throw TableAccessError(name_);
}

std::optional<Entry> CommandTable::get(const std::string& key) const {
  return read([&]() -> std::optional<Entry> {
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
  });
}

void CommandTable::put(const std::string& key, Entry entry) {
  checkWritable();
  std::unique_lock lock(mx_);
  checkOpen();
  data_[key] = std::move(entry);
}

void CommandTable::erase(const std::string& key) {
  checkWritable();
  std::unique_lock lock(mx_);
  checkOpen();
  data_.erase(key);
}

Group CommandTable::snapshot() const {
  return read([&]() { return data_; });
}

size_t CommandTable::size() const {
  return read([&]() { return data_.size(); });
}

void CommandTable::close() {
  Group dropped;
  {
    std::unique_lock lock(mx_);
    if (closed_) return;
    closed_ = true;
    dropped.swap(data_);
  }

  util::logger().log(
    util::LogLevel::Info,
    "Closed table",
    { {"table", name_}, {"entries", std::to_string(dropped.size())} }
  );
}

std::unique_lock<std::mutex> CommandTable::lockKey(const std::string& key) const {
  return std::unique_lock<std::mutex>(keyLocks_[std::hash<std::string>{}(key) % kKeyStripes]);
}

bool CommandTable::closed() const {
  std::shared_lock lock(mx_);
  return closed_;
}

} // namespace cmdreg
