#include "cmdreg/CommandStorage.hpp"

#include "cmdreg/Registry.hpp"
#include "cmdreg/TableDirectory.hpp"
#include "cmdreg/util/Config.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace cmdreg {

WriterPolicy parseWriterPolicy(const std::string& s) {
  std::string x = s;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "unsynchronized") return WriterPolicy::Unsynchronized;
  if (x == "per_key_lock")   return WriterPolicy::PerKeyLock;
  throw std::invalid_argument("unknown writer policy: " + s);
}

const char* writerPolicyName(WriterPolicy p) {
  switch (p) { case WriterPolicy::Unsynchronized: return "unsynchronized";
               case WriterPolicy::PerKeyLock:     return "per_key_lock"; }
  return "unsynchronized";
}

std::string configuredTableName(const util::Config& cfg) {
  return cfg.tableName.empty() ? std::string(kDefaultTableName) : cfg.tableName;
}

TableOptions configuredTableOptions(const util::Config& cfg) {
  TableOptions o;
  o.concurrentReads  = cfg.concurrentReads;
  o.orderedKeys      = cfg.orderedKeys;
  o.publiclyWritable = cfg.publiclyWritable;
  o.globallyNamed    = cfg.globallyNamed;
  return o;
}

WriterPolicy configuredWriterPolicy(const util::Config& cfg) {
  return parseWriterPolicy(cfg.writerPolicy);
}

TableStorage::TableStorage()
  : TableStorage(std::string(kDefaultTableName)) {}

TableStorage::TableStorage(const std::string& tableName, WriterPolicy policy)
  : TableStorage(TableDirectory::instance().get(tableName), policy) {}

TableStorage::TableStorage(TableHandle table, WriterPolicy policy)
  : _table(std::move(table)), _policy(policy) {
  if (!_table) throw std::invalid_argument("TableStorage: null table handle");
}

TableStorage::TableStorage(const util::Config& cfg)
  : TableStorage(configuredTableName(cfg), configuredWriterPolicy(cfg)) {}

Status TableStorage::addCommand(const Path& path, const CommandRef& ref) {
  if (_policy == WriterPolicy::PerKeyLock && !path.empty()) {
    auto lock = _table->lockKey(path.front());
    return registry::add(path, ref, *_table);
  }
  return registry::add(path, ref, *_table);
}

Status TableStorage::removeCommand(const Path& path) {
  if (_policy == WriterPolicy::PerKeyLock && !path.empty()) {
    auto lock = _table->lockKey(path.front());
    return registry::remove(path, *_table);
  }
  return registry::remove(path, *_table);
}

std::optional<Entry> TableStorage::lookupCommand(const std::string& name) const {
  return registry::lookup(name, *_table);
}

Group TableStorage::allCommands() const {
  return registry::listAll(*_table);
}

} // namespace cmdreg
