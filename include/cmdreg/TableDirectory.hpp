#pragma once

#include "cmdreg/CommandTable.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdreg {

inline constexpr const char* kDefaultTableName = "cmdreg_commands";

// Process-wide directory of globally named tables.
class TableDirectory {
public:
  static TableDirectory& instance();

  /// Publish `table` under its name. Throws TableExistsError if the name is taken.
  void registerTable(const TableHandle& table);

  /// Forget `table` if it is the one published under its name.
  void unregisterTable(const CommandTable& table);

  /// Lookup a table by name. Returns nullptr if not found.
  TableHandle find(const std::string& name) const;

  /// Lookup a table by name. Throws TableNotFoundError if not found.
  TableHandle get(const std::string& name) const;

  std::vector<std::string> names() const;

private:
  mutable std::mutex _mutex;
  std::unordered_map<std::string, std::weak_ptr<CommandTable>> _tables;
};

} // namespace cmdreg
