#pragma once

#include "cmdreg/CommandStorage.hpp"
#include "cmdreg/CommandTable.hpp"
#include "cmdreg/TableDirectory.hpp"

#include <memory>
#include <string>

namespace cmdreg {

namespace util { class Config; }

// Creates and owns one CommandTable for its lifetime.
//
// A globally named table is published in TableDirectory while the owner is
// alive. Destroying the owner unpublishes and closes the table; handles still
// held elsewhere then throw TableClosedError on use.
class RegistryOwner {
public:
  /// Throws TableExistsError if `options.globallyNamed` and the name is taken.
  static std::unique_ptr<RegistryOwner> start(const std::string& tableName = kDefaultTableName,
                                              TableOptions options = {});

  /// Table name, options, writer policy and logging from a configuration.
  /// Throws std::invalid_argument for an unknown writer policy.
  static std::unique_ptr<RegistryOwner> start(const util::Config& cfg);

private:
  struct Token { explicit Token() = default; };

public:
  RegistryOwner(Token, TableHandle table, WriterPolicy policy);

  ~RegistryOwner();

  RegistryOwner(const RegistryOwner&)            = delete;
  RegistryOwner& operator=(const RegistryOwner&) = delete;
  RegistryOwner(RegistryOwner&&)                 = delete;
  RegistryOwner& operator=(RegistryOwner&&)      = delete;

  TableHandle getTableHandle() const { return table_; }

  // Policy storages built for this table should use.
  WriterPolicy writerPolicy() const { return policy_; }

private:
  static std::unique_ptr<RegistryOwner> start(const std::string& tableName, TableOptions options,
                                              WriterPolicy policy);

  TableHandle table_;
  WriterPolicy policy_;
};

} // namespace cmdreg
