#pragma once

#include "cmdreg/CommandTable.hpp"
#include "cmdreg/Entry.hpp"
#include "cmdreg/Result.hpp"

#include <optional>
#include <string>

namespace cmdreg {

namespace util { class Config; }

// Storage boundary a command framework implements against.
class CommandStorage {
public:
  virtual ~CommandStorage() = default;

  virtual Status addCommand(const Path& path, const CommandRef& ref) = 0;
  virtual Status removeCommand(const Path& path) = 0;
  virtual std::optional<Entry> lookupCommand(const std::string& name) const = 0;
  virtual Group allCommands() const = 0;
};

enum class WriterPolicy : int {
  Unsynchronized = 0,   // read-modify-write races; last writer of a key wins
  PerKeyLock     = 1    // writers of the same top-level name are serialized
};

WriterPolicy parseWriterPolicy(const std::string& s);
const char* writerPolicyName(WriterPolicy p);

// Table section of a configuration.
std::string configuredTableName(const util::Config& cfg);
TableOptions configuredTableOptions(const util::Config& cfg);
WriterPolicy configuredWriterPolicy(const util::Config& cfg);  // throws std::invalid_argument

// CommandStorage over a CommandTable.
class TableStorage : public CommandStorage {
public:
  // Uses the table published under kDefaultTableName. Throws TableNotFoundError.
  TableStorage();
  explicit TableStorage(const std::string& tableName,
                        WriterPolicy policy = WriterPolicy::Unsynchronized);
  explicit TableStorage(TableHandle table,
                        WriterPolicy policy = WriterPolicy::Unsynchronized);
  // Table name and writer policy from a configuration.
  explicit TableStorage(const util::Config& cfg);

  Status addCommand(const Path& path, const CommandRef& ref) override;
  Status removeCommand(const Path& path) override;
  std::optional<Entry> lookupCommand(const std::string& name) const override;
  Group allCommands() const override;

  const TableHandle& table() const { return _table; }
  WriterPolicy policy() const { return _policy; }

private:
  TableHandle _table;
  WriterPolicy _policy;
};

} // namespace cmdreg
