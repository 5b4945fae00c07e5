#include "cmdreg/RegistryOwner.hpp"

#include "cmdreg/util/Config.hpp"
#include "cmdreg/util/Logger.hpp"

#include <utility>

namespace cmdreg {

RegistryOwner::RegistryOwner(Token, TableHandle table, WriterPolicy policy)
  : table_(std::move(table)), policy_(policy) {}

std::unique_ptr<RegistryOwner> RegistryOwner::start(const std::string& tableName, TableOptions options) {
  return start(tableName, options, WriterPolicy::Unsynchronized);
}

std::unique_ptr<RegistryOwner> RegistryOwner::start(const std::string& tableName, TableOptions options,
                                                    WriterPolicy policy) {
  auto table = std::make_shared<CommandTable>(tableName, options);
  if (options.globallyNamed) {
    TableDirectory::instance().registerTable(table);
  }

  util::logger().log(
    util::LogLevel::Info,
    "Registry started",
    { {"table", tableName},
      {"named", options.globallyNamed ? "true" : "false"},
      {"policy", writerPolicyName(policy)} }
  );

  return std::make_unique<RegistryOwner>(Token{}, std::move(table), policy);
}

std::unique_ptr<RegistryOwner> RegistryOwner::start(const util::Config& cfg) {
  const WriterPolicy policy = configuredWriterPolicy(cfg);
  cfg.applyLogging();
  return start(configuredTableName(cfg), configuredTableOptions(cfg), policy);
}

RegistryOwner::~RegistryOwner() {
  if (table_->options().globallyNamed) {
    TableDirectory::instance().unregisterTable(*table_);
  }
  table_->close();

  util::logger().log(
    util::LogLevel::Info,
    "Registry stopped",
    { {"table", table_->name()} }
  );
}

} // namespace cmdreg
