#pragma once

#include "cmdreg/util/Logger.hpp"

#include <string>

namespace cmdreg {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Same format, from an in-memory string.
  void loadFromString(const std::string& text);

  // Table
  std::string tableName;           // empty -> well-known default table
  bool        concurrentReads  = true;
  bool        orderedKeys      = true;
  bool        publiclyWritable = true;
  bool        globallyNamed    = true;
  std::string writerPolicy     = "unsynchronized";   // validated where it is used

  // Logging
  LogLevel    logLevel  = LogLevel::Info;
  bool        logJson   = false;
  std::string logFile;             // empty -> stdout

  // Push the logging knobs into util::logger().
  void applyLogging() const;

private:
  void apply(const std::string& key, const std::string& val);
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static bool parseBool(const std::string& v, bool def);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace cmdreg
