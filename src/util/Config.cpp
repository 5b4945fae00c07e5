#include "cmdreg/util/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <string>

namespace cmdreg {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::parseBool(const std::string& v, bool def) {
  std::string x = v;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "1" || x == "true" || x == "yes" || x == "on")  return true;
  if (x == "0" || x == "false" || x == "no" || x == "off") return false;
  return def;
}

void Config::apply(const std::string& key, const std::string& val) {
  if      (key == "tableName")        { if (!val.empty()) tableName = val; }
  else if (key == "concurrentReads")  concurrentReads  = parseBool(val, concurrentReads);
  else if (key == "orderedKeys")      orderedKeys      = parseBool(val, orderedKeys);
  else if (key == "publiclyWritable") publiclyWritable = parseBool(val, publiclyWritable);
  else if (key == "globallyNamed")    globallyNamed    = parseBool(val, globallyNamed);
  else if (key == "writerPolicy")     { if (!val.empty()) writerPolicy = val; }
  else if (key == "logLevel")  logLevel = parseLevel(val);
  else if (key == "logFormat") logJson  = (val == "json");
  else if (key == "logFile")   logFile  = val;
  else {
    // Unknown key; ignore to stay forward-compatible
  }
}

void Config::loadFromString(const std::string& text) {
  // key=value per line, '#' or ';' start comments.
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;
    apply(key, val);
  }
}

bool Config::loadFromFile(const std::string& path) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string text;
  char tmp[1024];
  size_t n = 0;
  while ((n = std::fread(tmp, 1, sizeof(tmp), f)) > 0) {
    text.append(tmp, n);
  }
  const bool ok = std::ferror(f) == 0;
  std::fclose(f);

  if (ok) loadFromString(text);
  return ok;
}

void Config::applyLogging() const {
  logger().setLevel(logLevel);
  logger().setFormatJson(logJson);
  logger().setFile(logFile);
}

} // namespace util
} // namespace cmdreg
