#include "cmdreg/json/JsonCodec.hpp"

#include "cmdreg/Registry.hpp"
#include "cmdreg/util/Logger.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cmdreg {
namespace json {

namespace {

template <typename Writer>
void writeGroup(Writer& w, const Group& group) {
  w.StartObject();
  for (const auto& kv : group) {
    w.Key(kv.first.c_str(), static_cast<rapidjson::SizeType>(kv.first.size()));
    if (kv.second.isLeaf()) {
      const auto& id = kv.second.ref().id;
      w.String(id.c_str(), static_cast<rapidjson::SizeType>(id.size()));
    } else {
      writeGroup(w, kv.second.group());
    }
  }
  w.EndObject();
}

Group readGroup(const rapidjson::Value& v, const std::string& where) {
  if (!v.IsObject()) {
    throw std::runtime_error("JSON node at '" + where + "' must be an object");
  }
  if (v.MemberCount() == 0 && !where.empty()) {
    throw std::runtime_error("JSON group at '" + where + "' is empty");
  }

  Group out;
  for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
    std::string name(it->name.GetString(), it->name.GetStringLength());
    const std::string at = where.empty() ? name : where + " " + name;

    if (it->value.IsString()) {
      out[name] = CommandRef(std::string(it->value.GetString(), it->value.GetStringLength()));
    } else if (it->value.IsObject()) {
      out[name] = readGroup(it->value, at);
    } else {
      throw std::runtime_error("JSON leaf at '" + at + "' must be a string");
    }
  }
  return out;
}

void collect(const Group& group, Path& prefix, std::vector<std::pair<Path, CommandRef>>& out) {
  for (const auto& kv : group) {
    prefix.push_back(kv.first);
    if (kv.second.isLeaf()) out.emplace_back(prefix, kv.second.ref());
    else                    collect(kv.second.group(), prefix, out);
    prefix.pop_back();
  }
}

} // namespace

std::string toJson(const Group& group, bool pretty) {
  rapidjson::StringBuffer sb;
  if (pretty) {
    rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
    writeGroup(w, group);
  } else {
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    writeGroup(w, group);
  }
  return std::string(sb.GetString(), sb.GetSize());
}

Group fromJson(const std::string& text) {
  rapidjson::Document doc;
  if (doc.Parse(text.c_str(), text.size()).HasParseError()) {
    throw std::runtime_error(
      std::string("Malformed JSON at offset ") + std::to_string(doc.GetErrorOffset()) +
      ": " + rapidjson::GetParseError_En(doc.GetParseError()));
  }
  return readGroup(doc, "");
}

Result<size_t> seed(const Group& doc, CommandTable& table) {
  std::vector<std::pair<Path, CommandRef>> leaves;
  Path prefix;
  collect(doc, prefix, leaves);

  size_t added = 0;
  for (const auto& leaf : leaves) {
    auto st = registry::add(leaf.first, leaf.second, table);
    if (!st) return st.error();
    ++added;
  }

  util::logger().log(
    util::LogLevel::Info,
    "Seeded table",
    { {"table", table.name()}, {"commands", std::to_string(added)} }
  );
  return added;
}

} // namespace json
} // namespace cmdreg
