#pragma once

#include <iosfwd>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cmdreg {

// Opaque handle to a registered handler. Stored verbatim, compared by value.
struct CommandRef {
  std::string id;

  CommandRef() = default;
  explicit CommandRef(std::string id) : id(std::move(id)) {}

  friend bool operator==(const CommandRef& a, const CommandRef& b) { return a.id == b.id; }
  friend bool operator!=(const CommandRef& a, const CommandRef& b) { return a.id != b.id; }
};

// Forward declare the entry first so Group can name it
struct Entry;

// Ordered name -> entry mapping
using Group = std::map<std::string, Entry>;

// Non-empty sequence of names, top-level name first
using Path = std::vector<std::string>;

// Leaf(CommandRef) | Group
struct Entry {
  std::variant<CommandRef, Group> value;

  Entry() = default;
  Entry(const CommandRef& ref) : value(ref) {}
  Entry(CommandRef&& ref) : value(std::move(ref)) {}
  Entry(const Group& group) : value(group) {}
  Entry(Group&& group) : value(std::move(group)) {}

  bool isLeaf() const { return std::holds_alternative<CommandRef>(value); }
  bool isGroup() const { return std::holds_alternative<Group>(value); }

  const CommandRef& ref() const { return std::get<CommandRef>(value); }
  const Group& group() const { return std::get<Group>(value); }
  Group& group() { return std::get<Group>(value); }
};

bool operator==(const Entry& a, const Entry& b);
bool operator!=(const Entry& a, const Entry& b);

std::ostream& operator<<(std::ostream& os, const CommandRef& ref);
std::ostream& operator<<(std::ostream& os, const Entry& entry);
std::ostream& operator<<(std::ostream& os, const Group& group);

// "a b c"
std::string joinPath(const Path& path);

} // namespace cmdreg
