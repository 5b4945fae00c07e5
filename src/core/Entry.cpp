#include "cmdreg/Entry.hpp"

#include <ostream>

namespace cmdreg {

bool operator==(const Entry& a, const Entry& b) {
  if (a.isLeaf() != b.isLeaf()) return false;
  if (a.isLeaf()) return a.ref() == b.ref();
  return a.group() == b.group();
}

bool operator!=(const Entry& a, const Entry& b) {
  return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const CommandRef& ref) {
  return os << ref.id;
}

std::ostream& operator<<(std::ostream& os, const Entry& entry) {
  if (entry.isLeaf()) return os << entry.ref();
  return os << entry.group();
}

std::ostream& operator<<(std::ostream& os, const Group& group) {
  os << '{';
  bool first = true;
  for (const auto& kv : group) {
    if (!first) os << ", ";
    first = false;
    os << kv.first << ": " << kv.second;
  }
  return os << '}';
}

std::string joinPath(const Path& path) {
  std::string out;
  for (size_t i = 0; i < path.size(); ++i) {
    if (i) out += ' ';
    out += path[i];
  }
  return out;
}

} // namespace cmdreg
