#include "cmdreg/PathOps.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace cmdreg {
namespace path {

namespace {

void requireNonEmpty(const Path& p, const char* op) {
  if (p.empty()) {
    throw std::invalid_argument(std::string("path::") + op + ": empty path");
  }
}

// `traversed` names the leaf relative to the root handed to the public call.
Error leafCollision(const Path& traversed, const Path& p, size_t i, const char* verb) {
  Error e;
  e.kind = ErrorKind::LeafCollision;
  e.name = joinPath(traversed);
  e.path.assign(p.begin() + static_cast<std::ptrdiff_t>(i), p.end());
  e.message = "command `" + e.name + "` is a leaf, cannot " + verb +
              " subcommand at `" + joinPath(e.path) + "`";
  return e;
}

Result<Entry> insertAt(const std::optional<Entry>& existing, const Path& p, size_t i,
                       const CommandRef& ref, Path& traversed) {
  if (existing && existing->isLeaf()) {
    return leafCollision(traversed, p, i, "add");
  }

  Group group = existing ? existing->group() : Group{};
  const std::string& name = p[i];

  if (i + 1 == p.size()) {
    group[name] = ref;
    return Entry(std::move(group));
  }

  std::optional<Entry> child;
  auto it = group.find(name);
  if (it != group.end()) child = it->second;

  traversed.push_back(name);
  auto sub = insertAt(child, p, i + 1, ref, traversed);
  if (!sub) return sub.error();

  group[name] = std::move(sub.value());
  return Entry(std::move(group));
}

Result<std::optional<Entry>> removeAt(const Entry& existing, const Path& p, size_t i,
                                      Path& traversed) {
  if (existing.isLeaf()) {
    return leafCollision(traversed, p, i, "remove");
  }

  Group group = existing.group();
  const std::string& name = p[i];

  if (i + 1 == p.size()) {
    group.erase(name);
  } else {
    auto it = group.find(name);
    if (it != group.end()) {
      traversed.push_back(name);
      auto sub = removeAt(it->second, p, i + 1, traversed);
      if (!sub) return sub.error();

      if (sub.value()) it->second = std::move(*sub.value());
      else             group.erase(it);
    }
  }

  Group kept;
  for (auto& kv : group) {
    if (!isEmpty(kv.second)) kept.emplace(kv.first, std::move(kv.second));
  }
  if (kept.empty()) return std::optional<Entry>{};
  return std::optional<Entry>(Entry(std::move(kept)));
}

} // namespace

Result<Entry> insert(const std::optional<Entry>& existing, const Path& p, const CommandRef& ref) {
  requireNonEmpty(p, "insert");
  Path traversed;
  return insertAt(existing, p, 0, ref, traversed);
}

bool isEmpty(const Entry& entry) {
  if (entry.isLeaf()) return false;
  for (const auto& kv : entry.group()) {
    if (!isEmpty(kv.second)) return false;
  }
  return true;
}

Result<std::optional<Entry>> remove(const Entry& existing, const Path& p) {
  requireNonEmpty(p, "remove");
  Path traversed;
  return removeAt(existing, p, 0, traversed);
}

std::optional<Entry> find(const Entry& root, const Path& p) {
  const Entry* cur = &root;
  for (const auto& name : p) {
    if (!cur->isGroup()) return std::nullopt;
    const auto& g = cur->group();
    auto it = g.find(name);
    if (it == g.end()) return std::nullopt;
    cur = &it->second;
  }
  return *cur;
}

} // namespace path
} // namespace cmdreg
