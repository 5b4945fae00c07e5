#include "cmdreg/Registry.hpp"

#include "cmdreg/PathOps.hpp"
#include "cmdreg/util/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace cmdreg {
namespace registry {

namespace {

void requireNonEmpty(const Path& path, const char* op) {
  if (path.empty()) {
    throw std::invalid_argument(std::string("registry::") + op + ": empty path");
  }
}

Path tail(const Path& path) {
  return Path(path.begin() + 1, path.end());
}

// Re-anchor a path-level collision at the top-level name.
Error collision(const Path& path, const Error& inner, const char* verb) {
  Error e;
  e.kind = ErrorKind::LeafCollision;
  e.name = path.front();
  e.path = tail(path);

  if (inner.name.empty()) {
    e.message = "command `" + e.name + "` is a top-level command, cannot " + verb +
                " subcommand at `" + joinPath(e.path) + "`";
  } else {
    e.message = "command `" + e.name + " " + inner.name + "` is a leaf command, cannot " + verb +
                " subcommand at `" + joinPath(inner.path) + "`";
  }
  return e;
}

void logCollision(const CommandTable& table, const Error& e) {
  table.metrics().incCollisions();
  util::logger().log(
    util::LogLevel::Warn,
    "Leaf collision",
    { {"table", table.name()}, {"name", e.name}, {"path", joinPath(e.path)} }
  );
}

} // namespace

Result<Mutation> planAdd(const Path& path, const CommandRef& ref, const CommandTable& table) {
  requireNonEmpty(path, "add");

  Mutation m;
  m.key = path.front();

  if (path.size() == 1) {
    m.op = Mutation::Op::Put;
    m.value = ref;
    return m;
  }

  auto updated = path::insert(table.get(m.key), tail(path), ref);
  if (!updated) return collision(path, updated.error(), "add");

  m.op = Mutation::Op::Put;
  m.value = std::move(updated.value());
  return m;
}

Result<Mutation> planRemove(const Path& path, const CommandTable& table) {
  requireNonEmpty(path, "remove");

  Mutation m;
  m.key = path.front();

  auto existing = table.get(m.key);
  if (!existing) return m;

  if (path.size() == 1) {
    m.op = Mutation::Op::Erase;
    return m;
  }

  auto pruned = path::remove(*existing, tail(path));
  if (!pruned) return collision(path, pruned.error(), "remove");

  // Nothing under the name matched: leave the stored value alone.
  if (pruned.value() && *pruned.value() == *existing) return m;

  if (pruned.value()) {
    m.op = Mutation::Op::Put;
    m.value = std::move(*pruned.value());
  } else {
    m.op = Mutation::Op::Erase;
  }
  return m;
}

void apply(const Mutation& m, CommandTable& table) {
  switch (m.op) {
    case Mutation::Op::Put:   table.put(m.key, m.value); break;
    case Mutation::Op::Erase: table.erase(m.key); break;
    case Mutation::Op::None:  break;
  }
}

Status add(const Path& path, const CommandRef& ref, CommandTable& table) {
  auto plan = planAdd(path, ref, table);
  if (!plan) {
    logCollision(table, plan.error());
    return plan.error();
  }

  apply(plan.value(), table);
  table.metrics().incAdds();

  if (util::logger().enabled(util::LogLevel::Debug)) {
    util::logger().log(
      util::LogLevel::Debug,
      "Added command",
      { {"table", table.name()}, {"path", joinPath(path)}, {"ref", ref.id} }
    );
  }
  return ok();
}

Status remove(const Path& path, CommandTable& table) {
  auto plan = planRemove(path, table);
  if (!plan) {
    logCollision(table, plan.error());
    return plan.error();
  }

  apply(plan.value(), table);
  table.metrics().incRemoves();

  if (plan.value().op != Mutation::Op::None && util::logger().enabled(util::LogLevel::Debug)) {
    util::logger().log(
      util::LogLevel::Debug,
      plan.value().op == Mutation::Op::Erase ? "Removed top-level command" : "Removed command",
      { {"table", table.name()}, {"path", joinPath(path)} }
    );
  }
  return ok();
}

std::optional<Entry> lookup(const std::string& name, const CommandTable& table) {
  table.metrics().incLookups();
  return table.get(name);
}

std::optional<Entry> resolve(const Path& path, const CommandTable& table) {
  requireNonEmpty(path, "resolve");
  table.metrics().incLookups();

  auto top = table.get(path.front());
  if (!top) return std::nullopt;
  return path::find(*top, tail(path));
}

Group listAll(const CommandTable& table) {
  table.metrics().incSnapshots();
  return table.snapshot();
}

} // namespace registry
} // namespace cmdreg
