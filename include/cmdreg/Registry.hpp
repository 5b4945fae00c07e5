#pragma once

#include "cmdreg/CommandTable.hpp"
#include "cmdreg/Entry.hpp"
#include "cmdreg/Result.hpp"

#include <optional>
#include <string>

namespace cmdreg {
namespace registry {

// A single-key write computed from the table state at planning time.
struct Mutation {
  enum class Op { None, Put, Erase };

  Op op = Op::None;
  std::string key;
  Entry value;   // meaningful for Put only
};

/// Compute the write `add(path, ref)` would perform. Reads `table` once.
Result<Mutation> planAdd(const Path& path, const CommandRef& ref, const CommandTable& table);

/// Compute the write `remove(path)` would perform. Reads `table` once.
/// A path that matches nothing plans Op::None.
Result<Mutation> planRemove(const Path& path, const CommandTable& table);

/// Commit a planned write. Does not re-read the table.
void apply(const Mutation& m, CommandTable& table);

/// Register `ref` at `path`.
///
/// A one-segment path overwrites the top-level entry unconditionally. Longer
/// paths are merged into the existing top-level group; descending through a
/// leaf returns a LeafCollision error and leaves the table unchanged.
///
/// The read and the write are not atomic together: a concurrent writer of the
/// same top-level name may be overwritten.
Status add(const Path& path, const CommandRef& ref, CommandTable& table);

/// Remove `path`, pruning groups left empty. Missing paths are a no-op.
Status remove(const Path& path, CommandTable& table);

/// Entry stored under a top-level name, or nullopt.
std::optional<Entry> lookup(const std::string& name, const CommandTable& table);

/// Entry at a full path, or nullopt.
std::optional<Entry> resolve(const Path& path, const CommandTable& table);

/// Copy of every top-level entry.
Group listAll(const CommandTable& table);

} // namespace registry
} // namespace cmdreg
