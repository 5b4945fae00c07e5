#pragma once

#include "cmdreg/Entry.hpp"
#include "cmdreg/Result.hpp"

#include <optional>

namespace cmdreg {
namespace path {

/// Insert `ref` at `path` below `existing` and return the updated entry.
///
/// An absent `existing` is treated as an empty group. Missing intermediate
/// groups are created. The last segment overwrites whatever it names.
/// Descending through a CommandRef fails with LeafCollision; nothing is
/// produced in that case and the caller must not commit.
///
/// Throws std::invalid_argument for an empty path.
Result<Entry> insert(const std::optional<Entry>& existing, const Path& path, const CommandRef& ref);

/// A CommandRef is never empty. A group is empty iff all its children are.
bool isEmpty(const Entry& entry);

/// Remove `path` below `existing`.
///
/// Returns the pruned entry, or nullopt when nothing is left at this level and
/// the caller should drop it. Missing names are a no-op. Descending through a
/// CommandRef fails with LeafCollision.
///
/// Throws std::invalid_argument for an empty path.
Result<std::optional<Entry>> remove(const Entry& existing, const Path& path);

/// Walk `path` below `root`. Returns the entry it names, or nullopt.
std::optional<Entry> find(const Entry& root, const Path& path);

} // namespace path
} // namespace cmdreg
