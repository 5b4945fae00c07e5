#pragma once

#include "cmdreg/CommandTable.hpp"
#include "cmdreg/Entry.hpp"
#include "cmdreg/Result.hpp"

#include <string>

namespace cmdreg {
namespace json {

// Leaves render as strings (the CommandRef id), groups as objects:
//   {"mod": {"ban": "H1", "kick": "H2"}, "ping": "H3"}

std::string toJson(const Group& group, bool pretty = false);

/// Parse the shape produced by toJson. Throws std::runtime_error on malformed
/// JSON, a non-object root, a non-string leaf or an empty group.
Group fromJson(const std::string& text);

/// Add every leaf of `doc` to `table` through registry::add, in key order.
/// Stops at the first LeafCollision; leaves added before it stay.
Result<size_t> seed(const Group& doc, CommandTable& table);

} // namespace json
} // namespace cmdreg
