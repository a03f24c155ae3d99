#pragma once

#include "yamlite/codec/Value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace yamlite::codec::PathAccessor {

/// Split "a.b.c" into {"a", "b", "c"}. Empty segments are dropped.
std::vector<std::string> SplitPath(std::string_view path);

/// Value stored at `path`, or nullptr when a segment is missing or an intermediate
/// node is not a mapping. An empty path yields `tree` itself.
const Value* Find(const Value& tree, std::string_view path);

/// Copying variant of Find(). An explicit null stored at `path` is present.
std::optional<Value> Get(const Value& tree, std::string_view path);

bool Contains(const Value& tree, std::string_view path);

/**
 * @brief Store `value` at `path`, creating intermediate mappings.
 *
 * Any intermediate node that is not a mapping (the root included) is replaced by an
 * empty mapping, discarding its previous content. An empty path leaves the tree as is.
 *
 * @return `tree`, for chaining
 */
Value& Set(Value& tree, std::string_view path, Value value);

} // namespace yamlite::codec::PathAccessor
