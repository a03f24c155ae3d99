#pragma once

#include "yamlite/codec/Value.hpp"

#include <string>
#include <string_view>

namespace yamlite::codec::Decoder {

/**
 * @brief Parse indentation-based YAML text into a value tree.
 *
 * Supported features:
 * - Block mappings (`key: value`) and block sequences (`- item`), nested by indentation
 *   (leading spaces only; tabs are not indentation)
 * - `- key: value` items opening a mapping inside a sequence, and bare `-` items
 * - Block scalars introduced by `|` or `>`; both join their lines with '\n'
 * - Scalars: quoted and plain strings, integers, floating point, booleans, null,
 *   empty `[]` and `{}`
 * - Full-line `#` comments and blank lines, which are dropped
 *
 * Decoding never fails. Lines that fit none of the shapes above, and lines that do not
 * fit the container they land in, are skipped. An empty document decodes to an empty
 * mapping; a document whose first entry is a `- ` item decodes to a sequence.
 */
Value Decode(std::string_view source);

/// Decode() in the bool-plus-error-string form of the structured file loaders.
/// In-memory text always succeeds; `error` is cleared.
bool Parse(std::string_view source, Value& out, std::string& error);

} // namespace yamlite::codec::Decoder
