#pragma once

#include "yamlite/codec/Value.hpp"

#include <string>
#include <string_view>

namespace yamlite::codec::Scalar {

/**
 * @brief Interpret a bare (non-block) scalar literal.
 *
 * Input is trimmed first. Resolution order:
 * - `null`, `~` or empty: null
 * - `true`/`yes`/`on`, `false`/`no`/`off`: boolean
 * - `[]`, `{}`: empty sequence / empty mapping
 * - decimal or hexadecimal numeric literal: integer, or double when the literal has a
 *   fraction or exponent (or does not fit in 64 bits)
 * - `.nan`, `.inf`, `+.inf`, `-.inf`: non-finite double
 * - text wrapped in matching double or single quotes: the inner text, verbatim
 * - anything else: the text itself
 */
Value Parse(std::string_view literal);

/// Returns the value when `literal` is a complete numeric literal.
bool TryParseNumber(std::string_view literal, Value& out);

/// True when `text` starts and ends with the same quote character.
bool IsQuoted(std::string_view text);

std::string_view TrimView(std::string_view value);
std::string Trim(std::string_view value);

} // namespace yamlite::codec::Scalar
