#pragma once

#include "yamlite/codec/Value.hpp"

#include <string>
#include <string_view>

namespace yamlite::codec {

/// How plain strings that look like another scalar type are protected.
enum class QuotingMode {
    /// Quote every string the decoder would not read back as the same string
    /// (`true`, `no`, `null`, `~`, `-5`, `1e3`, the empty string, ...).
    Reserved,
    /// Only the historical single-character test: a one-character string made of
    /// the letters in `true|false|yes|no|on|off|null`.
    Legacy
};

struct EncodeOptions {
    int indentWidth = 2;
    QuotingMode quoting = QuotingMode::Reserved;
};

namespace Encoder {

/**
 * @brief Serialize a value tree as block-style YAML.
 *
 * Mapping keys are emitted in ascending byte order, never in insertion order.
 * Containers render without the leading newline and without a trailing newline;
 * scalars render as their bare scalar text.
 */
std::string Encode(const Value& value, const EncodeOptions& options = {});

/// Plain or double-quoted form of `text`, as used for string values and mapping keys.
std::string FormatString(std::string_view text, QuotingMode mode = QuotingMode::Reserved);

bool NeedsQuotes(std::string_view text, QuotingMode mode);

} // namespace Encoder

} // namespace yamlite::codec
