#pragma once

#include <nlohmann/json.hpp>

namespace yamlite::codec {

/**
 * @brief Dynamically-shaped document tree.
 *
 * Variants: null, boolean, number (integer, unsigned or floating point), string,
 * sequence (array) and mapping (object). The variant tag is stored explicitly, so an
 * empty sequence and an empty mapping never collapse into each other. Mappings keep
 * keys in insertion order.
 */
using Value = nlohmann::ordered_json;
using ValueType = Value::value_t;

inline bool IsContainer(const Value& value) {
    return value.is_array() || value.is_object();
}

} // namespace yamlite::codec
