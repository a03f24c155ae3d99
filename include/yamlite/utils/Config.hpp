#pragma once

#include "yamlite/codec/Encoder.hpp"
#include "yamlite/codec/Value.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace yamlite::utils {

struct ConfigLoadResult {
    codec::EncodeOptions options;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Values that were out of range and got clamped
    std::vector<std::string> warnings;    // Unknown keys, wrong types, unreadable files

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

/**
 * @brief Encoder options from a YAML file, option mappings and the environment.
 *
 * File layout:
 * @code
 * encoder:
 *   indent_width: 4
 *   quoting: legacy
 * @endcode
 */
class ConfigLoader {
public:
    static ConfigLoadResult Load(const std::filesystem::path& path);

    /// Merge the recognised keys of `overrides` (`indent_width`, `quoting`) over
    /// `result.options`, validating as it goes. A non-mapping is ignored.
    static void ApplyOverrides(const codec::Value& overrides, ConfigLoadResult& result);

    /// Apply YAMLITE_INDENT_WIDTH when it is set.
    static void ApplyEnvironment(ConfigLoadResult& result);

private:
    /// `requested` clamped to 1..8; out-of-range values add an error naming `shown`.
    static int ClampIndentWidth(std::int64_t requested, std::string_view shown, ConfigLoadResult& result);
};

} // namespace yamlite::utils
