#include "yamlite/utils/Config.hpp"

#include "yamlite/codec/Decoder.hpp"
#include "yamlite/codec/PathAccessor.hpp"
#include "yamlite/core/Logger.hpp"
#include "yamlite/utils/TextFile.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <system_error>
#include <fmt/format.h>

namespace yamlite::utils {

namespace {

// Indentation constraints
constexpr int kMinIndentWidth = 1;
constexpr int kMaxIndentWidth = 8;

constexpr const char* kIndentWidthKey = "indent_width";
constexpr const char* kQuotingKey = "quoting";

template <typename T>
static T GetOrDefault(const codec::Value& obj, const char* key, const T& fallback,
                      ConfigLoadResult& result) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const codec::Value::exception& e) {
        result.warnings.push_back(fmt::format("Failed to parse key '{}': {}", key, e.what()));
        return fallback;
    }
}

std::string ToLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    ConfigLoadResult result;

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        core::Logger::Warning("[ConfigLoader] Config file '{}' not found, using defaults",
                              path.empty() ? "<none>" : path.string());
        return result;
    }

    std::string source;
    const core::Status status = ReadTextFile(path, source);
    if (!status) {
        core::Logger::Error("[ConfigLoader] {}", status.message());
        result.warnings.push_back(status.message());
        return result;
    }

    const codec::Value document = codec::Decoder::Decode(source);
    if (const codec::Value* encoder = codec::PathAccessor::Find(document, "encoder")) {
        ApplyOverrides(*encoder, result);
    } else {
        result.warnings.push_back(
            fmt::format("No 'encoder' section in '{}', using defaults", path.string()));
    }
    result.loadedFromFile = true;

    for (const auto& warning : result.warnings) {
        core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        core::Logger::Error("[ConfigLoader] {}", error);
    }
    core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());

    return result;
}

void ConfigLoader::ApplyOverrides(const codec::Value& overrides, ConfigLoadResult& result) {
    if (!overrides.is_object()) {
        if (!overrides.is_null()) {
            result.warnings.push_back("Encoder options must be a mapping, ignoring");
        }
        return;
    }

    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        if (it.key() != kIndentWidthKey && it.key() != kQuotingKey) {
            result.warnings.push_back(fmt::format("Unknown encoder option '{}'", it.key()));
        }
    }

    if (auto it = overrides.find(kIndentWidthKey); it != overrides.end() && !it->is_null()) {
        if (it->is_number_unsigned()) {
            const auto requested = GetOrDefault<std::uint64_t>(overrides, kIndentWidthKey, 0, result);
            result.options.indentWidth = ClampIndentWidth(
                requested > static_cast<std::uint64_t>(kMaxIndentWidth) ? kMaxIndentWidth + 1
                                                                         : static_cast<std::int64_t>(requested),
                fmt::format("{}", requested), result);
        } else if (it->is_number_integer()) {
            const auto requested = GetOrDefault<std::int64_t>(overrides, kIndentWidthKey,
                                                               result.options.indentWidth, result);
            result.options.indentWidth = ClampIndentWidth(requested, fmt::format("{}", requested), result);
        } else {
            result.warnings.push_back(
                fmt::format("'{}' must be an integer, got {}", kIndentWidthKey, it->type_name()));
        }
    }

    const std::string quoting = ToLowerCopy(GetOrDefault<std::string>(overrides, kQuotingKey, "", result));
    if (quoting == "reserved") {
        result.options.quoting = codec::QuotingMode::Reserved;
    } else if (quoting == "legacy") {
        result.options.quoting = codec::QuotingMode::Legacy;
    } else if (!quoting.empty()) {
        result.warnings.push_back(
            fmt::format("Unknown quoting mode '{}', expected 'reserved' or 'legacy'", quoting));
    }
}

void ConfigLoader::ApplyEnvironment(ConfigLoadResult& result) {
    const char* env = std::getenv("YAMLITE_INDENT_WIDTH");
    if (!env) {
        return;
    }
    const std::string_view text(env);
    std::int64_t width = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), width);
    if (ec == std::errc::result_out_of_range) {
        result.options.indentWidth = ClampIndentWidth(
            text.front() == '-' ? kMinIndentWidth - 1 : kMaxIndentWidth + 1, text, result);
        return;
    }
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        result.warnings.push_back(fmt::format("Ignoring YAMLITE_INDENT_WIDTH='{}': not an integer", text));
        return;
    }
    result.options.indentWidth = ClampIndentWidth(width, text, result);
}

int ConfigLoader::ClampIndentWidth(std::int64_t requested, std::string_view shown,
                                   ConfigLoadResult& result) {
    if (requested < kMinIndentWidth || requested > kMaxIndentWidth) {
        result.errors.push_back(
            fmt::format("indent_width ({}) must be between {} and {}",
                        shown, kMinIndentWidth, kMaxIndentWidth));
        // Clamp to valid range
        return requested < kMinIndentWidth ? kMinIndentWidth : kMaxIndentWidth;
    }
    return static_cast<int>(requested);
}

} // namespace yamlite::utils
