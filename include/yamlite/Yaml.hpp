#pragma once

#include "yamlite/codec/Encoder.hpp"
#include "yamlite/codec/Value.hpp"
#include "yamlite/core/Error.hpp"
#include "yamlite/utils/Config.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace yamlite {

using codec::Value;

struct ParseResult {
    Value value;
    core::Status status;

    explicit operator bool() const noexcept { return status.ok(); }
};

/**
 * @brief Configured entry points for decoding, encoding and editing YAML documents.
 *
 * The instance only holds encoder options; every call is independent and nothing is
 * cached between calls. None of the members throw.
 */
class Yaml {
public:
    /// Receives the decoded document; returning nothing aborts Modify() without writing.
    using Mutator = std::function<std::optional<Value>(Value)>;

    Yaml() = default;
    explicit Yaml(codec::EncodeOptions options);

    const codec::EncodeOptions& Options() const noexcept { return m_options; }

    /**
     * @brief Merge option overrides, e.g. `{indent_width: 4}`, over the current options.
     *
     * Unknown keys and invalid values are reported in the result and logged; valid keys
     * still apply.
     */
    utils::ConfigLoadResult Setup(const Value& overrides);

    /// Decode in-memory text. Always succeeds; `Parse("")` is an empty mapping.
    static ParseResult Parse(std::string_view content);

    /// Decode a file. Fails with ErrorKind::Io when it cannot be read.
    ParseResult Read(const std::filesystem::path& path) const;

    std::string Encode(const Value& value) const;

    core::Status Write(const std::filesystem::path& path, const Value& value) const;

    /// Read `path`, pass the document through `mutator` and write the result back.
    core::Status Modify(const std::filesystem::path& path, const Mutator& mutator) const;

    static std::optional<Value> Get(const Value& data, std::string_view path);
    static Value& Set(Value& data, std::string_view path, Value value);

private:
    codec::EncodeOptions m_options;
};

} // namespace yamlite
