#include "yamlite/Yaml.hpp"

#include "yamlite/codec/Decoder.hpp"
#include "yamlite/codec/PathAccessor.hpp"
#include "yamlite/core/Logger.hpp"
#include "yamlite/utils/TextFile.hpp"

#include <exception>
#include <utility>

namespace yamlite {

using core::Logger;
using core::Status;

Yaml::Yaml(codec::EncodeOptions options)
    : m_options(std::move(options)) {}

utils::ConfigLoadResult Yaml::Setup(const Value& overrides) {
    utils::ConfigLoadResult result;
    result.options = m_options;
    utils::ConfigLoader::ApplyOverrides(overrides, result);
    m_options = result.options;

    for (const auto& warning : result.warnings) {
        Logger::Warning("[Yaml] {}", warning);
    }
    for (const auto& error : result.errors) {
        Logger::Error("[Yaml] {}", error);
    }
    return result;
}

ParseResult Yaml::Parse(std::string_view content) {
    return ParseResult{codec::Decoder::Decode(content), Status::Ok()};
}

ParseResult Yaml::Read(const std::filesystem::path& path) const {
    std::string content;
    Status status = utils::ReadTextFile(path, content);
    if (!status) {
        Logger::Warning("[Yaml] {}", status.message());
        return ParseResult{Value(), std::move(status)};
    }
    return Parse(content);
}

std::string Yaml::Encode(const Value& value) const {
    return codec::Encoder::Encode(value, m_options);
}

Status Yaml::Write(const std::filesystem::path& path, const Value& value) const {
    Status status = utils::WriteTextFile(path, Encode(value));
    if (!status) {
        Logger::Warning("[Yaml] {}", status.message());
    }
    return status;
}

Status Yaml::Modify(const std::filesystem::path& path, const Mutator& mutator) const {
    ParseResult document = Read(path);
    if (!document) {
        return document.status;
    }
    if (!mutator) {
        return Status::MutatorFailure("No modifier function supplied");
    }

    std::optional<Value> modified;
    try {
        modified = mutator(std::move(document.value));
    } catch (const std::exception& e) {
        Logger::Error("[Yaml] Modifier for '{}' threw: {}", path.string(), e.what());
        return Status::MutatorFailure(std::string("Modifier function failed: ") + e.what());
    } catch (...) {
        Logger::Error("[Yaml] Modifier for '{}' threw a non-standard exception", path.string());
        return Status::MutatorFailure("Modifier function failed: unknown exception");
    }
    if (!modified) {
        Logger::Warning("[Yaml] Modifier for '{}' returned nothing, file left unchanged", path.string());
        return Status::MutatorFailure("Modifier function returned nothing");
    }
    return Write(path, *modified);
}

std::optional<Value> Yaml::Get(const Value& data, std::string_view path) {
    return codec::PathAccessor::Get(data, path);
}

Value& Yaml::Set(Value& data, std::string_view path, Value value) {
    return codec::PathAccessor::Set(data, path, std::move(value));
}

} // namespace yamlite
