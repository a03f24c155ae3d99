#pragma once

#include "yamlite/core/Error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace yamlite::utils {

/// Read the whole file into `out`. Fails with ErrorKind::Io carrying the OS reason.
core::Status ReadTextFile(const std::filesystem::path& path, std::string& out);

/// Create or truncate `path` and write `text` to it.
core::Status WriteTextFile(const std::filesystem::path& path, std::string_view text);

} // namespace yamlite::utils
