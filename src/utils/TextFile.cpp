#include "yamlite/utils/TextFile.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

namespace yamlite::utils {

namespace {

std::string LastErrorReason() {
    const int error = errno;
    if (error == 0) {
        return "unknown error";
    }
    return std::error_code(error, std::generic_category()).message();
}

} // namespace

core::Status ReadTextFile(const std::filesystem::path& path, std::string& out) {
    errno = 0;
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        return core::Status::IoFailure("Failed to open file", path.string(), LastErrorReason());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return core::Status::IoFailure("Failed to read file", path.string(), LastErrorReason());
    }
    out = buffer.str();
    return core::Status::Ok();
}

core::Status WriteTextFile(const std::filesystem::path& path, std::string_view text) {
    errno = 0;
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file) {
        return core::Status::IoFailure("Failed to open file for writing", path.string(), LastErrorReason());
    }

    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.close();
    if (!file) {
        return core::Status::IoFailure("Failed to write file", path.string(), LastErrorReason());
    }
    return core::Status::Ok();
}

} // namespace yamlite::utils
