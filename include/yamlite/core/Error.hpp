#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace yamlite::core {

/// Failure categories reported across the public API. Malformed YAML text is not one
/// of them: the decoder accepts any input and returns a best-effort tree.
enum class ErrorKind {
    None,
    Io,
    Mutator
};

constexpr const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:    return "None";
        case ErrorKind::Io:      return "IoError";
        case ErrorKind::Mutator: return "MutatorError";
    }
    return "Unknown";
}

/**
 * @brief Success flag plus a human-readable message.
 *
 * Returned by every fallible operation instead of throwing. Callers test it with
 * `if (!status)` before touching any output parameter.
 */
class Status {
public:
    Status() = default;

    static Status Ok() { return Status(); }
    static Status IoFailure(std::string_view operation,
                            std::string_view path,
                            std::string reason);
    static Status MutatorFailure(std::string message);

    bool ok() const noexcept { return m_kind == ErrorKind::None; }
    explicit operator bool() const noexcept { return ok(); }

    ErrorKind kind() const noexcept { return m_kind; }
    const std::string& message() const noexcept { return m_message; }

private:
    Status(ErrorKind kind, std::string message)
        : m_kind(kind), m_message(std::move(message)) {}

    static std::string BuildIoMessage(std::string_view operation,
                                      std::string_view path,
                                      const std::string& reason);

    ErrorKind m_kind = ErrorKind::None;
    std::string m_message;
};

inline std::string Status::BuildIoMessage(std::string_view operation,
                                          std::string_view path,
                                          const std::string& reason) {
    std::string message;
    message.reserve(operation.size() + path.size() + reason.size() + 8);
    message.append(operation);
    message.append(" '");
    message.append(path);
    message.append("'");
    if (!reason.empty()) {
        message.append(": ");
        message.append(reason);
    }
    return message;
}

inline Status Status::IoFailure(std::string_view operation,
                                std::string_view path,
                                std::string reason) {
    return Status(ErrorKind::Io, BuildIoMessage(operation, path, reason));
}

inline Status Status::MutatorFailure(std::string message) {
    return Status(ErrorKind::Mutator, std::move(message));
}

} // namespace yamlite::core
