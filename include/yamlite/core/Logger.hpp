#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace yamlite::core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Process-wide diagnostics sink shared by the codec, the config loader and the tools.
 *
 * Each message becomes one `[YYYY-MM-DD HH:MM:SS.mmm] [Level] message` line, printed to
 * stderr and handed to every registered listener. Debug lines only exist in builds
 * compiled with YAMLITE_DEBUG; YAMLITE_LOG_DEBUG=0 silences them at runtime.
 */
class Logger {
public:
    using Listener = std::function<void(LogLevel, const std::string&)>;

    template<typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
#ifdef YAMLITE_DEBUG
        if (IsDebugEnabled()) {
            Write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
        }
#else
        (void)format;
        ((void)args, ...);
#endif
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    /// False unless built with YAMLITE_DEBUG and not switched off through YAMLITE_LOG_DEBUG.
    static bool IsDebugEnabled();

    /// Listeners keep receiving every line while the console is muted.
    static void SetConsoleEnabled(bool enabled);

    /// Returns a token for UnregisterListener(), or 0 for an empty callback.
    static std::size_t RegisterListener(Listener listener);
    static void UnregisterListener(std::size_t token);

private:
    static void Write(LogLevel level, const std::string& message);
};

} // namespace yamlite::core
