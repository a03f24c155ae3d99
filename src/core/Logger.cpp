#include "yamlite/core/Logger.hpp"

#include <fmt/chrono.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string_view>
#include <vector>

namespace yamlite::core {

namespace {

struct ListenerEntry {
    std::size_t token = 0;
    Logger::Listener callback;
};

struct LoggerState {
    std::mutex mutex;
    std::vector<ListenerEntry> listeners;
    std::size_t nextToken = 1;
    std::atomic<bool> consoleEnabled{true};
};

LoggerState& State() {
    static LoggerState state;
    return state;
}

std::string_view LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "Debug";
        case LogLevel::Info:    return "Info";
        case LogLevel::Warning: return "Warning";
        case LogLevel::Error:   return "Error";
    }
    return "Unknown";
}

std::string Timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}",
                       fmt::localtime(system_clock::to_time_t(now)),
                       ms.count());
}

#ifdef YAMLITE_DEBUG
// Unset means on; only an explicit 0/false/off/no turns debug output off.
bool ReadDebugSwitch() {
    const char* env = std::getenv("YAMLITE_LOG_DEBUG");
    if (!env) {
        return true;
    }
    std::string value(env);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !(value == "0" || value == "false" || value == "off" || value == "no");
}
#endif

} // namespace

bool Logger::IsDebugEnabled() {
#ifdef YAMLITE_DEBUG
    static const bool enabled = ReadDebugSwitch();
    return enabled;
#else
    return false;
#endif
}

void Logger::SetConsoleEnabled(bool enabled) {
    State().consoleEnabled.store(enabled, std::memory_order_release);
}

std::size_t Logger::RegisterListener(Listener listener) {
    if (!listener) {
        return 0;
    }
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    const std::size_t token = state.nextToken++;
    state.listeners.push_back(ListenerEntry{token, std::move(listener)});
    return token;
}

void Logger::UnregisterListener(std::size_t token) {
    if (token == 0) {
        return;
    }
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    std::erase_if(state.listeners, [token](const ListenerEntry& entry) { return entry.token == token; });
}

void Logger::Write(LogLevel level, const std::string& message) {
    const std::string line = fmt::format("[{}] [{}] {}", Timestamp(), LevelName(level), message);
    auto& state = State();

    if (state.consoleEnabled.load(std::memory_order_acquire)) {
        fmt::print(stderr, "{}\n", line);
    }

    // Listeners run outside the lock so they may log or unregister themselves.
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        listeners.reserve(state.listeners.size());
        for (const auto& entry : state.listeners) {
            listeners.push_back(entry.callback);
        }
    }
    for (const auto& listener : listeners) {
        listener(level, line);
    }
}

} // namespace yamlite::core
