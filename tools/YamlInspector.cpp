#include "yamlite/Yaml.hpp"
#include "yamlite/utils/Config.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace {

struct Arguments {
    std::filesystem::path input;
    std::filesystem::path config;
    std::optional<std::string> query;
    std::optional<int> indentWidth;
    bool legacyQuoting = false;
};

void PrintUsage() {
    fmt::print("Usage: yamlite_inspect <file.yaml> [--get <dotted.path>] [--indent <n>]\n"
               "                       [--legacy-quoting] [--config <options.yaml>]\n");
}

bool ParseArguments(int argc, char** argv, Arguments& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--get" && hasValue) {
            args.query = argv[++i];
        } else if (arg == "--indent" && hasValue) {
            const std::string_view text = argv[++i];
            int width = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), width);
            if (ec != std::errc() || ptr != text.data() + text.size()) {
                fmt::print(stderr, "Error: --indent expects an integer, got '{}'.\n", text);
                return false;
            }
            args.indentWidth = width;
        } else if (arg == "--config" && hasValue) {
            args.config = argv[++i];
        } else if (arg == "--legacy-quoting") {
            args.legacyQuoting = true;
        } else if (!arg.empty() && arg.front() != '-' && args.input.empty()) {
            args.input = std::filesystem::path(arg);
        } else {
            fmt::print(stderr, "Error: unexpected argument '{}'.\n", arg);
            return false;
        }
    }
    return !args.input.empty();
}

} // namespace

int main(int argc, char** argv) {
    Arguments args;
    if (!ParseArguments(argc, argv, args)) {
        PrintUsage();
        return EXIT_FAILURE;
    }

    yamlite::utils::ConfigLoadResult config;
    if (!args.config.empty()) {
        config = yamlite::utils::ConfigLoader::Load(args.config);
    }
    yamlite::utils::ConfigLoader::ApplyEnvironment(config);

    yamlite::Yaml yaml(config.options);
    yamlite::Value overrides = yamlite::Value::object();
    if (args.indentWidth) {
        overrides["indent_width"] = *args.indentWidth;
    }
    if (args.legacyQuoting) {
        overrides["quoting"] = "legacy";
    }
    if (yaml.Setup(overrides).HasErrors()) {
        return EXIT_FAILURE;
    }

    const yamlite::ParseResult document = yaml.Read(args.input);
    if (!document) {
        fmt::print(stderr, "Error: {}\n", document.status.message());
        return EXIT_FAILURE;
    }

    if (args.query) {
        const auto value = yamlite::Yaml::Get(document.value, *args.query);
        if (!value) {
            fmt::print(stderr, "'{}' not found in '{}'.\n", *args.query, args.input.string());
            return EXIT_FAILURE;
        }
        fmt::print("{}\n", yaml.Encode(*value));
        return EXIT_SUCCESS;
    }

    fmt::print("Loaded '{}'\n", args.input.string());
    fmt::print("  Root:          {}\n", document.value.type_name());
    fmt::print("  Entries:       {}\n", document.value.size());
    // The decoder keeps raw bytes; invalid UTF-8 is replaced rather than thrown on.
    fmt::print("\nJSON view:\n{}\n",
               document.value.dump(2, ' ', false, yamlite::Value::error_handler_t::replace));
    fmt::print("\nRe-encoded:\n{}\n", yaml.Encode(document.value));
    return EXIT_SUCCESS;
}
