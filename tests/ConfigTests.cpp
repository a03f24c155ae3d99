#include "yamlite/utils/Config.hpp"
#include "yamlite/utils/TextFile.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

using yamlite::codec::QuotingMode;
using yamlite::codec::Value;
using yamlite::utils::ConfigLoader;
using yamlite::utils::ConfigLoadResult;

namespace {

struct TempConfigFile {
    std::filesystem::path path;

    explicit TempConfigFile(std::string_view content) {
        auto root = std::filesystem::temp_directory_path();
        std::size_t counter = 0;
        do {
            path = root / ("yamlite_config_test_" + std::to_string(++counter) + ".yaml");
        } while (std::filesystem::exists(path));
        REQUIRE(yamlite::utils::WriteTextFile(path, content));
    }

    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

void SetEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value ? value : "");
#else
    if (value) {
        setenv(name, value, 1);
    } else {
        unsetenv(name);
    }
#endif
}

struct EnvGuard {
    const char* name;
    std::optional<std::string> previous;

    EnvGuard(const char* variable, const char* value) : name(variable) {
        if (const char* existing = std::getenv(variable)) {
            previous = existing;
        }
        SetEnv(name, value);
    }

    ~EnvGuard() {
        SetEnv(name, previous ? previous->c_str() : nullptr);
    }
};

} // namespace

TEST_CASE("ConfigLoader falls back to defaults when the file is missing", "[config]") {
    const auto missing = std::filesystem::temp_directory_path() / "yamlite_config_does_not_exist.yaml";
    const ConfigLoadResult result = ConfigLoader::Load(missing);

    REQUIRE_FALSE(result.loadedFromFile);
    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.options.indentWidth == 2);
    REQUIRE(result.options.quoting == QuotingMode::Reserved);
}

TEST_CASE("ConfigLoader reads the encoder section", "[config]") {
    TempConfigFile file(
        "# yamlite settings\n"
        "encoder:\n"
        "  indent_width: 4\n"
        "  quoting: legacy\n");

    const ConfigLoadResult result = ConfigLoader::Load(file.path);

    REQUIRE(result.loadedFromFile);
    REQUIRE_FALSE(result.HasErrors());
    REQUIRE_FALSE(result.HasWarnings());
    REQUIRE(result.options.indentWidth == 4);
    REQUIRE(result.options.quoting == QuotingMode::Legacy);
}

TEST_CASE("ConfigLoader clamps an out-of-range indent width", "[config]") {
    TempConfigFile file("encoder:\n  indent_width: 20\n");

    const ConfigLoadResult result = ConfigLoader::Load(file.path);

    REQUIRE(result.loadedFromFile);
    REQUIRE(result.HasErrors());
    REQUIRE(result.options.indentWidth == 8);
}

TEST_CASE("ConfigLoader rejects indent widths beyond 32 bits", "[config]") {
    TempConfigFile file("encoder:\n  indent_width: 4294967298\n");

    const ConfigLoadResult loaded = ConfigLoader::Load(file.path);
    REQUIRE(loaded.HasErrors());
    REQUIRE(loaded.errors.front().find("4294967298") != std::string::npos);
    REQUIRE(loaded.options.indentWidth == 8);

    ConfigLoadResult negative;
    ConfigLoader::ApplyOverrides(Value{{"indent_width", std::int64_t{-4294967294}}}, negative);
    REQUIRE(negative.HasErrors());
    REQUIRE(negative.options.indentWidth == 1);

    ConfigLoadResult huge;
    ConfigLoader::ApplyOverrides(Value{{"indent_width", std::uint64_t{18446744073709551615ULL}}}, huge);
    REQUIRE(huge.HasErrors());
    REQUIRE(huge.options.indentWidth == 8);

    ConfigLoadResult unsignedInRange;
    ConfigLoader::ApplyOverrides(Value{{"indent_width", std::uint64_t{3}}}, unsignedInRange);
    REQUIRE_FALSE(unsignedInRange.HasErrors());
    REQUIRE(unsignedInRange.options.indentWidth == 3);
}

TEST_CASE("ConfigLoader warns about wrong types and unknown keys", "[config]") {
    TempConfigFile file(
        "encoder:\n"
        "  indent_width: wide\n"
        "  line_width: 80\n");

    const ConfigLoadResult result = ConfigLoader::Load(file.path);

    REQUIRE(result.loadedFromFile);
    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.warnings.size() == 2);
    REQUIRE(result.options.indentWidth == 2);
}

TEST_CASE("ConfigLoader warns about an unknown quoting mode", "[config]") {
    ConfigLoadResult result;
    ConfigLoader::ApplyOverrides(Value{{"quoting", "always"}}, result);

    REQUIRE(result.HasWarnings());
    REQUIRE(result.options.quoting == QuotingMode::Reserved);

    ConfigLoadResult upper;
    ConfigLoader::ApplyOverrides(Value{{"quoting", "LEGACY"}}, upper);
    REQUIRE_FALSE(upper.HasWarnings());
    REQUIRE(upper.options.quoting == QuotingMode::Legacy);
}

TEST_CASE("ConfigLoader warns when the encoder section is absent", "[config]") {
    TempConfigFile file("other:\n  value: 1\n");

    const ConfigLoadResult result = ConfigLoader::Load(file.path);

    REQUIRE(result.loadedFromFile);
    REQUIRE(result.HasWarnings());
    REQUIRE(result.options.indentWidth == 2);
}

TEST_CASE("ConfigLoader ignores non-mapping overrides", "[config]") {
    ConfigLoadResult result;
    ConfigLoader::ApplyOverrides(Value(), result);
    REQUIRE_FALSE(result.HasWarnings());

    ConfigLoader::ApplyOverrides(Value::array({1, 2}), result);
    REQUIRE(result.HasWarnings());
    REQUIRE(result.options.indentWidth == 2);
}

TEST_CASE("ConfigLoader applies the indent width from the environment", "[config]") {
    {
        EnvGuard env("YAMLITE_INDENT_WIDTH", "3");
        ConfigLoadResult result;
        ConfigLoader::ApplyEnvironment(result);
        REQUIRE_FALSE(result.HasWarnings());
        REQUIRE(result.options.indentWidth == 3);
    }
    {
        EnvGuard env("YAMLITE_INDENT_WIDTH", "three");
        ConfigLoadResult result;
        ConfigLoader::ApplyEnvironment(result);
        REQUIRE(result.HasWarnings());
        REQUIRE(result.options.indentWidth == 2);
    }
    {
        EnvGuard env("YAMLITE_INDENT_WIDTH", "12");
        ConfigLoadResult result;
        ConfigLoader::ApplyEnvironment(result);
        REQUIRE(result.HasErrors());
        REQUIRE(result.options.indentWidth == 8);
    }
    {
        EnvGuard env("YAMLITE_INDENT_WIDTH", "4294967298");
        ConfigLoadResult result;
        ConfigLoader::ApplyEnvironment(result);
        REQUIRE(result.HasErrors());
        REQUIRE(result.options.indentWidth == 8);
    }
    {
        EnvGuard env("YAMLITE_INDENT_WIDTH", "-99999999999999999999");
        ConfigLoadResult result;
        ConfigLoader::ApplyEnvironment(result);
        REQUIRE(result.HasErrors());
        REQUIRE(result.options.indentWidth == 1);
    }
    {
        EnvGuard env("YAMLITE_INDENT_WIDTH", nullptr);
        ConfigLoadResult result;
        ConfigLoader::ApplyEnvironment(result);
        REQUIRE_FALSE(result.HasWarnings());
        REQUIRE(result.options.indentWidth == 2);
    }
}
