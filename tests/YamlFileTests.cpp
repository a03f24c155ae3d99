#include "yamlite/Yaml.hpp"
#include "yamlite/utils/TextFile.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

using yamlite::Value;
using yamlite::Yaml;
using yamlite::core::ErrorKind;

namespace {

std::filesystem::path MakeTempDir(const std::string& prefix) {
    auto root = std::filesystem::temp_directory_path();
    std::filesystem::path dir;
    std::size_t counter = 0;
    do {
        dir = root / (prefix + "_" + std::to_string(++counter));
    } while (std::filesystem::exists(dir));
    std::filesystem::create_directories(dir);
    return dir;
}

struct TempDirGuard {
    std::filesystem::path path;
    explicit TempDirGuard(const std::string& prefix) : path(MakeTempDir(prefix)) {}
    ~TempDirGuard() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

std::string ReadRaw(const std::filesystem::path& path) {
    std::string content;
    REQUIRE(yamlite::utils::ReadTextFile(path, content));
    return content;
}

Value InitialDocument() {
    Value data = Value::object();
    data["name"] = "Test";
    data["version"] = 1;
    data["config"]["enabled"] = true;
    return data;
}

} // namespace

TEST_CASE("Yaml starts with two-space indentation", "[yaml]") {
    Yaml yaml;
    REQUIRE(yaml.Options().indentWidth == 2);
    REQUIRE(yaml.Options().quoting == yamlite::codec::QuotingMode::Reserved);
}

TEST_CASE("Yaml setup merges recognised options", "[yaml][config]") {
    Yaml yaml;

    auto result = yaml.Setup(Value{{"indent_width", 4}});
    REQUIRE_FALSE(result.HasErrors());
    REQUIRE_FALSE(result.HasWarnings());
    REQUIRE(yaml.Options().indentWidth == 4);

    result = yaml.Setup(Value{{"quoting", "legacy"}, {"colour", "blue"}});
    REQUIRE(result.HasWarnings());
    REQUIRE(yaml.Options().indentWidth == 4);
    REQUIRE(yaml.Options().quoting == yamlite::codec::QuotingMode::Legacy);

    result = yaml.Setup(Value());
    REQUIRE_FALSE(result.HasWarnings());
    REQUIRE(yaml.Options().indentWidth == 4);

    result = yaml.Setup(Value{{"indent_width", 0}});
    REQUIRE(result.HasErrors());
    REQUIRE(yaml.Options().indentWidth == 1);

    result = yaml.Setup(Value{{"indent_width", std::int64_t{4294967298}}});
    REQUIRE(result.HasErrors());
    REQUIRE(yaml.Options().indentWidth == 8);
}

TEST_CASE("Yaml parse of empty text is an empty mapping", "[yaml]") {
    const auto result = Yaml::Parse("");
    REQUIRE(result);
    REQUIRE(result.status.kind() == ErrorKind::None);
    REQUIRE(result.value.is_object());
    REQUIRE(result.value.empty());
}

TEST_CASE("Yaml encode honours the configured indentation", "[yaml]") {
    Yaml yaml(yamlite::codec::EncodeOptions{4, yamlite::codec::QuotingMode::Reserved});
    REQUIRE(yaml.Encode(InitialDocument()) == "config:\n    enabled: true\nname: Test\nversion: 1");
}

TEST_CASE("Yaml writes and reads files", "[yaml][file]") {
    TempDirGuard dir("yamlite_file_test");
    const auto file = dir.path / "settings.yaml";
    Yaml yaml;

    const auto written = yaml.Write(file, InitialDocument());
    REQUIRE(written);
    REQUIRE(ReadRaw(file) == "config:\n  enabled: true\nname: Test\nversion: 1");

    const auto read = yaml.Read(file);
    REQUIRE(read);
    REQUIRE(read.value["name"] == Value("Test"));
    REQUIRE(read.value["version"].get<std::int64_t>() == 1);
    REQUIRE(read.value["config"]["enabled"] == Value(true));
}

TEST_CASE("Yaml modify rewrites the file through the mutator", "[yaml][file]") {
    TempDirGuard dir("yamlite_modify_test");
    const auto file = dir.path / "settings.yaml";
    Yaml yaml;
    REQUIRE(yaml.Write(file, InitialDocument()));

    const auto status = yaml.Modify(file, [](Value data) -> std::optional<Value> {
        data["version"] = 2;
        Yaml::Set(data, "updated", true);
        Yaml::Set(data, "config.retries", 3);
        return data;
    });
    REQUIRE(status);

    const auto read = yaml.Read(file);
    REQUIRE(read);
    REQUIRE(read.value["name"] == Value("Test"));
    REQUIRE(read.value["version"].get<std::int64_t>() == 2);
    REQUIRE(read.value["updated"] == Value(true));
    REQUIRE(Yaml::Get(read.value, "config.retries") == std::optional<Value>(3));
    REQUIRE(Yaml::Get(read.value, "config.enabled") == std::optional<Value>(true));
}

TEST_CASE("Yaml modify fails when the mutator returns nothing", "[yaml][file]") {
    TempDirGuard dir("yamlite_mutator_test");
    const auto file = dir.path / "settings.yaml";
    Yaml yaml;
    REQUIRE(yaml.Write(file, InitialDocument()));
    const std::string before = ReadRaw(file);

    const auto status = yaml.Modify(file, [](Value) -> std::optional<Value> {
        return std::nullopt;
    });

    REQUIRE_FALSE(status);
    REQUIRE(status.kind() == ErrorKind::Mutator);
    REQUIRE(status.message() == "Modifier function returned nothing");
    REQUIRE(ReadRaw(file) == before);
}

TEST_CASE("Yaml modify reports a throwing mutator", "[yaml][file]") {
    TempDirGuard dir("yamlite_throwing_mutator_test");
    const auto file = dir.path / "settings.yaml";
    Yaml yaml;
    REQUIRE(yaml.Write(file, InitialDocument()));

    const auto status = yaml.Modify(file, [](Value) -> std::optional<Value> {
        throw std::runtime_error("boom");
    });

    REQUIRE_FALSE(status);
    REQUIRE(status.kind() == ErrorKind::Mutator);
    REQUIRE(status.message().find("boom") != std::string::npos);
}

TEST_CASE("Yaml modify contains mutators throwing non-standard types", "[yaml][file]") {
    TempDirGuard dir("yamlite_odd_throw_test");
    const auto file = dir.path / "settings.yaml";
    Yaml yaml;
    REQUIRE(yaml.Write(file, InitialDocument()));
    const std::string before = ReadRaw(file);

    yamlite::core::Status status;
    REQUIRE_NOTHROW(status = yaml.Modify(file, [](Value) -> std::optional<Value> {
        throw 42;
    }));

    REQUIRE(status.kind() == ErrorKind::Mutator);
    REQUIRE(status.message() == "Modifier function failed: unknown exception");
    REQUIRE(ReadRaw(file) == before);
}

TEST_CASE("Yaml reports a missing mutator", "[yaml][file]") {
    TempDirGuard dir("yamlite_no_mutator_test");
    const auto file = dir.path / "settings.yaml";
    Yaml yaml;
    REQUIRE(yaml.Write(file, InitialDocument()));

    const auto status = yaml.Modify(file, Yaml::Mutator{});
    REQUIRE(status.kind() == ErrorKind::Mutator);
    REQUIRE(status.message() == "No modifier function supplied");
}

TEST_CASE("Text file errors name the operation, the path and the OS reason", "[yaml][file]") {
    TempDirGuard dir("yamlite_text_file_test");
    const auto missing = dir.path / "absent.yaml";

    std::string content;
    const auto status = yamlite::utils::ReadTextFile(missing, content);
    REQUIRE(status.kind() == ErrorKind::Io);

    const std::string prefix = "Failed to open file '" + missing.string() + "': ";
    REQUIRE(status.message().rfind(prefix, 0) == 0);
    REQUIRE(status.message().size() > prefix.size());

    const auto unwritable = dir.path / "no_such_dir" / "out.yaml";
    const auto written = yamlite::utils::WriteTextFile(unwritable, "a: 1");
    const std::string writePrefix = "Failed to open file for writing '" + unwritable.string() + "': ";
    REQUIRE(written.message().rfind(writePrefix, 0) == 0);
}

TEST_CASE("Yaml reports unreadable and unwritable files", "[yaml][file]") {
    TempDirGuard dir("yamlite_io_error_test");
    const auto missing = dir.path / "missing.yaml";
    Yaml yaml;

    const auto read = yaml.Read(missing);
    REQUIRE_FALSE(read);
    REQUIRE(read.status.kind() == ErrorKind::Io);
    REQUIRE(read.status.message().find("Failed to open file") != std::string::npos);
    REQUIRE(read.status.message().find("missing.yaml") != std::string::npos);

    const auto modified = yaml.Modify(missing, [](Value data) -> std::optional<Value> { return data; });
    REQUIRE(modified.kind() == ErrorKind::Io);
    REQUIRE_FALSE(std::filesystem::exists(missing));

    const auto unwritable = dir.path / "no_such_dir" / "out.yaml";
    const auto written = yaml.Write(unwritable, InitialDocument());
    REQUIRE_FALSE(written);
    REQUIRE(written.kind() == ErrorKind::Io);
    REQUIRE(written.message().find("Failed to open file for writing") != std::string::npos);
}

TEST_CASE("Yaml get and set operate on decoded documents", "[yaml]") {
    auto parsed = Yaml::Parse("database:\n  host: localhost\n  port: 5432\n");
    REQUIRE(parsed);

    REQUIRE(Yaml::Get(parsed.value, "database.host") == std::optional<Value>("localhost"));
    REQUIRE_FALSE(Yaml::Get(parsed.value, "database.user").has_value());

    Yaml::Set(parsed.value, "database.port", 6543);
    Yaml::Set(parsed.value, "cache.enabled", false);

    Yaml yaml;
    REQUIRE(yaml.Encode(parsed.value) ==
            "cache:\n"
            "  enabled: false\n"
            "database:\n"
            "  host: localhost\n"
            "  port: 6543");
}
