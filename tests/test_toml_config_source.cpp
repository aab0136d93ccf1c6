#include <catch2/catch_test_macros.hpp>
#include "config/toml_config_source.hpp"
#include "config/config_loader.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace flbkinesis;

TEST_CASE("TomlConfigFile: runtime defaults without [runtime]", "[config][toml]") {
    const auto file = TomlConfigFile::parse_string(R"(
[[outputs]]
stream = "s"
region = "us-east-1"
)");
    CHECK(file.runtime.log_level.empty());
    CHECK(file.runtime.workers == 4);
    CHECK(file.runtime.task_timeout == std::chrono::milliseconds(60000));
    CHECK(file.runtime.shutdown_timeout == std::chrono::milliseconds(30000));
    REQUIRE(file.outputs.size() == 1);
    CHECK(file.outputs[0].name() == "outputs[0]");
    CHECK(file.outputs[0].get("stream") == "s");
    CHECK(file.outputs[0].get("missing").empty());
}

TEST_CASE("TomlConfigFile: runtime section is read", "[config][toml]") {
    const auto file = TomlConfigFile::parse_string(R"(
[runtime]
log_level = "debug"
workers = 8
task_timeout_ms = 1500
shutdown_timeout_ms = 250
)");
    CHECK(file.runtime.log_level == "debug");
    CHECK(file.runtime.workers == 8);
    CHECK(file.runtime.task_timeout == std::chrono::milliseconds(1500));
    CHECK(file.runtime.shutdown_timeout == std::chrono::milliseconds(250));
    CHECK(file.outputs.empty());
}

TEST_CASE("TomlConfigFile: scalars are rendered as strings", "[config][toml]") {
    const auto file = TomlConfigFile::parse_string(R"(
[[outputs]]
name = "app"
stream = "s"
region = "r"
append_newline = true
shard_hint = 42
)");
    REQUIRE(file.outputs.size() == 1);
    const auto& out = file.outputs[0];
    CHECK(out.name() == "app");
    CHECK(out.get("append_newline") == "true");
    CHECK(out.get("shard_hint") == "42");

    const auto loaded = ConfigLoader::load(out, 0);
    REQUIRE(loaded.success);
    CHECK(loaded.config.append_newline);
}

TEST_CASE("TomlConfigFile: several outputs keep file order", "[config][toml]") {
    const auto file = TomlConfigFile::parse_string(R"(
[[outputs]]
stream = "first"
region = "r"

[[outputs]]
stream = "second"
region = "r"
)");
    REQUIRE(file.outputs.size() == 2);
    CHECK(file.outputs[0].get("stream") == "first");
    CHECK(file.outputs[1].get("stream") == "second");
}

TEST_CASE("TomlConfigFile: ${VAR} is expanded from the environment", "[config][toml]") {
    ::setenv("FLBKINESIS_TEST_STREAM", "from-env", 1);
    const auto file = TomlConfigFile::parse_string(R"(
[[outputs]]
stream = "${FLBKINESIS_TEST_STREAM}"
region = "prefix-${FLBKINESIS_TEST_UNSET_VAR}-suffix"
)");
    ::unsetenv("FLBKINESIS_TEST_STREAM");

    REQUIRE(file.outputs.size() == 1);
    CHECK(file.outputs[0].get("stream") == "from-env");
    CHECK(file.outputs[0].get("region") == "prefix--suffix");
}

TEST_CASE("TomlConfigFile: errors throw runtime_error", "[config][toml]") {
    CHECK_THROWS_AS(TomlConfigFile::parse_string("[[outputs]\nstream = "), std::runtime_error);
    CHECK_THROWS_AS(TomlConfigFile::parse_string("[runtime]\nworkers = 0\n"), std::runtime_error);
    CHECK_THROWS_AS(TomlConfigFile::parse_string("[[outputs]]\nstream = \"${OPEN\"\n"),
                    std::runtime_error);
    CHECK_THROWS_AS(TomlConfigFile::parse_file("/nonexistent/flb-kinesis.toml"), std::runtime_error);
}
