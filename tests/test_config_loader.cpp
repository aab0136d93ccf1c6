#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "mocks/map_config_source.hpp"

using namespace flbkinesis;
using flbkinesis::testing::MapConfigSource;

TEST_CASE("ConfigLoader: minimal valid configuration", "[config]") {
    const MapConfigSource src{{"stream", "s"}, {"region", "us-east-1"}};

    const auto result = ConfigLoader::load(src, 3);
    REQUIRE(result.success);
    CHECK(result.config.plugin_id == 3);
    CHECK(result.config.stream == "s");
    CHECK(result.config.region == "us-east-1");
    CHECK(result.config.data_keys.empty());
    CHECK(result.config.partition_key.empty());
    CHECK(result.config.time_key.empty());
    CHECK(result.config.time_key_format == kDefaultTimeKeyFormat);
    CHECK_FALSE(result.config.append_newline);
}

TEST_CASE("ConfigLoader: missing stream or region is rejected", "[config]") {
    SECTION("no stream") {
        const MapConfigSource src{{"region", "us-east-1"}};
        const auto result = ConfigLoader::load(src, 0);
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("stream and region are required") != std::string::npos);
    }
    SECTION("no region") {
        const MapConfigSource src{{"stream", "s"}};
        CHECK_FALSE(ConfigLoader::load(src, 0).success);
    }
    SECTION("empty source") {
        const MapConfigSource src;
        CHECK_FALSE(ConfigLoader::load(src, 0).success);
    }
}

TEST_CASE("ConfigLoader: 'log' is reserved as partition key", "[config]") {
    const MapConfigSource src{{"stream", "s"}, {"region", "r"}, {"partition_key", "log"}};
    const auto result = ConfigLoader::load(src, 7);
    CHECK_FALSE(result.success);
    CHECK(result.error_message == "[kinesis 7] 'log' cannot be set as the partition key");
}

TEST_CASE("ConfigLoader: endpoint is optional and accepted as given", "[config]") {
    MapConfigSource src{{"stream", "s"}, {"region", "us-east-1"}};

    src.set("endpoint", "localhost:4566");
    const auto bare = ConfigLoader::load(src, 0);
    REQUIRE(bare.success);
    CHECK(bare.config.endpoint == "localhost:4566");

    src.set("endpoint", "http://localhost:4566");
    const auto with_scheme = ConfigLoader::load(src, 0);
    REQUIRE(with_scheme.success);
    CHECK(with_scheme.config.endpoint == "http://localhost:4566");
}

TEST_CASE("ConfigLoader: optional parameters are carried through", "[config]") {
    const MapConfigSource src{
        {"stream", "s"}, {"region", "eu-west-1"},
        {"data_keys", " message , level,,"},
        {"partition_key", "kubernetes->pod_name"},
        {"role_arn", "arn:aws:iam::123456789012:role/writer"},
        {"append_newline", "TRUE"},
        {"time_key", "ts"},
        {"time_key_format", "%s"},
    };

    const auto result = ConfigLoader::load(src, 1);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.data_keys == std::vector<std::string>{"message", "level"});
    CHECK(cfg.partition_key == "kubernetes->pod_name");
    CHECK(cfg.role_arn == "arn:aws:iam::123456789012:role/writer");
    CHECK(cfg.append_newline);
    CHECK(cfg.time_key == "ts");
    CHECK(cfg.time_key_format == "%s");
}

TEST_CASE("ConfigLoader: time_key_format without time_key is ignored", "[config]") {
    const MapConfigSource src{{"stream", "s"}, {"region", "r"}, {"time_key_format", "%s"}};
    const auto result = ConfigLoader::load(src, 0);
    REQUIRE(result.success);
    CHECK(result.config.time_key.empty());
    CHECK(result.config.time_key_format == kDefaultTimeKeyFormat);
}

TEST_CASE("ConfigLoader: parse_bool is case-insensitive 'true' only", "[config]") {
    CHECK(ConfigLoader::parse_bool("true"));
    CHECK(ConfigLoader::parse_bool("True"));
    CHECK(ConfigLoader::parse_bool(" TRUE "));
    CHECK_FALSE(ConfigLoader::parse_bool("yes"));
    CHECK_FALSE(ConfigLoader::parse_bool("1"));
    CHECK_FALSE(ConfigLoader::parse_bool(""));
}

TEST_CASE("ConfigLoader: parse_key_list trims and drops empties", "[config]") {
    CHECK(ConfigLoader::parse_key_list("").empty());
    CHECK(ConfigLoader::parse_key_list(" , ,").empty());
    CHECK(ConfigLoader::parse_key_list("a") == std::vector<std::string>{"a"});
    CHECK(ConfigLoader::parse_key_list("a, b ,,c") == std::vector<std::string>{"a", "b", "c"});
}
