#include <catch2/catch_test_macros.hpp>
#include "delivery/time_format.hpp"
#include "config/config_types.hpp"

using namespace flbkinesis;

namespace {

// 2001-09-09T01:46:40.123456Z
const Timestamp kSample = Timestamp(std::chrono::seconds(1000000000) + std::chrono::microseconds(123456));

} // namespace

TEST_CASE("format_time: default format is UTC without fraction", "[time_format]") {
    CHECK(format_time(kSample, kDefaultTimeKeyFormat) == "2001-09-09T01:46:40");
}

TEST_CASE("format_time: %L milliseconds and %f microseconds", "[time_format]") {
    CHECK(format_time(kSample, "%H:%M:%S.%L") == "01:46:40.123");
    CHECK(format_time(kSample, "%S.%f") == "40.123456");
    CHECK(format_time(Timestamp(std::chrono::seconds(5)), "%L|%f") == "000|000000");
}

TEST_CASE("format_time: literal percent and plain text", "[time_format]") {
    CHECK(format_time(kSample, "100%%") == "100%");
    CHECK(format_time(kSample, "%%L") == "%L");
    CHECK(format_time(kSample, "year=%Y day=%j") == "year=2001 day=252");
    CHECK(format_time(kSample, "").empty());
}
