#include <catch2/catch_test_macros.hpp>
#include "delivery/credentials_provider.hpp"
#include "mocks/mock_http_transport.hpp"

#include <cstdlib>

using namespace flbkinesis;
using flbkinesis::testing::MockHttpTransport;

namespace {

std::string assume_role_xml(const std::string& expiration) {
    return
        "<AssumeRoleResponse xmlns=\"https://sts.amazonaws.com/doc/2011-06-15/\">\n"
        "  <AssumeRoleResult>\n"
        "    <AssumedRoleUser>\n"
        "      <Arn>arn:aws:sts::123456789012:assumed-role/writer/flb-kinesis</Arn>\n"
        "      <AssumedRoleId>AROA:flb-kinesis</AssumedRoleId>\n"
        "    </AssumedRoleUser>\n"
        "    <Credentials>\n"
        "      <AccessKeyId>ASIATEMP</AccessKeyId>\n"
        "      <SecretAccessKey>tempsecret</SecretAccessKey>\n"
        "      <SessionToken>tempsession</SessionToken>\n"
        "      <Expiration>" + expiration + "</Expiration>\n"
        "    </Credentials>\n"
        "  </AssumeRoleResult>\n"
        "</AssumeRoleResponse>\n";
}

std::shared_ptr<ICredentialsProvider> base_credentials() {
    return std::make_shared<StaticCredentialsProvider>(AwsCredentials{
        .access_key_id = "AKIDBASE",
        .secret_access_key = "basesecret",
        .session_token = "",
        .expiration = std::nullopt,
    });
}

AssumeRoleCredentialsProvider::Config role_config() {
    AssumeRoleCredentialsProvider::Config cfg;
    cfg.role_arn = "arn:aws:iam::123456789012:role/writer";
    cfg.region = "us-east-1";
    return cfg;
}

} // namespace

TEST_CASE("EnvCredentialsProvider: reads the AWS_* variables", "[credentials]") {
    ::setenv("AWS_ACCESS_KEY_ID", "AKIDENV", 1);
    ::setenv("AWS_SECRET_ACCESS_KEY", "envsecret", 1);
    ::setenv("AWS_SESSION_TOKEN", "envtoken", 1);

    EnvCredentialsProvider provider;
    const auto result = provider.get_credentials();
    REQUIRE(result.is_ok());
    CHECK(result.value().access_key_id == "AKIDENV");
    CHECK(result.value().secret_access_key == "envsecret");
    CHECK(result.value().session_token == "envtoken");

    ::unsetenv("AWS_SECRET_ACCESS_KEY");
    const auto missing = provider.get_credentials();
    CHECK(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::CONFIGURATION_ERROR);

    ::unsetenv("AWS_ACCESS_KEY_ID");
    ::unsetenv("AWS_SESSION_TOKEN");
}

TEST_CASE("AssumeRoleCredentialsProvider: parses the STS response", "[credentials]") {
    const auto result = AssumeRoleCredentialsProvider::parse_assume_role_response(
        assume_role_xml("2011-07-15T23:28:33.359Z"));
    REQUIRE(result.is_ok());
    const auto& creds = result.value();
    CHECK(creds.access_key_id == "ASIATEMP");
    CHECK(creds.secret_access_key == "tempsecret");
    CHECK(creds.session_token == "tempsession");
    REQUIRE(creds.expiration);
    CHECK(*creds.expiration == Timestamp(std::chrono::seconds(1310772513)));
}

TEST_CASE("AssumeRoleCredentialsProvider: response without credentials is rejected", "[credentials]") {
    CHECK(AssumeRoleCredentialsProvider::parse_assume_role_response("<AssumeRoleResponse/>").is_error());
    CHECK(AssumeRoleCredentialsProvider::parse_assume_role_response(
        "<Credentials><AccessKeyId>A</AccessKeyId></Credentials>").is_error());
}

TEST_CASE("AssumeRoleCredentialsProvider: parse_iso8601", "[credentials]") {
    CHECK(AssumeRoleCredentialsProvider::parse_iso8601("2001-09-09T01:46:40Z") ==
          Timestamp(std::chrono::seconds(1000000000)));
    CHECK(AssumeRoleCredentialsProvider::parse_iso8601("2001-09-09T01:46:40.5Z") ==
          Timestamp(std::chrono::seconds(1000000000)));
    CHECK_FALSE(AssumeRoleCredentialsProvider::parse_iso8601("yesterday"));
    CHECK_FALSE(AssumeRoleCredentialsProvider::parse_iso8601("2001-09-09T01:46:40+02:00"));
}

TEST_CASE("AssumeRoleCredentialsProvider: signed GET to STS and caching", "[credentials]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->push_reply(200, assume_role_xml("2999-01-01T00:00:00Z"));

    AssumeRoleCredentialsProvider provider(role_config(), base_credentials(), transport);

    const auto first = provider.get_credentials();
    REQUIRE(first.is_ok());
    CHECK(first.value().access_key_id == "ASIATEMP");

    // Still valid: served from cache, no second request
    const auto second = provider.get_credentials();
    REQUIRE(second.is_ok());
    CHECK(second.value().session_token == "tempsession");

    const auto requests = transport->requests();
    REQUIRE(requests.size() == 1);
    const auto& req = requests[0];
    CHECK(req.method == "GET");
    CHECK(req.scheme_host == "https://sts.us-east-1.amazonaws.com");
    CHECK(req.path.starts_with("/?Action=AssumeRole&"));
    CHECK(req.path.find("RoleArn=arn%3Aaws%3Aiam%3A%3A123456789012%3Arole%2Fwriter") != std::string::npos);
    CHECK(req.path.find("Version=2011-06-15") != std::string::npos);
    REQUIRE(req.headers.contains("Authorization"));
    CHECK(req.headers.at("Authorization").starts_with(
        "AWS4-HMAC-SHA256 Credential=AKIDBASE/"));
    CHECK(req.headers.at("Authorization").find("/us-east-1/sts/aws4_request") != std::string::npos);
    CHECK(req.headers.at("Host") == "sts.us-east-1.amazonaws.com");
}

TEST_CASE("AssumeRoleCredentialsProvider: refreshes near expiry", "[credentials]") {
    auto transport = std::make_shared<MockHttpTransport>();
    // Already inside the refresh window
    transport->push_reply(200, assume_role_xml("2000-01-01T00:00:00Z"));
    transport->push_reply(200, assume_role_xml("2999-01-01T00:00:00Z"));

    AssumeRoleCredentialsProvider provider(role_config(), base_credentials(), transport);
    REQUIRE(provider.get_credentials().is_ok());
    REQUIRE(provider.get_credentials().is_ok());
    CHECK(transport->requests().size() == 2);
}

TEST_CASE("AssumeRoleCredentialsProvider: STS failures", "[credentials]") {
    auto transport = std::make_shared<MockHttpTransport>();
    AssumeRoleCredentialsProvider provider(role_config(), base_credentials(), transport);

    SECTION("transport failure is retryable") {
        transport->push_failure();
        const auto result = provider.get_credentials();
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::DELIVERY_RETRYABLE);
    }
    SECTION("access denied is fatal") {
        transport->push_reply(403,
            "<ErrorResponse><Error><Code>AccessDenied</Code><Message>no</Message></Error></ErrorResponse>");
        const auto result = provider.get_credentials();
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::DELIVERY_FATAL);
        CHECK(result.error_message().find("AccessDenied") != std::string::npos);
    }
    SECTION("server error is retryable") {
        transport->push_reply(500, "");
        CHECK(provider.get_credentials().error_category() == ErrorCategory::DELIVERY_RETRYABLE);
    }
}

TEST_CASE("make_credentials_provider: role_arn selects AssumeRole", "[credentials]") {
    CHECK(make_credentials_provider("", "us-east-1")->name() == "env");
    CHECK(make_credentials_provider("arn:aws:iam::1:role/r", "us-east-1")->name() ==
          "assume_role:arn:aws:iam::1:role/r");
}
