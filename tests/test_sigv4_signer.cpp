#include <catch2/catch_test_macros.hpp>
#include "delivery/sigv4_signer.hpp"

using namespace flbkinesis;

namespace {

// AWS Signature Version 4 test suite credentials and request time
const AwsCredentials kCreds{
    .access_key_id = "AKIDEXAMPLE",
    .secret_access_key = "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY",
    .session_token = "",
    .expiration = std::nullopt,
};
const Timestamp kRequestTime = Timestamp(std::chrono::seconds(1440938160));   // 20150830T123600Z

SigningRequest vanilla(const std::string& method) {
    SigningRequest req;
    req.method = method;
    req.headers["host"] = "example.amazonaws.com";
    return req;
}

} // namespace

TEST_CASE("SigV4Signer: primitives", "[sigv4]") {
    CHECK(SigV4Signer::sha256_hex("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(SigV4Signer::to_hex(SigV4Signer::hmac_sha256("key", "The quick brown fox jumps over the lazy dog")) ==
          "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
    CHECK(SigV4Signer::amz_date(kRequestTime) == "20150830T123600Z");
}

TEST_CASE("SigV4Signer: signing key derivation", "[sigv4]") {
    const auto key = SigV4Signer::derive_signing_key(kCreds.secret_access_key, "20120215", "us-east-1", "iam");
    CHECK(SigV4Signer::to_hex(key) ==
          "f4780e2d9f65fa895f9c67b32ce1baf0b0d8a43505a000a1a9e090d414db404d");
}

TEST_CASE("SigV4Signer: uri_encode", "[sigv4]") {
    CHECK(SigV4Signer::uri_encode("AZaz09-_.~") == "AZaz09-_.~");
    CHECK(SigV4Signer::uri_encode("a b/c=d") == "a%20b%2Fc%3Dd");
    CHECK(SigV4Signer::uri_encode("/a b/", /*encode_slash=*/false) == "/a%20b/");
    CHECK(SigV4Signer::uri_encode("arn:aws:iam::1:role/x") == "arn%3Aaws%3Aiam%3A%3A1%3Arole%2Fx");
}

TEST_CASE("SigV4Signer: get-vanilla", "[sigv4]") {
    auto req = vanilla("GET");
    const SigV4Signer signer("us-east-1", "service");
    const auto authorization = signer.sign(req, kCreds, kRequestTime);

    CHECK(req.headers.at("x-amz-date") == "20150830T123600Z");
    CHECK(authorization ==
          "AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20150830/us-east-1/service/aws4_request, "
          "SignedHeaders=host;x-amz-date, "
          "Signature=5fa00fa31553b73ebf1942676e86291e8372ff2a2260956d9b8aae1d763fbf31");
}

TEST_CASE("SigV4Signer: post-vanilla", "[sigv4]") {
    auto req = vanilla("POST");
    const SigV4Signer signer("us-east-1", "service");
    const auto authorization = signer.sign(req, kCreds, kRequestTime);
    CHECK(authorization.ends_with(
        "Signature=5da7c1a2acd57cee7505fc6676e4e544621c30862966e37dddb68e92efbe5d6b"));
}

TEST_CASE("SigV4Signer: query parameters are sorted", "[sigv4]") {
    auto req = vanilla("GET");
    req.query = {{"Param2", "value2"}, {"Param1", "value1"}};
    CHECK(SigV4Signer::canonical_query(req.query) == "Param1=value1&Param2=value2");

    const SigV4Signer signer("us-east-1", "service");
    const auto authorization = signer.sign(req, kCreds, kRequestTime);
    CHECK(authorization.ends_with(
        "Signature=b97d918cfa904a5beff61c982a1b6f458b799221646efd99d3219ec94cdf2500"));
}

TEST_CASE("SigV4Signer: canonical request layout", "[sigv4]") {
    auto req = vanilla("GET");
    req.headers["x-amz-date"] = "20150830T123600Z";
    CHECK(SigV4Signer::canonical_request(req) ==
          "GET\n/\n\n"
          "host:example.amazonaws.com\nx-amz-date:20150830T123600Z\n\n"
          "host;x-amz-date\n"
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("SigV4Signer: session token is added and signed", "[sigv4]") {
    auto creds = kCreds;
    creds.session_token = "token123";
    auto req = vanilla("POST");

    const SigV4Signer signer("us-east-1", "kinesis");
    const auto authorization = signer.sign(req, creds, kRequestTime);
    CHECK(req.headers.at("x-amz-security-token") == "token123");
    CHECK(authorization.find("SignedHeaders=host;x-amz-date;x-amz-security-token,") != std::string::npos);
    CHECK(authorization.find("/us-east-1/kinesis/aws4_request") != std::string::npos);
}
