#pragma once

#include "core/types.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace flbkinesis {

struct AwsCredentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;      // empty for long-term keys
    std::optional<std::chrono::system_clock::time_point> expiration;

    [[nodiscard]] bool empty() const {
        return access_key_id.empty() || secret_access_key.empty();
    }
};

/// Request as seen by the signer. Query values and header values are raw.
struct SigningRequest {
    std::string method = "POST";
    std::string canonical_uri = "/";
    std::map<std::string, std::string> query;       // sorted by key
    std::map<std::string, std::string> headers;     // lowercase name → value
    std::string payload;
};

/**
 * @brief AWS Signature Version 4 (HMAC-SHA256 via OpenSSL)
 *
 * sign() adds x-amz-date (and x-amz-security-token when the credentials
 * carry a session token) to request.headers, then returns the value of
 * the Authorization header. Every header present is signed.
 */
class SigV4Signer {
public:
    SigV4Signer(std::string region, std::string service);

    [[nodiscard]] std::string sign(SigningRequest& request,
                                   const AwsCredentials& credentials,
                                   Timestamp now) const;

    [[nodiscard]] const std::string& region() const { return region_; }
    [[nodiscard]] const std::string& service() const { return service_; }

    // ---- Building blocks (exposed for tests) ----

    [[nodiscard]] static std::string canonical_request(const SigningRequest& request);
    [[nodiscard]] static std::string canonical_query(const std::map<std::string, std::string>& query);
    [[nodiscard]] static std::string signed_headers(const SigningRequest& request);

    /// kSigning = HMAC(HMAC(HMAC(HMAC("AWS4" + secret, date), region), service), "aws4_request")
    [[nodiscard]] static std::string derive_signing_key(std::string_view secret,
                                                        std::string_view date,
                                                        std::string_view region,
                                                        std::string_view service);

    [[nodiscard]] static std::string hmac_sha256(std::string_view key, std::string_view data);
    [[nodiscard]] static std::string sha256_hex(std::string_view data);
    [[nodiscard]] static std::string to_hex(std::string_view bytes);

    /// RFC 3986 unreserved characters pass through; everything else is %XX
    [[nodiscard]] static std::string uri_encode(std::string_view value, bool encode_slash = true);

    /// "20150830T123600Z"
    [[nodiscard]] static std::string amz_date(Timestamp tp);

    static constexpr const char* kAlgorithm = "AWS4-HMAC-SHA256";

private:
    std::string region_;
    std::string service_;
};

} // namespace flbkinesis
