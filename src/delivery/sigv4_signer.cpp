#include "delivery/sigv4_signer.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <ctime>
#include <format>
#include <stdexcept>

namespace flbkinesis {

SigV4Signer::SigV4Signer(std::string region, std::string service)
    : region_(std::move(region)), service_(std::move(service)) {}

// ============================================================================
// Crypto primitives
// ============================================================================

std::string SigV4Signer::hmac_sha256(std::string_view key, std::string_view data) {
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int result_len = 0;

    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
              result, &result_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char*>(result), result_len);
}

std::string SigV4Signer::sha256_hex(std::string_view data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return to_hex(std::string_view(reinterpret_cast<const char*>(hash), hash_len));
}

std::string SigV4Signer::to_hex(std::string_view bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const char c : bytes) {
        const auto b = static_cast<unsigned char>(c);
        out += kHex[b >> 4];
        out += kHex[b & 0x0F];
    }
    return out;
}

std::string SigV4Signer::derive_signing_key(std::string_view secret, std::string_view date,
                                            std::string_view region, std::string_view service) {
    const std::string k_secret = "AWS4" + std::string(secret);
    const std::string k_date = hmac_sha256(k_secret, date);
    const std::string k_region = hmac_sha256(k_date, region);
    const std::string k_service = hmac_sha256(k_region, service);
    return hmac_sha256(k_service, "aws4_request");
}

// ============================================================================
// Canonical forms
// ============================================================================

std::string SigV4Signer::uri_encode(std::string_view value, bool encode_slash) {
    std::string out;
    out.reserve(value.size() * 3);
    for (const char c : value) {
        const auto b = static_cast<unsigned char>(c);
        const bool unreserved = (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z') ||
                                (b >= '0' && b <= '9') ||
                                b == '-' || b == '_' || b == '.' || b == '~';
        if (unreserved || (b == '/' && !encode_slash)) {
            out += c;
        } else {
            out += std::format("%{:02X}", b);
        }
    }
    return out;
}

std::string SigV4Signer::amz_date(Timestamp tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm_buf);
    return buf;
}

std::string SigV4Signer::canonical_query(const std::map<std::string, std::string>& query) {
    // Sort by encoded key; std::map sorts by raw key, which only differs for
    // characters that need encoding, so re-sort to be exact.
    std::map<std::string, std::string> encoded;
    for (const auto& [key, value] : query) {
        encoded.emplace(uri_encode(key), uri_encode(value));
    }

    std::string out;
    for (const auto& [key, value] : encoded) {
        if (!out.empty()) out += '&';
        out += key;
        out += '=';
        out += value;
    }
    return out;
}

std::string SigV4Signer::signed_headers(const SigningRequest& request) {
    std::string out;
    for (const auto& [name, value] : request.headers) {
        if (!out.empty()) out += ';';
        out += name;
    }
    return out;
}

std::string SigV4Signer::canonical_request(const SigningRequest& request) {
    std::string headers;
    for (const auto& [name, value] : request.headers) {
        headers += name;
        headers += ':';
        headers += utils::trim(value);
        headers += '\n';
    }

    return std::format("{}\n{}\n{}\n{}\n{}\n{}",
        request.method,
        uri_encode(request.canonical_uri, /*encode_slash=*/false),
        canonical_query(request.query),
        headers,
        signed_headers(request),
        sha256_hex(request.payload));
}

// ============================================================================
// Signing
// ============================================================================

std::string SigV4Signer::sign(SigningRequest& request, const AwsCredentials& credentials,
                              Timestamp now) const {
    const std::string date_time = amz_date(now);
    const std::string date = date_time.substr(0, 8);

    request.headers["x-amz-date"] = date_time;
    if (!credentials.session_token.empty()) {
        request.headers["x-amz-security-token"] = credentials.session_token;
    }

    const std::string scope = std::format("{}/{}/{}/aws4_request", date, region_, service_);
    const std::string string_to_sign = std::format("{}\n{}\n{}\n{}",
        kAlgorithm, date_time, scope, sha256_hex(canonical_request(request)));

    const std::string key = derive_signing_key(credentials.secret_access_key, date, region_, service_);
    const std::string signature = to_hex(hmac_sha256(key, string_to_sign));

    return std::format("{} Credential={}/{}, SignedHeaders={}, Signature={}",
        kAlgorithm, credentials.access_key_id, scope, signed_headers(request), signature);
}

} // namespace flbkinesis
