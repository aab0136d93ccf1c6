#include "delivery/credentials_provider.hpp"
#include "core/utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <format>

namespace flbkinesis {

namespace {

constexpr const char* kStsApiVersion = "2011-06-15";

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string{};
}

/// Text between <tag> and </tag>, searching from the first occurrence of scope
std::string xml_element(const std::string& xml, const std::string& tag, size_t from = 0) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";

    const auto start = xml.find(open, from);
    if (start == std::string::npos) return "";
    const auto value_start = start + open.size();
    const auto end = xml.find(close, value_start);
    if (end == std::string::npos) return "";
    return xml.substr(value_start, end - value_start);
}

} // anonymous namespace

// ============================================================================
// EnvCredentialsProvider
// ============================================================================

Result<AwsCredentials> EnvCredentialsProvider::get_credentials() {
    AwsCredentials creds;
    creds.access_key_id = env_or_empty("AWS_ACCESS_KEY_ID");
    creds.secret_access_key = env_or_empty("AWS_SECRET_ACCESS_KEY");
    creds.session_token = env_or_empty("AWS_SESSION_TOKEN");

    if (creds.empty()) {
        return Result<AwsCredentials>::error(ErrorCategory::CONFIGURATION_ERROR,
            "AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY must be set");
    }
    return Result<AwsCredentials>::ok(std::move(creds));
}

// ============================================================================
// AssumeRoleCredentialsProvider
// ============================================================================

AssumeRoleCredentialsProvider::AssumeRoleCredentialsProvider(
    Config config, std::shared_ptr<ICredentialsProvider> base)
    : AssumeRoleCredentialsProvider(std::move(config), std::move(base),
                                    std::make_shared<HttplibTransport>()) {}

AssumeRoleCredentialsProvider::AssumeRoleCredentialsProvider(
    Config config, std::shared_ptr<ICredentialsProvider> base,
    std::shared_ptr<IHttpTransport> transport)
    : config_(std::move(config)),
      base_(std::move(base)),
      transport_(std::move(transport)) {
    if (config_.endpoint.empty()) {
        config_.endpoint = std::format("https://sts.{}.amazonaws.com", config_.region);
    }
}

Result<AwsCredentials> AssumeRoleCredentialsProvider::get_credentials() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (cached_) {
        const bool fresh = !cached_->expiration ||
            utils::now() + kRefreshWindow < *cached_->expiration;
        if (fresh) {
            return Result<AwsCredentials>::ok(*cached_);
        }
    }

    auto result = assume_role();
    if (result.is_ok()) {
        cached_ = result.value();
    }
    return result;
}

Result<AwsCredentials> AssumeRoleCredentialsProvider::assume_role() {
    if (!base_) {
        return Result<AwsCredentials>::error(ErrorCategory::CONFIGURATION_ERROR,
            "no base credentials for AssumeRole");
    }
    auto base = base_->get_credentials();
    if (base.is_error()) {
        return base;
    }

    const auto url = parse_url(config_.endpoint);
    if (!url) {
        return Result<AwsCredentials>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("invalid STS endpoint '{}'", config_.endpoint));
    }

    SigningRequest signing;
    signing.method = "GET";
    signing.canonical_uri = url->path;
    signing.query = {
        {"Action", "AssumeRole"},
        {"Version", kStsApiVersion},
        {"RoleArn", config_.role_arn},
        {"RoleSessionName", config_.session_name},
        {"DurationSeconds", std::to_string(config_.duration.count())},
    };
    signing.headers["host"] = url->host_header;

    const SigV4Signer signer(config_.region, "sts");
    const std::string authorization = signer.sign(signing, base.value(), utils::now());

    HttpRequest request;
    request.method = "GET";
    request.scheme_host = url->scheme_host;
    request.path = url->path + "?" + SigV4Signer::canonical_query(signing.query);
    request.headers = signing.headers;
    request.headers.erase("host");
    request.headers["Host"] = url->host_header;
    request.headers["Authorization"] = authorization;

    std::string error;
    const auto reply = transport_->send(request, error);
    if (!reply) {
        return Result<AwsCredentials>::error(ErrorCategory::DELIVERY_RETRYABLE,
            std::format("STS AssumeRole failed: {}", error));
    }

    if (reply->status < 200 || reply->status >= 300) {
        const std::string code = xml_element(reply->body, "Code");
        const std::string message = xml_element(reply->body, "Message");
        const auto category = reply->status >= 500 || code == "Throttling"
            ? ErrorCategory::DELIVERY_RETRYABLE
            : ErrorCategory::DELIVERY_FATAL;
        return Result<AwsCredentials>::error(category,
            std::format("STS AssumeRole for {} returned HTTP {} ({}): {}",
                        config_.role_arn, reply->status, code, message));
    }

    auto parsed = parse_assume_role_response(reply->body);
    if (parsed.is_ok()) {
        utils::log::info(std::format("Assumed role {} (expires {})", config_.role_arn,
            parsed.value().expiration
                ? utils::format_timestamp_utc(*parsed.value().expiration)
                : std::string("never")));
    }
    return parsed;
}

Result<AwsCredentials> AssumeRoleCredentialsProvider::parse_assume_role_response(const std::string& xml) {
    const auto scope = xml.find("<Credentials>");
    if (scope == std::string::npos) {
        return Result<AwsCredentials>::error(ErrorCategory::CONFIGURATION_ERROR,
            "AssumeRole response has no Credentials element");
    }

    AwsCredentials creds;
    creds.access_key_id = utils::trim(xml_element(xml, "AccessKeyId", scope));
    creds.secret_access_key = utils::trim(xml_element(xml, "SecretAccessKey", scope));
    creds.session_token = utils::trim(xml_element(xml, "SessionToken", scope));

    if (creds.empty()) {
        return Result<AwsCredentials>::error(ErrorCategory::CONFIGURATION_ERROR,
            "AssumeRole response is missing AccessKeyId or SecretAccessKey");
    }

    const std::string expiration = utils::trim(xml_element(xml, "Expiration", scope));
    if (!expiration.empty()) {
        creds.expiration = parse_iso8601(expiration);
        if (!creds.expiration) {
            utils::log::warn(std::format("AssumeRole: unparseable Expiration '{}'", expiration));
        }
    }
    return Result<AwsCredentials>::ok(std::move(creds));
}

std::optional<Timestamp> AssumeRoleCredentialsProvider::parse_iso8601(const std::string& value) {
    std::tm tm_buf{};
    int consumed = 0;
    if (std::sscanf(value.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                    &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }

    // Optional fractional seconds, then "Z"
    size_t pos = static_cast<size_t>(consumed);
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') ++pos;
    }
    if (pos != value.size() && !(pos + 1 == value.size() && value[pos] == 'Z')) {
        return std::nullopt;
    }

    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    const std::time_t seconds = ::timegm(&tm_buf);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

// ============================================================================
// Factory
// ============================================================================

std::shared_ptr<ICredentialsProvider> make_credentials_provider(const std::string& role_arn,
                                                                const std::string& region) {
    auto env = std::make_shared<EnvCredentialsProvider>();
    if (role_arn.empty()) {
        return env;
    }

    AssumeRoleCredentialsProvider::Config config;
    config.role_arn = role_arn;
    config.region = region;
    return std::make_shared<AssumeRoleCredentialsProvider>(std::move(config), std::move(env));
}

} // namespace flbkinesis
