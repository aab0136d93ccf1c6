#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "delivery/http_transport.hpp"
#include "delivery/sigv4_signer.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace flbkinesis {

/**
 * @brief Source of AWS credentials for request signing
 *
 * Implementations must be safe to call from several flush tasks at once.
 */
class ICredentialsProvider {
public:
    virtual ~ICredentialsProvider() = default;

    [[nodiscard]] virtual Result<AwsCredentials> get_credentials() = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// ============================================================================
// Environment: AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY / AWS_SESSION_TOKEN
// ============================================================================

class EnvCredentialsProvider : public ICredentialsProvider {
public:
    [[nodiscard]] Result<AwsCredentials> get_credentials() override;
    [[nodiscard]] std::string name() const override { return "env"; }
};

/// Fixed credentials (replay tool, tests)
class StaticCredentialsProvider : public ICredentialsProvider {
public:
    explicit StaticCredentialsProvider(AwsCredentials credentials)
        : credentials_(std::move(credentials)) {}

    [[nodiscard]] Result<AwsCredentials> get_credentials() override {
        return Result<AwsCredentials>::ok(credentials_);
    }
    [[nodiscard]] std::string name() const override { return "static"; }

private:
    AwsCredentials credentials_;
};

// ============================================================================
// STS AssumeRole
// ============================================================================

/**
 * @brief Temporary credentials for role_arn, obtained through STS AssumeRole
 *
 * The base provider signs the AssumeRole call. Results are cached and
 * refreshed kRefreshWindow before they expire.
 */
class AssumeRoleCredentialsProvider : public ICredentialsProvider {
public:
    struct Config {
        std::string role_arn;
        std::string region;
        std::string endpoint;                       // empty = https://sts.<region>.amazonaws.com
        std::string session_name = "flb-kinesis";
        std::chrono::seconds duration{3600};
    };

    AssumeRoleCredentialsProvider(Config config, std::shared_ptr<ICredentialsProvider> base);
    AssumeRoleCredentialsProvider(Config config, std::shared_ptr<ICredentialsProvider> base,
                                  std::shared_ptr<IHttpTransport> transport);

    [[nodiscard]] Result<AwsCredentials> get_credentials() override;
    [[nodiscard]] std::string name() const override { return "assume_role:" + config_.role_arn; }

    /**
     * @brief Extract credentials from an AssumeRoleResponse XML document
     * @return CONFIGURATION_ERROR when AccessKeyId or SecretAccessKey is missing
     */
    [[nodiscard]] static Result<AwsCredentials> parse_assume_role_response(const std::string& xml);

    /// "2011-07-15T23:28:33Z" (fractional seconds allowed)
    [[nodiscard]] static std::optional<Timestamp> parse_iso8601(const std::string& value);

    static constexpr std::chrono::minutes kRefreshWindow{5};

private:
    [[nodiscard]] Result<AwsCredentials> assume_role();

    Config config_;
    std::shared_ptr<ICredentialsProvider> base_;
    std::shared_ptr<IHttpTransport> transport_;

    std::mutex mutex_;
    std::optional<AwsCredentials> cached_;
};

/// Env credentials, wrapped in AssumeRole when role_arn is set
[[nodiscard]] std::shared_ptr<ICredentialsProvider> make_credentials_provider(
    const std::string& role_arn, const std::string& region);

} // namespace flbkinesis
