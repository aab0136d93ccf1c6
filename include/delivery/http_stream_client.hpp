#pragma once

#include "delivery/credentials_provider.hpp"
#include "delivery/http_transport.hpp"
#include "delivery/istream_client.hpp"
#include "delivery/sigv4_signer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace flbkinesis {

/**
 * @brief Kinesis Data Streams PutRecords over HTTPS
 *
 * JSON 1.1 protocol (X-Amz-Target: Kinesis_20131202.PutRecords), record
 * data base64-encoded, every request signed with SigV4. Stateless apart
 * from the configuration; safe for concurrent put_records() calls.
 */
class HttpStreamClient : public IStreamClient {
public:
    struct Config {
        std::string region;
        std::string endpoint;       // empty = https://kinesis.<region>.amazonaws.com; no scheme = https
    };

    HttpStreamClient(Config config, std::shared_ptr<ICredentialsProvider> credentials);
    HttpStreamClient(Config config, std::shared_ptr<ICredentialsProvider> credentials,
                     std::shared_ptr<IHttpTransport> transport);

    [[nodiscard]] PutRecordsResponse put_records(
        const std::string& stream, const std::vector<PutRecordsEntry>& entries) override;

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] const std::string& endpoint() const { return config_.endpoint; }

    // ---- Wire format (exposed for tests) ----

    /// {"StreamName": ..., "Records": [{"Data": <base64>, "PartitionKey": ...}, ...]}
    [[nodiscard]] static std::string build_request_body(const std::string& stream,
                                                        const std::vector<PutRecordsEntry>& entries);

    /// Decode an HTTP reply into a PutRecordsResponse (transport_ok = true)
    [[nodiscard]] static PutRecordsResponse parse_response(int http_status, const std::string& body);

    /// "com.amazonaws.kinesis.v20131202#ResourceNotFoundException" → "ResourceNotFoundException"
    [[nodiscard]] static std::string error_type(const std::string& raw);

    [[nodiscard]] static std::string default_endpoint(const std::string& region);

    /// "localhost:4566" → "https://localhost:4566"; empty → default_endpoint(region)
    [[nodiscard]] static std::string resolve_endpoint(const std::string& region, const std::string& endpoint);

    static constexpr const char* kTargetHeader = "X-Amz-Target";
    static constexpr const char* kPutRecordsTarget = "Kinesis_20131202.PutRecords";
    static constexpr const char* kContentType = "application/x-amz-json-1.1";
    static constexpr const char* kServiceName = "kinesis";

private:
    Config config_;
    std::shared_ptr<ICredentialsProvider> credentials_;
    std::shared_ptr<IHttpTransport> transport_;
    SigV4Signer signer_;
};

} // namespace flbkinesis
