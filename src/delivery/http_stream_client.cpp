#include "delivery/http_stream_client.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace flbkinesis {

HttpStreamClient::HttpStreamClient(Config config, std::shared_ptr<ICredentialsProvider> credentials)
    : HttpStreamClient(std::move(config), std::move(credentials),
                       std::make_shared<HttplibTransport>()) {}

HttpStreamClient::HttpStreamClient(Config config, std::shared_ptr<ICredentialsProvider> credentials,
                                   std::shared_ptr<IHttpTransport> transport)
    : config_(std::move(config)),
      credentials_(std::move(credentials)),
      transport_(std::move(transport)),
      signer_(config_.region, kServiceName) {
    config_.endpoint = resolve_endpoint(config_.region, config_.endpoint);
}

std::string HttpStreamClient::default_endpoint(const std::string& region) {
    return std::format("https://kinesis.{}.amazonaws.com", region);
}

std::string HttpStreamClient::resolve_endpoint(const std::string& region, const std::string& endpoint) {
    if (endpoint.empty()) {
        return default_endpoint(region);
    }
    if (endpoint.find("://") == std::string::npos) {
        return "https://" + endpoint;
    }
    return endpoint;
}

std::string HttpStreamClient::name() const {
    return std::format("kinesis:{} ({})", config_.region, config_.endpoint);
}

// ============================================================================
// Wire format
// ============================================================================

std::string HttpStreamClient::build_request_body(const std::string& stream,
                                                 const std::vector<PutRecordsEntry>& entries) {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& entry : entries) {
        records.push_back({
            {"Data", base64::encode(entry.data)},
            {"PartitionKey", entry.partition_key},
        });
    }

    const nlohmann::json body = {
        {"StreamName", stream},
        {"Records", std::move(records)},
    };
    return body.dump();
}

std::string HttpStreamClient::error_type(const std::string& raw) {
    const auto pos = raw.rfind('#');
    std::string type = pos == std::string::npos ? raw : raw.substr(pos + 1);
    // Some error types carry a ":<url>" suffix
    if (const auto colon = type.find(':'); colon != std::string::npos) {
        type.resize(colon);
    }
    return type;
}

PutRecordsResponse HttpStreamClient::parse_response(int http_status, const std::string& body) {
    PutRecordsResponse response;
    response.transport_ok = true;
    response.http_status = http_status;

    const auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    const bool is_object = doc.is_object();

    if (http_status < 200 || http_status >= 300) {
        if (is_object) {
            response.error_code = error_type(doc.value("__type", ""));
            response.error_message = doc.contains("message")
                ? doc.value("message", "")
                : doc.value("Message", "");
        }
        if (response.error_code.empty()) {
            response.error_code = std::format("HTTP{}", http_status);
        }
        if (response.error_message.empty()) {
            response.error_message = body.substr(0, 256);
        }
        return response;
    }

    if (!is_object) {
        // 2xx with a body we cannot read; treat as a server fault so it is retried
        response.http_status = 500;
        response.error_code = "InvalidResponse";
        response.error_message = "unparseable PutRecords response";
        return response;
    }

    response.failed_record_count = doc.value("FailedRecordCount", 0u);

    if (const auto it = doc.find("Records"); it != doc.end() && it->is_array()) {
        response.records.reserve(it->size());
        for (const auto& item : *it) {
            PutRecordsEntryResult result;
            if (item.is_object()) {
                result.sequence_number = item.value("SequenceNumber", "");
                result.shard_id = item.value("ShardId", "");
                result.error_code = item.value("ErrorCode", "");
                result.error_message = item.value("ErrorMessage", "");
            }
            response.records.push_back(std::move(result));
        }
    }
    return response;
}

// ============================================================================
// PutRecords
// ============================================================================

PutRecordsResponse HttpStreamClient::put_records(const std::string& stream,
                                                 const std::vector<PutRecordsEntry>& entries) {
    PutRecordsResponse failure;

    const auto url = parse_url(config_.endpoint);
    if (!url) {
        failure.error_message = std::format("invalid endpoint '{}'", config_.endpoint);
        return failure;
    }

    const auto creds = credentials_
        ? credentials_->get_credentials()
        : Result<AwsCredentials>::error(ErrorCategory::CONFIGURATION_ERROR, "no credentials provider");
    if (creds.is_error()) {
        failure.error_message = std::format("credentials unavailable ({}): {}",
            error_category_to_string(creds.error_category()), creds.error_message());
        return failure;
    }

    SigningRequest signing;
    signing.method = "POST";
    signing.canonical_uri = url->path;
    signing.headers = {
        {"host", url->host_header},
        {"content-type", kContentType},
        {"x-amz-target", kPutRecordsTarget},
    };
    signing.payload = build_request_body(stream, entries);

    const std::string authorization = signer_.sign(signing, creds.value(), utils::now());

    HttpRequest request;
    request.method = "POST";
    request.scheme_host = url->scheme_host;
    request.path = url->path;
    request.content_type = kContentType;
    request.headers = {
        {"Host", url->host_header},
        {kTargetHeader, kPutRecordsTarget},
        {"X-Amz-Date", signing.headers["x-amz-date"]},
        {"Authorization", authorization},
    };
    if (const auto it = signing.headers.find("x-amz-security-token"); it != signing.headers.end()) {
        request.headers["X-Amz-Security-Token"] = it->second;
    }
    request.body = std::move(signing.payload);

    utils::log::debug(std::format("PutRecords {} entries ({} bytes) to {}/{}",
        entries.size(), request.body.size(), config_.endpoint, stream));

    std::string error;
    const auto reply = transport_->send(request, error);
    if (!reply) {
        failure.error_message = error;
        return failure;
    }
    return parse_response(reply->status, reply->body);
}

} // namespace flbkinesis
