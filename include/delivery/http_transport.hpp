#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace flbkinesis {

struct HttpRequest {
    std::string method = "POST";                    // "GET" or "POST"
    std::string scheme_host;                        // "https://kinesis.us-east-1.amazonaws.com"
    std::string path = "/";                         // may carry an encoded query
    std::map<std::string, std::string> headers;
    std::string body;
    std::string content_type;
};

struct HttpReply {
    int status = 0;
    std::string body;
};

/**
 * @brief Minimal HTTP boundary used by the AWS clients
 *
 * send() returns nullopt on transport failure (connect, TLS, timeout)
 * and describes the failure in error.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    [[nodiscard]] virtual std::optional<HttpReply> send(const HttpRequest& request,
                                                        std::string& error) = 0;
};

/// cpp-httplib client per request, with TLS through OpenSSL
class HttplibTransport : public IHttpTransport {
public:
    struct Config {
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds read_timeout{30};
    };

    HttplibTransport();
    explicit HttplibTransport(const Config& config);

    [[nodiscard]] std::optional<HttpReply> send(const HttpRequest& request,
                                                std::string& error) override;

private:
    Config config_;
};

/// Split "https://host:port/path" into scheme_host ("https://host:port") and path ("/path")
struct ParsedUrl {
    std::string scheme_host;
    std::string host_header;    // host, plus ":port" when the port is explicit
    std::string path;
};

[[nodiscard]] std::optional<ParsedUrl> parse_url(const std::string& url);

} // namespace flbkinesis
