#include "delivery/http_transport.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace flbkinesis {

std::optional<ParsedUrl> parse_url(const std::string& url) {
    std::string rest;
    std::string scheme;
    if (url.starts_with("https://")) {
        scheme = "https://";
        rest = url.substr(8);
    } else if (url.starts_with("http://")) {
        scheme = "http://";
        rest = url.substr(7);
    } else {
        return std::nullopt;
    }

    ParsedUrl parsed;
    const auto path_pos = rest.find('/');
    std::string authority = rest.substr(0, path_pos);
    parsed.path = path_pos == std::string::npos ? "/" : rest.substr(path_pos);

    if (authority.empty()) {
        return std::nullopt;
    }

    parsed.scheme_host = scheme + authority;
    parsed.host_header = authority;
    return parsed;
}

HttplibTransport::HttplibTransport() = default;

HttplibTransport::HttplibTransport(const Config& config)
    : config_(config) {}

std::optional<HttpReply> HttplibTransport::send(const HttpRequest& request, std::string& error) {
    try {
        httplib::Client cli(request.scheme_host);
        cli.set_connection_timeout(config_.connect_timeout);
        cli.set_read_timeout(config_.read_timeout);

        httplib::Headers headers;
        for (const auto& [name, value] : request.headers) {
            headers.emplace(name, value);
        }

        httplib::Result res = request.method == "GET"
            ? cli.Get(request.path, headers)
            : cli.Post(request.path, headers, request.body, request.content_type);

        if (!res) {
            error = std::format("{} {}{}: {}", request.method, request.scheme_host,
                                request.path, httplib::to_string(res.error()));
            return std::nullopt;
        }
        return HttpReply{res->status, res->body};
    } catch (const std::exception& e) {
        error = std::format("{} {}: {}", request.method, request.scheme_host, e.what());
        return std::nullopt;
    }
}

} // namespace flbkinesis
