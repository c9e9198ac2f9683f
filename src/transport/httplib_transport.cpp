#include "transport/httplib_transport.hpp"
#include "core/utils.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace kvault {

namespace {

TransportFailure classify(httplib::Error err) {
    switch (err) {
        case httplib::Error::Connection:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::BindIPAddress:
        case httplib::Error::ProxyConnection:
            return TransportFailure::CONNECT;
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLLoadingCerts:
        case httplib::Error::SSLServerVerification:
            // Handshake failures happen before any request byte is written
            return TransportFailure::TLS;
        case httplib::Error::Read:
            return TransportFailure::READ;
        case httplib::Error::Write:
            return TransportFailure::WRITE;
        default:
            return TransportFailure::OTHER;
    }
}

} // anonymous namespace

HttplibTransport::HttplibTransport() = default;

HttplibTransport::HttplibTransport(HttpClientConfig config)
    : config_(std::move(config)) {}

bool HttplibTransport::split_url(const std::string& url, std::string& origin, std::string& path) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;

    const auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        origin = url;
        path = "/";
    } else {
        origin = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return origin.size() > scheme_end + 3;
}

TransportResult HttplibTransport::send(const HttpRequest& request) {
    std::string origin;
    std::string path;
    if (!split_url(request.url, origin, path)) {
        return TransportResult::failed(TransportFailure::CONNECT,
            std::format("Malformed URL '{}'", request.url));
    }

    httplib::Client cli(origin);
    cli.set_connection_timeout(config_.connect_timeout);
    cli.set_read_timeout(config_.read_timeout);
    cli.set_write_timeout(config_.read_timeout);

    httplib::Request req;
    req.method = http_method_to_string(request.method);
    req.path = path;
    for (const auto& [name, value] : request.headers) {
        req.headers.emplace(name, value);
    }
    req.headers.emplace("User-Agent", config_.user_agent);
    if (!request.content_type.empty()) {
        req.headers.emplace("Content-Type", request.content_type);
    }
    req.body = request.body;

    requests_sent_.fetch_add(1, std::memory_order_relaxed);
    auto res = cli.send(req);

    // Our copies of credentials and payload are no longer needed
    for (auto& [name, value] : req.headers) {
        if (name == http::kAuthorizationHeader) {
            utils::secure_wipe(value);
        }
    }
    utils::secure_wipe(req.body);

    if (!res) {
        const auto err = res.error();
        const auto failure = classify(err);
        utils::log::debug(std::format("HTTP {} {}{} failed: {} ({})",
            req.method, origin, path, httplib::to_string(err),
            transport_failure_to_string(failure)));
        return TransportResult::failed(failure, httplib::to_string(err));
    }

    HttpResponse response;
    response.status = res->status;
    for (const auto& [name, value] : res->headers) {
        response.headers.emplace(name, value);
    }
    response.body = std::move(res->body);
    utils::secure_wipe(res->body);

    return TransportResult::success(std::move(response));
}

} // namespace kvault
