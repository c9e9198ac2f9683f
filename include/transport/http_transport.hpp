#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace kvault {

namespace http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kRetryAfterHeader = "Retry-After";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kFormContentType = "application/x-www-form-urlencoded";

} // namespace http

enum class HttpMethod : uint8_t {
    GET,
    PUT,
    POST,
    PATCH,
    DELETE_
};

[[nodiscard]] inline const char* http_method_to_string(HttpMethod m) {
    switch (m) {
        case HttpMethod::GET:     return "GET";
        case HttpMethod::PUT:     return "PUT";
        case HttpMethod::POST:    return "POST";
        case HttpMethod::PATCH:   return "PATCH";
        case HttpMethod::DELETE_: return "DELETE";
        default:                  return "UNKNOWN";
    }
}

/// Case-insensitive header lookup key ordering
struct HeaderLess {
    bool operator()(const std::string& a, const std::string& b) const {
        const size_t n = a.size() < b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; ++i) {
            const char ca = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] + 32) : a[i];
            const char cb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] + 32) : b[i];
            if (ca != cb) return ca < cb;
        }
        return a.size() < b.size();
    }
};

using HeaderMap = std::map<std::string, std::string, HeaderLess>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;                    // absolute: scheme://host[:port]/path?query
    HeaderMap headers;
    std::string body;
    std::string content_type;
    // False for calls that create server-side state (new secret version)
    bool idempotent = true;
};

struct HttpResponse {
    int status = 0;
    HeaderMap headers;
    std::string body;
};

/**
 * @brief Why a request produced no HTTP response.
 *
 * CONNECT means the request provably never left this process; every other
 * failure is ambiguous about whether the server acted on it.
 */
enum class TransportFailure : uint8_t {
    NONE,
    CONNECT,
    TIMEOUT,
    READ,
    WRITE,
    TLS,
    OTHER
};

[[nodiscard]] inline const char* transport_failure_to_string(TransportFailure f) {
    switch (f) {
        case TransportFailure::NONE:    return "none";
        case TransportFailure::CONNECT: return "connect";
        case TransportFailure::TIMEOUT: return "timeout";
        case TransportFailure::READ:    return "read";
        case TransportFailure::WRITE:   return "write";
        case TransportFailure::TLS:     return "tls";
        case TransportFailure::OTHER:   return "other";
        default:                        return "unknown";
    }
}

struct TransportResult {
    bool ok = false;
    HttpResponse response;
    TransportFailure failure = TransportFailure::NONE;
    std::string error;

    static TransportResult success(HttpResponse resp) {
        return {true, std::move(resp), TransportFailure::NONE, {}};
    }

    static TransportResult failed(TransportFailure f, std::string message) {
        return {false, {}, f, std::move(message)};
    }
};

/**
 * @brief Single HTTP round trip. Implementations must be safe to call from
 * several threads at once.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    [[nodiscard]] virtual TransportResult send(const HttpRequest& request) = 0;
};

} // namespace kvault
