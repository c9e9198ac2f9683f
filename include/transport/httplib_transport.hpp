#pragma once

#include "transport/http_transport.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace kvault {

struct HttpClientConfig {
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds read_timeout{120000};
    std::string user_agent = "kvault/1.0.0";
};

/**
 * @brief cpp-httplib backed HTTPS transport
 *
 * A fresh httplib::Client is created per call so concurrent operations never
 * share socket state. The Authorization header copy handed to httplib is
 * zeroed once the call returns.
 */
class HttplibTransport : public IHttpTransport {
public:
    HttplibTransport();
    explicit HttplibTransport(HttpClientConfig config);

    [[nodiscard]] TransportResult send(const HttpRequest& request) override;

    [[nodiscard]] uint64_t requests_sent() const {
        return requests_sent_.load(std::memory_order_relaxed);
    }

    /// Split "https://host:port/path?q" into ("https://host:port", "/path?q").
    [[nodiscard]] static bool split_url(const std::string& url, std::string& origin, std::string& path);

private:
    HttpClientConfig config_;
    std::atomic<uint64_t> requests_sent_{0};
};

} // namespace kvault
