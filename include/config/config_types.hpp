#pragma once

#include "executor/retry_policy.hpp"
#include "transport/httplib_transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace kvault {

// ============================================================================
// Configuration Types
// ============================================================================

enum class AuthMethod : uint8_t {
    ENVIRONMENT,        // AZURE_* variables, then KVAULT_ACCESS_TOKEN
    CLIENT_SECRET,
    STATIC_TOKEN
};

struct AuthConfig {
    AuthMethod method = AuthMethod::ENVIRONMENT;
    std::string tenant_id;
    std::string client_id;
    std::string client_secret;
    std::string access_token;
    std::string authority_host = "https://login.microsoftonline.com";
    std::string scope = "https://vault.azure.net/.default";
    std::chrono::seconds refresh_margin{300};
};

struct VaultConfig {
    std::string default_vault;
    std::string dns_suffix = "vault.azure.net";
    std::string api_version = "7.4";
    uint32_t page_size = 25;
};

struct LoggingConfig {
    std::string level = "info";
};

struct ClientConfig {
    AuthConfig auth;
    VaultConfig vault;
    HttpClientConfig http;
    RetryPolicy retry;
    LoggingConfig logging;
};

} // namespace kvault
