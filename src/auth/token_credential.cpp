#include "auth/token_credential.hpp"
#include "auth/client_secret_credential.hpp"
#include "auth/static_token_credential.hpp"
#include "config/config_types.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>

namespace kvault {

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string{};
}

Result<std::shared_ptr<ITokenCredential>> client_secret(const std::string& tenant_id,
                                                        const std::string& client_id,
                                                        std::string secret,
                                                        const std::string& authority_host,
                                                        std::shared_ptr<IHttpTransport> transport) {
    using R = Result<std::shared_ptr<ITokenCredential>>;
    if (tenant_id.empty()) return R::error(ErrorCode::VALIDATION, "auth.tenant_id is required");
    if (client_id.empty()) return R::error(ErrorCode::VALIDATION, "auth.client_id is required");
    if (secret.empty()) return R::error(ErrorCode::VALIDATION, "auth.client_secret is required");
    if (!transport) return R::error(ErrorCode::INTERNAL, "client_secret auth needs an HTTP transport");

    ClientSecretConfig cfg{
        .tenant_id = tenant_id,
        .client_id = client_id,
        .client_secret = SecureString::adopt(secret),
        .authority_host = authority_host,
    };
    return R::ok(std::make_shared<ClientSecretCredential>(std::move(cfg), std::move(transport)));
}

} // anonymous namespace

Result<std::shared_ptr<ITokenCredential>> make_credential(
    const AuthConfig& config, std::shared_ptr<IHttpTransport> transport) {
    using R = Result<std::shared_ptr<ITokenCredential>>;

    switch (config.method) {
        case AuthMethod::CLIENT_SECRET:
            return client_secret(config.tenant_id, config.client_id, config.client_secret,
                                 config.authority_host, std::move(transport));

        case AuthMethod::STATIC_TOKEN: {
            std::string token = config.access_token.empty()
                ? env_or_empty("KVAULT_ACCESS_TOKEN") : config.access_token;
            if (token.empty()) {
                return R::error(ErrorCode::VALIDATION,
                    "static_token auth needs auth.access_token or KVAULT_ACCESS_TOKEN");
            }
            return R::ok(std::make_shared<StaticTokenCredential>(SecureString::adopt(token)));
        }

        case AuthMethod::ENVIRONMENT:
        default: {
            const auto tenant = env_or_empty("AZURE_TENANT_ID");
            const auto client = env_or_empty("AZURE_CLIENT_ID");
            auto secret = env_or_empty("AZURE_CLIENT_SECRET");
            if (!tenant.empty() && !client.empty() && !secret.empty()) {
                utils::log::debug(std::format("Using client secret credential for '{}' from environment",
                                              client));
                return client_secret(tenant, client, std::move(secret),
                                     config.authority_host, std::move(transport));
            }

            auto token = env_or_empty("KVAULT_ACCESS_TOKEN");
            if (!token.empty()) {
                utils::log::debug("Using static access token from KVAULT_ACCESS_TOKEN");
                return R::ok(std::make_shared<StaticTokenCredential>(SecureString::adopt(token)));
            }
            return R::error(ErrorCode::AUTH,
                "No credentials in environment: set AZURE_TENANT_ID, AZURE_CLIENT_ID and "
                "AZURE_CLIENT_SECRET, or KVAULT_ACCESS_TOKEN");
        }
    }
}

} // namespace kvault
