#pragma once

#include "core/cancellation.hpp"
#include "core/error.hpp"
#include "core/secure_string.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>

namespace kvault {

class IHttpTransport;
struct AuthConfig;

/**
 * @brief Bearer credential for one audience scope. The token text is wiped
 * when the last owner releases it.
 */
struct AccessToken {
    SecureString token;
    TimePoint expires_on{};
    std::string scope;
};

/// Callers borrow a token for one call; never copy `token` out of the lease.
using TokenLease = std::shared_ptr<const AccessToken>;

/**
 * @brief Identity-endpoint round trip. AuthTokenProvider caches and
 * single-flights calls to fetch_token().
 */
class ITokenCredential {
public:
    virtual ~ITokenCredential() = default;

    /**
     * @brief Obtain a fresh token for the scope
     * @return AUTH when the credential is rejected, TRANSIENT on transport
     *         failure or overload, CANCELLED when `cancel` fired first
     */
    [[nodiscard]] virtual Result<AccessToken> fetch_token(const std::string& scope,
                                                          const CancellationToken& cancel) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Build the credential selected by the auth config
 *
 * ENVIRONMENT reads AZURE_TENANT_ID / AZURE_CLIENT_ID / AZURE_CLIENT_SECRET and
 * falls back to KVAULT_ACCESS_TOKEN.
 */
[[nodiscard]] Result<std::shared_ptr<ITokenCredential>> make_credential(
    const AuthConfig& config, std::shared_ptr<IHttpTransport> transport);

} // namespace kvault
