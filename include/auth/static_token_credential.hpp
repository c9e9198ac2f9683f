#pragma once

#include "auth/token_credential.hpp"

#include <chrono>
#include <string>

namespace kvault {

/**
 * @brief Pre-issued bearer token (config `access_token` or
 * KVAULT_ACCESS_TOKEN). Cannot refresh: once expired every fetch fails AUTH.
 */
class StaticTokenCredential : public ITokenCredential {
public:
    static constexpr std::chrono::hours kDefaultLifetime{1};

    explicit StaticTokenCredential(SecureString token);
    StaticTokenCredential(SecureString token, TimePoint expires_on);

    [[nodiscard]] Result<AccessToken> fetch_token(const std::string& scope,
                                                  const CancellationToken& cancel) override;

    [[nodiscard]] std::string name() const override { return "static_token"; }

private:
    SecureString token_;
    TimePoint expires_on_;
};

} // namespace kvault
