#include "auth/static_token_credential.hpp"

namespace kvault {

StaticTokenCredential::StaticTokenCredential(SecureString token)
    : token_(std::move(token)),
      expires_on_(std::chrono::system_clock::now() + kDefaultLifetime) {}

StaticTokenCredential::StaticTokenCredential(SecureString token, TimePoint expires_on)
    : token_(std::move(token)), expires_on_(expires_on) {}

Result<AccessToken> StaticTokenCredential::fetch_token(const std::string& scope,
                                                       const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return Result<AccessToken>::error(ErrorCode::CANCELLED, "Token request cancelled");
    }
    if (token_.empty()) {
        return Result<AccessToken>::error(ErrorCode::AUTH, "No access token configured");
    }
    if (std::chrono::system_clock::now() >= expires_on_) {
        return Result<AccessToken>::error(ErrorCode::AUTH,
            "Configured access token has expired and cannot be refreshed");
    }

    return Result<AccessToken>::ok(AccessToken{
        .token = token_.clone(),
        .expires_on = expires_on_,
        .scope = scope,
    });
}

} // namespace kvault
