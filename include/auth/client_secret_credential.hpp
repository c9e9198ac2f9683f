#pragma once

#include "auth/token_credential.hpp"
#include "transport/http_transport.hpp"

#include <memory>
#include <string>

namespace kvault {

struct ClientSecretConfig {
    std::string tenant_id;
    std::string client_id;
    SecureString client_secret;
    std::string authority_host = "https://login.microsoftonline.com";
};

/**
 * @brief OAuth2 client-credentials grant against the Microsoft identity
 * platform (POST {authority}/{tenant}/oauth2/v2.0/token).
 */
class ClientSecretCredential : public ITokenCredential {
public:
    ClientSecretCredential(ClientSecretConfig config, std::shared_ptr<IHttpTransport> transport);

    [[nodiscard]] Result<AccessToken> fetch_token(const std::string& scope,
                                                  const CancellationToken& cancel) override;

    [[nodiscard]] std::string name() const override { return "client_secret"; }

    [[nodiscard]] std::string token_endpoint() const;

private:
    [[nodiscard]] Result<AccessToken> parse_token_response(std::string& body,
                                                           const std::string& scope) const;

    ClientSecretConfig config_;
    std::shared_ptr<IHttpTransport> transport_;
};

} // namespace kvault
