#include "auth/client_secret_credential.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace kvault {

using json = nlohmann::json;

ClientSecretCredential::ClientSecretCredential(ClientSecretConfig config,
                                               std::shared_ptr<IHttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

std::string ClientSecretCredential::token_endpoint() const {
    std::string authority = config_.authority_host;
    while (!authority.empty() && authority.back() == '/') authority.pop_back();
    return std::format("{}/{}/oauth2/v2.0/token", authority, config_.tenant_id);
}

Result<AccessToken> ClientSecretCredential::fetch_token(const std::string& scope,
                                                        const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return Result<AccessToken>::error(ErrorCode::CANCELLED, "Token request cancelled");
    }

    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = token_endpoint();
    req.content_type = http::kFormContentType;
    req.body = std::format("grant_type=client_credentials&client_id={}&client_secret={}&scope={}",
                           utils::url_encode(config_.client_id),
                           utils::url_encode(config_.client_secret.view()),
                           utils::url_encode(scope));

    auto result = transport_->send(req);
    utils::secure_wipe(req.body);

    if (!result.ok) {
        return Result<AccessToken>::error(Error{
            .code = ErrorCode::TRANSIENT,
            .message = std::format("Token endpoint unreachable: {}", result.error),
        });
    }

    const int status = result.response.status;
    if (status == 200) {
        return parse_token_response(result.response.body, scope);
    }

    // Error bodies carry no secrets, but keep the message short
    std::string detail;
    try {
        const auto body = json::parse(result.response.body);
        if (body.is_object() && body.contains("error_description") &&
            body["error_description"].is_string()) {
            detail = body["error_description"].get<std::string>();
            detail = detail.substr(0, detail.find('\n'));
        }
    } catch (const json::exception&) {
        // Non-JSON error page
    }
    utils::secure_wipe(result.response.body);

    Error err{
        .code = ErrorCode::AUTH,
        .message = std::format("Token request for client '{}' rejected (HTTP {}){}{}",
                               config_.client_id, status, detail.empty() ? "" : ": ", detail),
        .http_status = status,
    };
    if (status == 408 || status == 429 || status >= 500) {
        err.code = ErrorCode::TRANSIENT;
    }
    return Result<AccessToken>::error(std::move(err));
}

Result<AccessToken> ClientSecretCredential::parse_token_response(std::string& body,
                                                                 const std::string& scope) const {
    AccessToken token;
    token.scope = scope;

    try {
        auto parsed = json::parse(body);
        utils::secure_wipe(body);

        if (!parsed.is_object() || !parsed.contains("access_token") ||
            !parsed["access_token"].is_string()) {
            return Result<AccessToken>::error(ErrorCode::AUTH,
                "Token response missing access_token");
        }

        auto& raw = parsed["access_token"].get_ref<std::string&>();
        token.token = SecureString::adopt(raw);

        // expires_in is a number in v2.0 responses, a string in v1.0
        int64_t expires_in = 3600;
        if (parsed.contains("expires_in")) {
            const auto& e = parsed["expires_in"];
            if (e.is_number_integer()) {
                expires_in = e.get<int64_t>();
            } else if (e.is_string()) {
                expires_in = utils::try_parse_int<int64_t>(e.get<std::string>()).value_or(3600);
            }
        }
        token.expires_on = std::chrono::system_clock::now() + std::chrono::seconds(expires_in);
    } catch (const json::exception& e) {
        utils::secure_wipe(body);
        return Result<AccessToken>::error(ErrorCode::AUTH,
            std::format("Malformed token response: {}", e.what()));
    }

    utils::log::debug(std::format("Acquired token for scope '{}' (client '{}')",
                                  scope, config_.client_id));
    return Result<AccessToken>::ok(std::move(token));
}

} // namespace kvault
