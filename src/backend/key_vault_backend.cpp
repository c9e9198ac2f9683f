#include "backend/key_vault_backend.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace kvault {

using json = nlohmann::json;

namespace {

constexpr std::string_view kSecretsSegment = "/secrets/";

// Bound on versions-listing pages walked for current properties
constexpr size_t kMaxPropertyPages = 1000;

std::optional<TimePoint> unix_attr(const json& attrs, const char* key) {
    if (attrs.is_object() && attrs.contains(key) && attrs[key].is_number_integer()) {
        return utils::from_unix_seconds(attrs[key].get<int64_t>());
    }
    return std::nullopt;
}

TagMap tags_from_json(const json& node) {
    TagMap tags;
    if (!node.is_object() || !node.contains("tags") || !node["tags"].is_object()) {
        return tags;
    }
    for (const auto& [key, value] : node["tags"].items()) {
        if (value.is_string()) {
            tags.emplace(key, value.get<std::string>());
        }
    }
    return tags;
}

SecretItem item_from_json(const json& node) {
    SecretItem item;
    KeyVaultBackend::split_secret_id(node.value("id", ""), item.backend_id, item.version_id);
    item.tags = tags_from_json(node);
    item.content_type = node.value("contentType", "");

    if (node.contains("attributes") && node["attributes"].is_object()) {
        const auto& attrs = node["attributes"];
        item.enabled = attrs.value("enabled", true);
        item.created_at = unix_attr(attrs, "created").value_or(TimePoint{});
        item.updated_at = unix_attr(attrs, "updated").value_or(item.created_at);
        item.expires_at = unix_attr(attrs, "exp");
    }

    // Deleted-secret envelope
    if (node.contains("recoveryId") || node.contains("deletedDate")) {
        item.deleted = true;
        item.deleted_on = unix_attr(node, "deletedDate");
        item.scheduled_purge = unix_attr(node, "scheduledPurgeDate");
    }
    return item;
}

Result<json> parse_body(const std::string& body) {
    try {
        return Result<json>::ok(json::parse(body));
    } catch (const json::parse_error& e) {
        return Result<json>::error(ErrorCode::INTERNAL,
            std::format("Malformed backend response: {}", e.what()));
    }
}

} // anonymous namespace

KeyVaultBackend::KeyVaultBackend(std::shared_ptr<OperationExecutor> executor,
                                 VaultConfig config,
                                 std::string scope)
    : executor_(std::move(executor)), config_(std::move(config)), scope_(std::move(scope)) {}

// ============================================================================
// URL Construction
// ============================================================================

std::string KeyVaultBackend::vault_url(const std::string& vault) const {
    return std::format("https://{}.{}", vault, config_.dns_suffix);
}

std::string KeyVaultBackend::endpoint(const std::string& vault, const std::string& path,
                                      const std::string& extra_query) const {
    std::string url = std::format("{}{}?api-version={}", vault_url(vault), path, config_.api_version);
    if (!extra_query.empty()) {
        url += '&';
        url += extra_query;
    }
    return url;
}

void KeyVaultBackend::split_secret_id(const std::string& id, std::string& name, std::string& version) {
    name.clear();
    version.clear();

    auto pos = id.find(kSecretsSegment);
    if (pos == std::string::npos) {
        // deletedsecrets ids share the layout
        pos = id.find("/deletedsecrets/");
        if (pos == std::string::npos) return;
        pos += std::string_view("/deletedsecrets/").size();
    } else {
        pos += kSecretsSegment.size();
    }

    const auto rest = id.substr(pos);
    const auto slash = rest.find('/');
    if (slash == std::string::npos) {
        name = rest;
    } else {
        name = rest.substr(0, slash);
        version = rest.substr(slash + 1);
        if (const auto q = version.find('?'); q != std::string::npos) version.resize(q);
        if (!version.empty() && version.back() == '/') version.pop_back();
    }
}

// ============================================================================
// Payload Mapping
// ============================================================================

std::string KeyVaultBackend::build_set_body(const SetSecretRequest& request) {
    json body = json::object();
    body["value"] = std::string(request.value.view());
    body["tags"] = request.tags;
    if (!request.content_type.empty()) {
        body["contentType"] = request.content_type;
    }

    json attrs = json::object();
    attrs["enabled"] = request.enabled;
    if (request.expires_at) attrs["exp"] = utils::to_unix_seconds(*request.expires_at);
    if (request.not_before) attrs["nbf"] = utils::to_unix_seconds(*request.not_before);
    body["attributes"] = std::move(attrs);

    std::string out = body.dump();
    utils::secure_wipe(body["value"].get_ref<std::string&>());
    return out;
}

Result<StoredSecret> KeyVaultBackend::parse_secret_bundle(std::string& body) {
    auto parsed = parse_body(body);
    utils::secure_wipe(body);
    if (parsed.is_error()) {
        return Result<StoredSecret>::error(parsed.error());
    }

    auto& node = parsed.value();
    if (!node.is_object() || !node.contains("id")) {
        return Result<StoredSecret>::error(ErrorCode::INTERNAL, "Secret bundle missing 'id'");
    }

    const SecretItem item = item_from_json(node);

    StoredSecret secret;
    secret.backend_id = item.backend_id;
    secret.version_id = item.version_id;
    secret.tags = item.tags;
    secret.enabled = item.enabled;
    secret.created_at = item.created_at;
    secret.updated_at = item.updated_at;
    secret.expires_at = item.expires_at;
    secret.content_type = item.content_type;

    if (node.contains("value") && node["value"].is_string()) {
        secret.value = SecureString::adopt(node["value"].get_ref<std::string&>());
    }
    return Result<StoredSecret>::ok(std::move(secret));
}

Result<SecretItem> KeyVaultBackend::parse_secret_item(const std::string& body) {
    auto parsed = parse_body(body);
    if (parsed.is_error()) {
        return Result<SecretItem>::error(parsed.error());
    }
    auto& node = parsed.value();
    if (node.is_object() && node.contains("value") && node["value"].is_string()) {
        utils::secure_wipe(node["value"].get_ref<std::string&>());
    }
    if (!node.is_object() || !node.contains("id")) {
        return Result<SecretItem>::error(ErrorCode::INTERNAL, "Secret item missing 'id'");
    }
    return Result<SecretItem>::ok(item_from_json(node));
}

Result<Page<SecretItem>> KeyVaultBackend::parse_item_page(const std::string& body) {
    auto parsed = parse_body(body);
    if (parsed.is_error()) {
        return Result<Page<SecretItem>>::error(parsed.error());
    }

    const auto& node = parsed.value();
    if (!node.is_object() || !node.contains("value") || !node["value"].is_array()) {
        return Result<Page<SecretItem>>::error(ErrorCode::INTERNAL, "Listing page missing 'value' array");
    }

    Page<SecretItem> page;
    page.items.reserve(node["value"].size());
    for (const auto& entry : node["value"]) {
        if (!entry.is_object() || !entry.contains("id")) continue;
        page.items.push_back(item_from_json(entry));
    }
    if (node.contains("nextLink") && node["nextLink"].is_string()) {
        auto link = node["nextLink"].get<std::string>();
        if (!link.empty()) page.next_cursor = std::move(link);
    }
    return Result<Page<SecretItem>>::ok(std::move(page));
}

// ============================================================================
// Calls
// ============================================================================

Result<HttpResponse> KeyVaultBackend::call(HttpRequest request, const CancellationToken& cancel) {
    request.headers.emplace("Accept", http::kJsonContentType);
    auto result = executor_->execute_authenticated(request, scope_, cancel);
    utils::secure_wipe(request.body);
    return result;
}

bool KeyVaultBackend::is_own_link(const std::string& vault, const std::string& link) const {
    // The service writes nextLink with an explicit :443
    const auto base = vault_url(vault);
    return link.starts_with(base + "/") || link.starts_with(base + ":443/");
}

Result<Page<SecretItem>> KeyVaultBackend::fetch_page(const std::string& vault,
                                                     const std::string& first_url,
                                                     const std::optional<std::string>& cursor,
                                                     const CancellationToken& cancel) {
    if (cursor && !is_own_link(vault, *cursor)) {
        return Result<Page<SecretItem>>::error(ErrorCode::INTERNAL, std::format(
            "Refusing nextLink outside vault '{}'", vault));
    }

    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = cursor ? *cursor : first_url;

    auto resp = call(std::move(req), cancel);
    if (resp.is_error()) {
        return Result<Page<SecretItem>>::error(resp.error());
    }
    return parse_item_page(resp.value().body);
}

Result<StoredSecret> KeyVaultBackend::set_secret(const std::string& vault,
                                                 const SetSecretRequest& request,
                                                 const CancellationToken& cancel) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = endpoint(vault, std::format("/secrets/{}", request.backend_id));
    req.content_type = http::kJsonContentType;
    req.body = build_set_body(request);
    req.idempotent = false;

    auto resp = call(std::move(req), cancel);
    if (resp.is_error()) {
        return Result<StoredSecret>::error(resp.error());
    }
    return parse_secret_bundle(resp.value().body);
}

Result<StoredSecret> KeyVaultBackend::get_secret(const std::string& vault,
                                                 const std::string& backend_id,
                                                 const std::string& version_id,
                                                 const CancellationToken& cancel) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = version_id.empty()
        ? endpoint(vault, std::format("/secrets/{}", backend_id))
        : endpoint(vault, std::format("/secrets/{}/{}", backend_id, version_id));

    auto resp = call(std::move(req), cancel);
    if (resp.is_error()) {
        return Result<StoredSecret>::error(resp.error());
    }
    return parse_secret_bundle(resp.value().body);
}

Result<SecretItem> KeyVaultBackend::get_properties(const std::string& vault,
                                                   const std::string& backend_id,
                                                   const CancellationToken& cancel) {
    std::optional<SecretItem> newest;
    std::optional<std::string> cursor;

    for (size_t pages = 0; pages < kMaxPropertyPages; ++pages) {
        auto page = list_versions_page(vault, backend_id, cursor, cancel);
        if (page.is_error()) {
            return Result<SecretItem>::error(page.error());
        }
        // Ties keep the first item listed
        for (auto& item : page.value().items) {
            if (!newest || item.created_at > newest->created_at) {
                newest = std::move(item);
            }
        }
        if (!page.value().next_cursor) {
            if (!newest) {
                return Result<SecretItem>::error(Error{
                    .code = ErrorCode::NOT_FOUND,
                    .message = std::format("Secret '{}' has no versions in vault '{}'", backend_id, vault),
                    .http_status = 404,
                });
            }
            return Result<SecretItem>::ok(std::move(*newest));
        }
        if (cursor && *cursor == *page.value().next_cursor) {
            return Result<SecretItem>::error(ErrorCode::INTERNAL,
                std::format("Versions listing of '{}' repeated its cursor", backend_id));
        }
        cursor = std::move(page.value().next_cursor);
    }
    return Result<SecretItem>::error(ErrorCode::INTERNAL,
        std::format("Versions listing of '{}' exceeded {} pages", backend_id, kMaxPropertyPages));
}

Result<SecretItem> KeyVaultBackend::update_properties(const std::string& vault,
                                                      const PropertiesUpdate& update,
                                                      const CancellationToken& cancel) {
    json body = json::object();
    if (update.tags) {
        body["tags"] = *update.tags;
    }
    json attrs = json::object();
    if (update.enabled) attrs["enabled"] = *update.enabled;
    if (update.clear_expiry) {
        attrs["exp"] = nullptr;
    } else if (update.expires_at) {
        attrs["exp"] = utils::to_unix_seconds(*update.expires_at);
    }
    if (!attrs.empty()) body["attributes"] = std::move(attrs);

    HttpRequest req;
    req.method = HttpMethod::PATCH;
    // Without a version segment the latest version is updated
    req.url = update.version_id.empty()
        ? endpoint(vault, std::format("/secrets/{}", update.backend_id))
        : endpoint(vault, std::format("/secrets/{}/{}", update.backend_id, update.version_id));
    req.content_type = http::kJsonContentType;
    req.body = body.dump();

    auto resp = call(std::move(req), cancel);
    if (resp.is_error()) {
        return Result<SecretItem>::error(resp.error());
    }
    auto item = parse_secret_item(resp.value().body);
    utils::secure_wipe(resp.value().body);
    return item;
}

Result<Page<SecretItem>> KeyVaultBackend::list_secrets_page(const std::string& vault,
                                                            const std::optional<std::string>& cursor,
                                                            const CancellationToken& cancel) {
    return fetch_page(vault, endpoint(vault, "/secrets", std::format("maxresults={}", config_.page_size)),
                      cursor, cancel);
}

Result<Page<SecretItem>> KeyVaultBackend::list_versions_page(const std::string& vault,
                                                             const std::string& backend_id,
                                                             const std::optional<std::string>& cursor,
                                                             const CancellationToken& cancel) {
    return fetch_page(vault, endpoint(vault, std::format("/secrets/{}/versions", backend_id),
                               std::format("maxresults={}", config_.page_size)),
                      cursor, cancel);
}

Result<Page<SecretItem>> KeyVaultBackend::list_deleted_page(const std::string& vault,
                                                            const std::optional<std::string>& cursor,
                                                            const CancellationToken& cancel) {
    return fetch_page(vault, endpoint(vault, "/deletedsecrets", std::format("maxresults={}", config_.page_size)),
                      cursor, cancel);
}

Result<SecretItem> KeyVaultBackend::get_deleted_secret(const std::string& vault,
                                                       const std::string& backend_id,
                                                       const CancellationToken& cancel) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = endpoint(vault, std::format("/deletedsecrets/{}", backend_id));

    auto resp = call(std::move(req), cancel);
    if (resp.is_error()) {
        return Result<SecretItem>::error(resp.error());
    }
    return parse_secret_item(resp.value().body);
}

Result<SecretItem> KeyVaultBackend::delete_secret(const std::string& vault,
                                                  const std::string& backend_id,
                                                  const CancellationToken& cancel) {
    HttpRequest req;
    req.method = HttpMethod::DELETE_;
    req.url = endpoint(vault, std::format("/secrets/{}", backend_id));

    auto resp = call(std::move(req), cancel);
    if (resp.is_error()) {
        return Result<SecretItem>::error(resp.error());
    }
    utils::log::info(std::format("Soft-deleted secret '{}' in vault '{}'", backend_id, vault));
    return parse_secret_item(resp.value().body);
}

Result<SecretItem> KeyVaultBackend::recover_deleted_secret(const std::string& vault,
                                                           const std::string& backend_id,
                                                           const CancellationToken& cancel) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = endpoint(vault, std::format("/deletedsecrets/{}/recover", backend_id));

    auto resp = call(std::move(req), cancel);
    if (resp.is_error()) {
        return Result<SecretItem>::error(resp.error());
    }
    utils::log::info(std::format("Recovered secret '{}' in vault '{}'", backend_id, vault));
    return parse_secret_item(resp.value().body);
}

Result<void> KeyVaultBackend::purge_deleted_secret(const std::string& vault,
                                                   const std::string& backend_id,
                                                   const CancellationToken& cancel) {
    HttpRequest req;
    req.method = HttpMethod::DELETE_;
    req.url = endpoint(vault, std::format("/deletedsecrets/{}", backend_id));

    auto resp = call(std::move(req), cancel);
    if (resp.is_error()) {
        return Result<void>::error(resp.error());
    }
    utils::log::warn(std::format("Purged secret '{}' from vault '{}'", backend_id, vault));
    return Result<void>::ok();
}

} // namespace kvault
