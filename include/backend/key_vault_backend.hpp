#pragma once

#include "backend/secret_backend.hpp"
#include "config/config_types.hpp"
#include "executor/operation_executor.hpp"

#include <memory>
#include <string>

namespace kvault {

/**
 * @brief Azure Key Vault secrets REST API (api-version 7.x)
 *
 * Endpoints used, relative to https://{vault}.{dns_suffix}:
 *   PUT    /secrets/{name}                   set (new version)
 *   GET    /secrets/{name}/{version}         get
 *   PATCH  /secrets/{name}/{version}         update attributes/tags
 *   GET    /secrets                          list current
 *   GET    /secrets/{name}/versions          list versions
 *   DELETE /secrets/{name}                   soft delete
 *   GET    /deletedsecrets[/{name}]          list / get deleted
 *   POST   /deletedsecrets/{name}/recover    recover
 *   DELETE /deletedsecrets/{name}            purge
 *
 * Paging follows `nextLink`; the link itself is the cursor and must point
 * back at the same vault, otherwise the page is refused before the bearer
 * token is sent. Current-version properties come from the versions listing
 * because GET on a disabled secret is 403.
 */
class KeyVaultBackend : public ISecretBackend {
public:
    KeyVaultBackend(std::shared_ptr<OperationExecutor> executor,
                    VaultConfig config,
                    std::string scope = "https://vault.azure.net/.default");

    [[nodiscard]] Result<StoredSecret> set_secret(const std::string& vault,
                                                  const SetSecretRequest& request,
                                                  const CancellationToken& cancel) override;

    [[nodiscard]] Result<StoredSecret> get_secret(const std::string& vault,
                                                  const std::string& backend_id,
                                                  const std::string& version_id,
                                                  const CancellationToken& cancel) override;

    [[nodiscard]] Result<SecretItem> get_properties(const std::string& vault,
                                                    const std::string& backend_id,
                                                    const CancellationToken& cancel) override;

    [[nodiscard]] Result<SecretItem> update_properties(const std::string& vault,
                                                       const PropertiesUpdate& update,
                                                       const CancellationToken& cancel) override;

    [[nodiscard]] Result<Page<SecretItem>> list_secrets_page(
        const std::string& vault, const std::optional<std::string>& cursor,
        const CancellationToken& cancel) override;

    [[nodiscard]] Result<Page<SecretItem>> list_versions_page(
        const std::string& vault, const std::string& backend_id,
        const std::optional<std::string>& cursor, const CancellationToken& cancel) override;

    [[nodiscard]] Result<Page<SecretItem>> list_deleted_page(
        const std::string& vault, const std::optional<std::string>& cursor,
        const CancellationToken& cancel) override;

    [[nodiscard]] Result<SecretItem> get_deleted_secret(const std::string& vault,
                                                        const std::string& backend_id,
                                                        const CancellationToken& cancel) override;

    [[nodiscard]] Result<SecretItem> delete_secret(const std::string& vault,
                                                   const std::string& backend_id,
                                                   const CancellationToken& cancel) override;

    [[nodiscard]] Result<SecretItem> recover_deleted_secret(const std::string& vault,
                                                            const std::string& backend_id,
                                                            const CancellationToken& cancel) override;

    [[nodiscard]] Result<void> purge_deleted_secret(const std::string& vault,
                                                    const std::string& backend_id,
                                                    const CancellationToken& cancel) override;

    [[nodiscard]] std::string name() const override { return "azure-key-vault"; }

    [[nodiscard]] std::string vault_url(const std::string& vault) const;

    // Exposed for tests: payload mapping without the network
    [[nodiscard]] static Result<StoredSecret> parse_secret_bundle(std::string& body);
    [[nodiscard]] static Result<SecretItem> parse_secret_item(const std::string& body);
    [[nodiscard]] static Result<Page<SecretItem>> parse_item_page(const std::string& body);
    [[nodiscard]] static std::string build_set_body(const SetSecretRequest& request);

    /// ".../secrets/{name}[/{version}]" -> {name, version}
    static void split_secret_id(const std::string& id, std::string& name, std::string& version);

private:
    [[nodiscard]] std::string endpoint(const std::string& vault, const std::string& path,
                                       const std::string& extra_query = {}) const;

    [[nodiscard]] Result<HttpResponse> call(HttpRequest request, const CancellationToken& cancel);

    [[nodiscard]] bool is_own_link(const std::string& vault, const std::string& link) const;

    [[nodiscard]] Result<Page<SecretItem>> fetch_page(const std::string& vault,
                                                      const std::string& first_url,
                                                      const std::optional<std::string>& cursor,
                                                      const CancellationToken& cancel);

    std::shared_ptr<OperationExecutor> executor_;
    VaultConfig config_;
    std::string scope_;
};

} // namespace kvault
