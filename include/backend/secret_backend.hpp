#pragma once

#include "core/cancellation.hpp"
#include "core/error.hpp"
#include "core/secure_string.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kvault {

/// One page of a backend listing. `next_cursor` is opaque to callers.
template<typename T>
struct Page {
    std::vector<T> items;
    std::optional<std::string> next_cursor;
};

/// Listing row or version row: attributes and tags, never the value.
struct SecretItem {
    std::string backend_id;
    std::string version_id;             // empty in current-secret listings
    TagMap tags;
    bool enabled = true;
    TimePoint created_at{};
    TimePoint updated_at{};
    std::optional<TimePoint> expires_at;
    std::string content_type;
    bool deleted = false;
    std::optional<TimePoint> deleted_on;
    std::optional<TimePoint> scheduled_purge;
};

/// A secret version with its value.
struct StoredSecret {
    std::string backend_id;
    std::string version_id;
    SecureString value;
    TagMap tags;
    bool enabled = true;
    TimePoint created_at{};
    TimePoint updated_at{};
    std::optional<TimePoint> expires_at;
    std::string content_type;
};

struct SetSecretRequest {
    std::string backend_id;
    SecureString value;
    TagMap tags;
    std::string content_type;
    std::optional<TimePoint> expires_at;
    std::optional<TimePoint> not_before;
    bool enabled = true;
};

/// Attribute-only change on an existing version; never creates a version.
struct PropertiesUpdate {
    std::string backend_id;
    std::string version_id;             // empty: current version
    std::optional<TagMap> tags;
    std::optional<bool> enabled;
    std::optional<TimePoint> expires_at;
    bool clear_expiry = false;
};

/**
 * @brief Capability interface of a remote secret store
 *
 * Every write of a value creates a new version; there is no per-version
 * delete and no "move current" primitive. Implementations must be safe to
 * call concurrently.
 */
class ISecretBackend {
public:
    virtual ~ISecretBackend() = default;

    [[nodiscard]] virtual Result<StoredSecret> set_secret(const std::string& vault,
                                                          const SetSecretRequest& request,
                                                          const CancellationToken& cancel) = 0;

    /// `version_id` empty: current version.
    [[nodiscard]] virtual Result<StoredSecret> get_secret(const std::string& vault,
                                                          const std::string& backend_id,
                                                          const std::string& version_id,
                                                          const CancellationToken& cancel) = 0;

    /**
     * @brief Attributes and tags of the current version, without its value
     *
     * Unlike get_secret, this succeeds when the current version is disabled.
     * `version_id` of the result names the current version.
     */
    [[nodiscard]] virtual Result<SecretItem> get_properties(const std::string& vault,
                                                            const std::string& backend_id,
                                                            const CancellationToken& cancel) = 0;

    [[nodiscard]] virtual Result<SecretItem> update_properties(const std::string& vault,
                                                               const PropertiesUpdate& update,
                                                               const CancellationToken& cancel) = 0;

    [[nodiscard]] virtual Result<Page<SecretItem>> list_secrets_page(
        const std::string& vault, const std::optional<std::string>& cursor,
        const CancellationToken& cancel) = 0;

    /// Newest first across pages; equal timestamps keep that order.
    [[nodiscard]] virtual Result<Page<SecretItem>> list_versions_page(
        const std::string& vault, const std::string& backend_id,
        const std::optional<std::string>& cursor, const CancellationToken& cancel) = 0;

    [[nodiscard]] virtual Result<Page<SecretItem>> list_deleted_page(
        const std::string& vault, const std::optional<std::string>& cursor,
        const CancellationToken& cancel) = 0;

    [[nodiscard]] virtual Result<SecretItem> get_deleted_secret(const std::string& vault,
                                                                const std::string& backend_id,
                                                                const CancellationToken& cancel) = 0;

    /// Soft delete: recoverable until purged.
    [[nodiscard]] virtual Result<SecretItem> delete_secret(const std::string& vault,
                                                           const std::string& backend_id,
                                                           const CancellationToken& cancel) = 0;

    [[nodiscard]] virtual Result<SecretItem> recover_deleted_secret(const std::string& vault,
                                                                    const std::string& backend_id,
                                                                    const CancellationToken& cancel) = 0;

    [[nodiscard]] virtual Result<void> purge_deleted_secret(const std::string& vault,
                                                            const std::string& backend_id,
                                                            const CancellationToken& cancel) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace kvault
