#pragma once

#include "backend/secret_backend.hpp"
#include "core/cancellation.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "lifecycle/paged_sequence.hpp"
#include "lifecycle/value_generator.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kvault {

struct ListOptions {
    bool include_deleted = false;
    std::optional<std::string> group;   // only secrets carrying this group
};

struct BulkSetEntry {
    std::string name;
    SecureString value;
    MetadataUpdate metadata;
};

/// Source of a rotated value.
using ValueSource = std::function<Result<SecureString>()>;

/**
 * @brief Version, rotation and soft-delete semantics over an ISecretBackend
 *
 * State machine per secret, independent of version history:
 *
 *     ACTIVE --remove--> SOFT_DELETED --purge--> PURGED
 *        ^                    |
 *        +------recover-------+
 *
 * set, rotate and rollback always append a version and the new version
 * becomes current. rollback copies the target's value into a NEW version;
 * the history therefore grows by one on every rollback.
 *
 * Every write is read-modify-write on metadata: the stored groups, expiry and
 * custom attributes are merged with the caller's update before encoding.
 * A stored owner name that differs from the requested name fails with
 * NAME_COLLISION instead of touching the other secret. Items without an
 * original_name tag are owned by their backend id.
 */
class LifecycleManager {
public:
    static constexpr size_t kMaxBulkConcurrency = 8;

    explicit LifecycleManager(std::shared_ptr<ISecretBackend> backend);

    // ---- Versioned writes -------------------------------------------------

    [[nodiscard]] Result<SecretRecord> set(const std::string& vault,
                                           const std::string& name,
                                           SecureString value,
                                           const MetadataUpdate& metadata = {},
                                           const CancellationToken& cancel = CancellationToken::none());

    /**
     * @brief New version from a generator. The secret must exist; its
     * metadata is carried over unchanged. The record carries the new value.
     */
    [[nodiscard]] Result<SecretRecord> rotate(const std::string& vault,
                                              const std::string& name,
                                              const ValueSource& source,
                                              const CancellationToken& cancel = CancellationToken::none());

    [[nodiscard]] Result<SecretRecord> rotate(const std::string& vault,
                                              const std::string& name,
                                              const RandomValueGenerator& generator,
                                              const CancellationToken& cancel = CancellationToken::none());

    /// New version whose value equals `target_version`'s. Never a pointer rewrite.
    [[nodiscard]] Result<SecretRecord> rollback(const std::string& vault,
                                                const std::string& name,
                                                const std::string& target_version,
                                                const CancellationToken& cancel = CancellationToken::none());

    // ---- Reads ------------------------------------------------------------

    /// `version` empty: current version. The record carries the value.
    [[nodiscard]] Result<SecretRecord> get(const std::string& vault,
                                           const std::string& name,
                                           const std::string& version = {},
                                           const CancellationToken& cancel = CancellationToken::none());

    [[nodiscard]] Result<bool> exists(const std::string& vault,
                                      const std::string& name,
                                      const CancellationToken& cancel = CancellationToken::none());

    /**
     * @brief Every version, oldest first (ties keep backend order)
     * @param include_values fetch each version's value (one call per version)
     */
    [[nodiscard]] PagedSequence<SecretVersion> get_versions(
        const std::string& vault, const std::string& name, bool include_values = false,
        const CancellationToken& cancel = CancellationToken::none());

    [[nodiscard]] PagedSequence<SecretEntry> list_secrets(
        const std::string& vault, const ListOptions& options = {},
        const CancellationToken& cancel = CancellationToken::none());

    /// group -> user names, from a full listing.
    [[nodiscard]] Result<std::map<std::string, std::vector<std::string>>> group_index(
        const std::string& vault, const CancellationToken& cancel = CancellationToken::none());

    // ---- Attribute-only changes ------------------------------------------

    [[nodiscard]] Result<SecretEntry> update_metadata(const std::string& vault,
                                                      const std::string& name,
                                                      const MetadataUpdate& update,
                                                      const CancellationToken& cancel = CancellationToken::none());

    // ---- State transitions -----------------------------------------------

    [[nodiscard]] Result<SecretEntry> remove(const std::string& vault,
                                             const std::string& name,
                                             const CancellationToken& cancel = CancellationToken::none());

    [[nodiscard]] Result<SecretEntry> recover(const std::string& vault,
                                              const std::string& name,
                                              const CancellationToken& cancel = CancellationToken::none());

    /// Only from SOFT_DELETED; an active secret yields NOT_FOUND.
    [[nodiscard]] Result<SecretEntry> purge(const std::string& vault,
                                            const std::string& name,
                                            const CancellationToken& cancel = CancellationToken::none());

    // ---- Cross-vault ------------------------------------------------------

    [[nodiscard]] Result<SecretRecord> copy(const std::string& source_vault,
                                            const std::string& target_vault,
                                            const std::string& name,
                                            const CancellationToken& cancel = CancellationToken::none());

    /// copy, then soft-delete the source.
    [[nodiscard]] Result<SecretRecord> move(const std::string& source_vault,
                                            const std::string& target_vault,
                                            const std::string& name,
                                            const CancellationToken& cancel = CancellationToken::none());

    /// Rename within one vault. The old item is soft-deleted unless both names share
    /// a backend id. CONFLICT if new_name already exists.
    [[nodiscard]] Result<SecretRecord> rename(const std::string& vault,
                                              const std::string& old_name,
                                              const std::string& new_name,
                                              const CancellationToken& cancel = CancellationToken::none());

    // ---- Bulk -------------------------------------------------------------

    /// Independent concurrent sets, at most kMaxBulkConcurrency at a time;
    /// results in input order, no ordering between writes.
    [[nodiscard]] std::vector<Result<SecretRecord>> set_many(
        const std::string& vault, std::vector<BulkSetEntry> entries,
        const CancellationToken& cancel = CancellationToken::none());

private:
    [[nodiscard]] Result<SecretIdentity> resolve(const std::string& vault, const std::string& name) const;

    // Current-version properties, checked against the requested name
    [[nodiscard]] Result<SecretItem> owned_properties(const SecretIdentity& id,
                                                      const CancellationToken& cancel);

    [[nodiscard]] Result<SecretRecord> write_version(const SecretIdentity& id,
                                                     SecureString value,
                                                     const SecretMetadata& metadata,
                                                     const std::string& content_type,
                                                     const CancellationToken& cancel);

    [[nodiscard]] static SecretRecord to_record(const SecretIdentity& id, StoredSecret stored,
                                                bool keep_value);
    [[nodiscard]] static SecretEntry to_entry(const std::string& vault, const SecretItem& item);

    std::shared_ptr<ISecretBackend> backend_;
};

} // namespace kvault
