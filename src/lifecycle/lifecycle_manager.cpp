#include "lifecycle/lifecycle_manager.hpp"
#include "core/utils.hpp"
#include "identity/name_sanitizer.hpp"
#include "metadata/metadata_codec.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <set>

namespace kvault {

namespace {

// original_name, else the legacy name tag, else the backend id (as decode does)
std::string owner_name(const TagMap& tags, std::string_view backend_id) {
    for (const auto key : {MetadataCodec::kOriginalNameKey, MetadataCodec::kLegacyNameKey}) {
        const auto it = tags.find(std::string(key));
        if (it != tags.end() && !it->second.empty()) return it->second;
    }
    return std::string(backend_id);
}

bool looks_hashed(const std::string& backend_id) {
    return backend_id.size() == NameSanitizer::kHashMarker.size() + NameSanitizer::kHashBytes * 2 &&
           backend_id.starts_with(NameSanitizer::kHashMarker);
}

Result<SecretRecord> cancelled_record() {
    return Result<SecretRecord>::error(ErrorCode::CANCELLED, "Operation cancelled");
}

} // anonymous namespace

LifecycleManager::LifecycleManager(std::shared_ptr<ISecretBackend> backend)
    : backend_(std::move(backend)) {}

// ============================================================================
// Helpers
// ============================================================================

Result<SecretIdentity> LifecycleManager::resolve(const std::string& vault, const std::string& name) const {
    auto vault_ok = NameSanitizer::validate_vault_name(vault);
    if (vault_ok.is_error()) {
        return Result<SecretIdentity>::error(vault_ok.error());
    }
    return NameSanitizer::sanitize(name, vault);
}

Result<SecretItem> LifecycleManager::owned_properties(const SecretIdentity& id,
                                                     const CancellationToken& cancel) {
    auto props = backend_->get_properties(id.vault, id.backend_id, cancel);
    if (props.is_error()) {
        return props;
    }
    auto owner = NameSanitizer::verify_owner(id, owner_name(props.value().tags, props.value().backend_id));
    if (owner.is_error()) {
        return Result<SecretItem>::error(owner.error());
    }
    return props;
}

SecretRecord LifecycleManager::to_record(const SecretIdentity& id, StoredSecret stored, bool keep_value) {
    SecretRecord record;
    record.identity = id;
    record.metadata = MetadataCodec::decode(stored.tags, stored.backend_id);
    record.version_id = stored.version_id;
    record.created_at = stored.created_at;
    record.updated_at = stored.updated_at;
    record.enabled = stored.enabled;
    record.content_type = stored.content_type;
    if (keep_value) {
        record.value = std::move(stored.value);
    }
    return record;
}

SecretEntry LifecycleManager::to_entry(const std::string& vault, const SecretItem& item) {
    SecretEntry entry;
    entry.metadata = MetadataCodec::decode(item.tags, item.backend_id);
    entry.identity = SecretIdentity{
        .vault = vault,
        .user_name = entry.metadata.original_name,
        .backend_id = item.backend_id,
        .hashed = looks_hashed(item.backend_id),
    };
    entry.state = item.deleted ? SecretState::SOFT_DELETED : SecretState::ACTIVE;
    entry.enabled = item.enabled;
    entry.updated_at = item.updated_at;
    entry.scheduled_purge = item.scheduled_purge;
    return entry;
}

Result<SecretRecord> LifecycleManager::write_version(const SecretIdentity& id,
                                                     SecureString value,
                                                     const SecretMetadata& metadata,
                                                     const std::string& content_type,
                                                     const CancellationToken& cancel) {
    auto tags = MetadataCodec::encode(metadata);
    if (tags.is_error()) {
        return Result<SecretRecord>::error(tags.error());
    }

    SetSecretRequest request{
        .backend_id = id.backend_id,
        .value = std::move(value),
        .tags = std::move(tags.value()),
        .content_type = content_type,
        .expires_at = metadata.expires_at,
    };

    auto stored = backend_->set_secret(id.vault, request, cancel);
    if (stored.is_error()) {
        return Result<SecretRecord>::error(stored.error());
    }

    utils::log::info(std::format("Stored version {} of '{}' in vault '{}'",
                                 stored.value().version_id, id.user_name, id.vault));
    return Result<SecretRecord>::ok(to_record(id, std::move(stored.value()), false));
}

// ============================================================================
// Versioned Writes
// ============================================================================

Result<SecretRecord> LifecycleManager::set(const std::string& vault,
                                           const std::string& name,
                                           SecureString value,
                                           const MetadataUpdate& metadata,
                                           const CancellationToken& cancel) {
    if (cancel.is_cancelled()) return cancelled_record();

    auto id = resolve(vault, name);
    if (id.is_error()) {
        return Result<SecretRecord>::error(id.error());
    }

    SecretMetadata current;
    std::string content_type;
    auto existing = owned_properties(id.value(), cancel);
    if (existing.is_ok()) {
        current = MetadataCodec::decode(existing.value().tags, existing.value().backend_id);
        content_type = existing.value().content_type;
    } else if (existing.error_code() != ErrorCode::NOT_FOUND) {
        return Result<SecretRecord>::error(existing.error());
    }

    auto merged = MetadataCodec::merge(current, metadata, name);
    if (merged.is_error()) {
        return Result<SecretRecord>::error(merged.error());
    }

    return write_version(id.value(), std::move(value), merged.value(), content_type, cancel);
}

Result<SecretRecord> LifecycleManager::rotate(const std::string& vault,
                                              const std::string& name,
                                              const ValueSource& source,
                                              const CancellationToken& cancel) {
    if (cancel.is_cancelled()) return cancelled_record();

    auto id = resolve(vault, name);
    if (id.is_error()) {
        return Result<SecretRecord>::error(id.error());
    }

    auto current = owned_properties(id.value(), cancel);
    if (current.is_error()) {
        return Result<SecretRecord>::error(current.error());
    }

    SecretMetadata metadata = MetadataCodec::decode(current.value().tags, current.value().backend_id);
    metadata.original_name = name;

    auto value = source();
    if (value.is_error()) {
        return Result<SecretRecord>::error(value.error());
    }

    auto record = write_version(id.value(), value.value().clone(), metadata,
                                current.value().content_type, cancel);
    if (record.is_ok()) {
        record.value().value = std::move(value.value());
        utils::log::info(std::format("Rotated '{}' in vault '{}'", name, vault));
    }
    return record;
}

Result<SecretRecord> LifecycleManager::rotate(const std::string& vault,
                                              const std::string& name,
                                              const RandomValueGenerator& generator,
                                              const CancellationToken& cancel) {
    return rotate(vault, name, [&generator] { return generator.generate(); }, cancel);
}

Result<SecretRecord> LifecycleManager::rollback(const std::string& vault,
                                                const std::string& name,
                                                const std::string& target_version,
                                                const CancellationToken& cancel) {
    if (cancel.is_cancelled()) return cancelled_record();

    if (target_version.empty()) {
        return Result<SecretRecord>::error(ErrorCode::VALIDATION, "Rollback target version is required");
    }

    auto id = resolve(vault, name);
    if (id.is_error()) {
        return Result<SecretRecord>::error(id.error());
    }

    auto target = backend_->get_secret(vault, id.value().backend_id, target_version, cancel);
    if (target.is_error()) {
        return Result<SecretRecord>::error(target.error());
    }
    auto owner = NameSanitizer::verify_owner(id.value(),
                                             owner_name(target.value().tags, target.value().backend_id));
    if (owner.is_error()) {
        return Result<SecretRecord>::error(owner.error());
    }

    // Metadata follows the current version, the value follows the target
    auto current = owned_properties(id.value(), cancel);
    if (current.is_error()) {
        return Result<SecretRecord>::error(current.error());
    }

    SecretMetadata metadata = MetadataCodec::decode(current.value().tags, current.value().backend_id);
    metadata.original_name = name;

    auto record = write_version(id.value(), std::move(target.value().value), metadata,
                                current.value().content_type, cancel);
    if (record.is_ok()) {
        utils::log::info(std::format("Rolled back '{}' in vault '{}' to the value of version {} "
                                     "as new version {}",
                                     name, vault, target_version, record.value().version_id));
    }
    return record;
}

// ============================================================================
// Reads
// ============================================================================

Result<SecretRecord> LifecycleManager::get(const std::string& vault,
                                           const std::string& name,
                                           const std::string& version,
                                           const CancellationToken& cancel) {
    if (cancel.is_cancelled()) return cancelled_record();

    auto id = resolve(vault, name);
    if (id.is_error()) {
        return Result<SecretRecord>::error(id.error());
    }

    auto stored = backend_->get_secret(vault, id.value().backend_id, version, cancel);
    if (stored.is_error()) {
        return Result<SecretRecord>::error(stored.error());
    }
    auto owner = NameSanitizer::verify_owner(id.value(),
                                             owner_name(stored.value().tags, stored.value().backend_id));
    if (owner.is_error()) {
        return Result<SecretRecord>::error(owner.error());
    }

    return Result<SecretRecord>::ok(to_record(id.value(), std::move(stored.value()), true));
}

Result<bool> LifecycleManager::exists(const std::string& vault,
                                      const std::string& name,
                                      const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return Result<bool>::error(ErrorCode::CANCELLED, "Operation cancelled");
    }

    auto id = resolve(vault, name);
    if (id.is_error()) {
        return Result<bool>::error(id.error());
    }

    // Properties only: a disabled current version still exists
    auto props = owned_properties(id.value(), cancel);
    if (props.is_ok()) return Result<bool>::ok(true);
    if (props.error_code() == ErrorCode::NOT_FOUND) return Result<bool>::ok(false);
    return Result<bool>::error(props.error());
}

PagedSequence<SecretVersion> LifecycleManager::get_versions(const std::string& vault,
                                                            const std::string& name,
                                                            bool include_values,
                                                            const CancellationToken& cancel) {
    using VersionPage = Result<Page<SecretVersion>>;

    auto id = resolve(vault, name);
    if (id.is_error()) {
        Error err = id.error();
        return PagedSequence<SecretVersion>(
            [err](const std::optional<std::string>&) { return VersionPage::error(err); });
    }

    auto fetch = [backend = backend_, identity = id.value(), include_values, cancel](
                     const std::optional<std::string>& cursor) -> VersionPage {
        auto page = backend->list_versions_page(identity.vault, identity.backend_id, cursor, cancel);
        if (page.is_error()) {
            return VersionPage::error(page.error());
        }

        Page<SecretVersion> out;
        out.next_cursor = page.value().next_cursor;
        out.items.reserve(page.value().items.size());

        for (const auto& item : page.value().items) {
            auto owner = NameSanitizer::verify_owner(identity, owner_name(item.tags, item.backend_id));
            if (owner.is_error()) {
                return VersionPage::error(owner.error());
            }

            SecretVersion version{
                .version_id = item.version_id,
                .created_at = item.created_at,
                .updated_at = item.updated_at,
                .enabled = item.enabled,
            };

            // Disabled versions cannot be read back
            if (include_values && item.enabled) {
                auto stored = backend->get_secret(identity.vault, identity.backend_id,
                                                  item.version_id, cancel);
                if (stored.is_error()) {
                    return VersionPage::error(stored.error());
                }
                version.value = std::move(stored.value().value);
            }
            out.items.push_back(std::move(version));
        }
        return VersionPage::ok(std::move(out));
    };

    // Backend lists newest first; reversed, equal timestamps end up in creation order
    auto oldest_first = [](std::vector<SecretVersion>& versions) {
        std::reverse(versions.begin(), versions.end());
        std::stable_sort(versions.begin(), versions.end(),
                         [](const SecretVersion& a, const SecretVersion& b) {
                             return a.created_at < b.created_at;
                         });
    };

    return PagedSequence<SecretVersion>(std::move(fetch), std::move(oldest_first));
}

PagedSequence<SecretEntry> LifecycleManager::list_secrets(const std::string& vault,
                                                          const ListOptions& options,
                                                          const CancellationToken& cancel) {
    using EntryPage = Result<Page<SecretEntry>>;
    using Fetcher = PagedSequence<SecretEntry>::PageFetcher;

    auto vault_ok = NameSanitizer::validate_vault_name(vault);
    if (vault_ok.is_error()) {
        Error err = vault_ok.error();
        return PagedSequence<SecretEntry>(
            [err](const std::optional<std::string>&) { return EntryPage::error(err); });
    }

    const auto convert = [vault, options](Result<Page<SecretItem>> page) -> EntryPage {
        if (page.is_error()) {
            return EntryPage::error(page.error());
        }
        Page<SecretEntry> out;
        out.next_cursor = std::move(page.value().next_cursor);
        for (const auto& item : page.value().items) {
            if (item.deleted && !options.include_deleted) continue;
            auto entry = to_entry(vault, item);
            if (options.group && !entry.metadata.groups.contains(*options.group)) continue;
            out.items.push_back(std::move(entry));
        }
        return EntryPage::ok(std::move(out));
    };

    std::vector<Fetcher> sources;
    sources.emplace_back([backend = backend_, vault, cancel, convert](const std::optional<std::string>& cursor) {
        return convert(backend->list_secrets_page(vault, cursor, cancel));
    });

    if (!options.include_deleted) {
        return PagedSequence<SecretEntry>(std::move(sources), {});
    }

    sources.emplace_back([backend = backend_, vault, cancel, convert](const std::optional<std::string>& cursor) {
        return convert(backend->list_deleted_page(vault, cursor, cancel));
    });

    // A secret reported by both listings appears once, at its first position
    auto dedupe = [](std::vector<SecretEntry>& entries) {
        std::set<std::string> seen;
        std::erase_if(entries, [&seen](const SecretEntry& e) {
            return !seen.insert(e.identity.backend_id).second;
        });
    };

    return PagedSequence<SecretEntry>(std::move(sources), std::move(dedupe));
}

Result<std::map<std::string, std::vector<std::string>>> LifecycleManager::group_index(
    const std::string& vault, const CancellationToken& cancel) {
    using Index = std::map<std::string, std::vector<std::string>>;

    auto entries = list_secrets(vault, {}, cancel).collect();
    if (entries.is_error()) {
        return Result<Index>::error(entries.error());
    }

    Index index;
    for (const auto& entry : entries.value()) {
        for (const auto& group : entry.metadata.groups) {
            index[group].push_back(entry.identity.user_name);
        }
    }
    for (auto& [_, names] : index) {
        std::sort(names.begin(), names.end());
    }
    return Result<Index>::ok(std::move(index));
}

// ============================================================================
// Attribute-only Changes
// ============================================================================

Result<SecretEntry> LifecycleManager::update_metadata(const std::string& vault,
                                                      const std::string& name,
                                                      const MetadataUpdate& update,
                                                      const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return Result<SecretEntry>::error(ErrorCode::CANCELLED, "Operation cancelled");
    }

    auto id = resolve(vault, name);
    if (id.is_error()) {
        return Result<SecretEntry>::error(id.error());
    }

    auto current = owned_properties(id.value(), cancel);
    if (current.is_error()) {
        return Result<SecretEntry>::error(current.error());
    }

    auto merged = MetadataCodec::merge(
        MetadataCodec::decode(current.value().tags, current.value().backend_id), update, name);
    if (merged.is_error()) {
        return Result<SecretEntry>::error(merged.error());
    }
    auto tags = MetadataCodec::encode(merged.value());
    if (tags.is_error()) {
        return Result<SecretEntry>::error(tags.error());
    }

    PropertiesUpdate props{
        .backend_id = id.value().backend_id,
        .version_id = current.value().version_id,
        .tags = std::move(tags.value()),
        .expires_at = merged.value().expires_at,
        .clear_expiry = update.clear_expiry,
    };

    auto item = backend_->update_properties(vault, props, cancel);
    if (item.is_error()) {
        return Result<SecretEntry>::error(item.error());
    }

    utils::log::info(std::format("Updated metadata of '{}' in vault '{}'", name, vault));
    return Result<SecretEntry>::ok(to_entry(vault, item.value()));
}

// ============================================================================
// State Transitions
// ============================================================================

Result<SecretEntry> LifecycleManager::remove(const std::string& vault,
                                             const std::string& name,
                                             const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return Result<SecretEntry>::error(ErrorCode::CANCELLED, "Operation cancelled");
    }

    auto id = resolve(vault, name);
    if (id.is_error()) {
        return Result<SecretEntry>::error(id.error());
    }

    auto current = owned_properties(id.value(), cancel);
    if (current.is_error()) {
        return Result<SecretEntry>::error(current.error());
    }

    auto item = backend_->delete_secret(vault, id.value().backend_id, cancel);
    if (item.is_error()) {
        return Result<SecretEntry>::error(item.error());
    }

    auto entry = to_entry(vault, item.value());
    entry.state = SecretState::SOFT_DELETED;
    utils::log::info(std::format("Soft-deleted '{}' in vault '{}'", name, vault));
    return Result<SecretEntry>::ok(std::move(entry));
}

Result<SecretEntry> LifecycleManager::recover(const std::string& vault,
                                              const std::string& name,
                                              const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return Result<SecretEntry>::error(ErrorCode::CANCELLED, "Operation cancelled");
    }

    auto id = resolve(vault, name);
    if (id.is_error()) {
        return Result<SecretEntry>::error(id.error());
    }

    auto deleted = backend_->get_deleted_secret(vault, id.value().backend_id, cancel);
    if (deleted.is_error()) {
        return Result<SecretEntry>::error(deleted.error());
    }
    auto owner = NameSanitizer::verify_owner(id.value(),
                                             owner_name(deleted.value().tags, deleted.value().backend_id));
    if (owner.is_error()) {
        return Result<SecretEntry>::error(owner.error());
    }

    auto item = backend_->recover_deleted_secret(vault, id.value().backend_id, cancel);
    if (item.is_error()) {
        return Result<SecretEntry>::error(item.error());
    }

    auto entry = to_entry(vault, item.value());
    entry.state = SecretState::ACTIVE;
    utils::log::info(std::format("Recovered '{}' in vault '{}'", name, vault));
    return Result<SecretEntry>::ok(std::move(entry));
}

Result<SecretEntry> LifecycleManager::purge(const std::string& vault,
                                            const std::string& name,
                                            const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return Result<SecretEntry>::error(ErrorCode::CANCELLED, "Operation cancelled");
    }

    auto id = resolve(vault, name);
    if (id.is_error()) {
        return Result<SecretEntry>::error(id.error());
    }

    // Only a soft-deleted secret can be purged
    auto deleted = backend_->get_deleted_secret(vault, id.value().backend_id, cancel);
    if (deleted.is_error()) {
        return Result<SecretEntry>::error(deleted.error());
    }
    auto owner = NameSanitizer::verify_owner(id.value(),
                                             owner_name(deleted.value().tags, deleted.value().backend_id));
    if (owner.is_error()) {
        return Result<SecretEntry>::error(owner.error());
    }

    auto purged = backend_->purge_deleted_secret(vault, id.value().backend_id, cancel);
    if (purged.is_error()) {
        return Result<SecretEntry>::error(purged.error());
    }

    auto entry = to_entry(vault, deleted.value());
    entry.state = SecretState::PURGED;
    entry.scheduled_purge.reset();
    utils::log::warn(std::format("Purged '{}' from vault '{}'", name, vault));
    return Result<SecretEntry>::ok(std::move(entry));
}

// ============================================================================
// Cross-vault
// ============================================================================

Result<SecretRecord> LifecycleManager::copy(const std::string& source_vault,
                                            const std::string& target_vault,
                                            const std::string& name,
                                            const CancellationToken& cancel) {
    auto source = get(source_vault, name, {}, cancel);
    if (source.is_error()) {
        return source;
    }

    auto target_id = resolve(target_vault, name);
    if (target_id.is_error()) {
        return Result<SecretRecord>::error(target_id.error());
    }

    // Refuse to overwrite a different secret that happens to share the backend id
    auto existing = owned_properties(target_id.value(), cancel);
    if (existing.is_error() && existing.error_code() != ErrorCode::NOT_FOUND) {
        return Result<SecretRecord>::error(existing.error());
    }

    SecretMetadata metadata = source.value().metadata;
    metadata.original_name = name;

    auto& value = *source.value().value;
    auto record = write_version(target_id.value(), std::move(value), metadata,
                                source.value().content_type, cancel);
    if (record.is_ok()) {
        utils::log::info(std::format("Copied '{}' from vault '{}' to '{}'",
                                     name, source_vault, target_vault));
    }
    return record;
}

Result<SecretRecord> LifecycleManager::move(const std::string& source_vault,
                                            const std::string& target_vault,
                                            const std::string& name,
                                            const CancellationToken& cancel) {
    if (source_vault == target_vault) {
        return Result<SecretRecord>::error(ErrorCode::VALIDATION,
            "Source and target vault are the same");
    }

    auto record = copy(source_vault, target_vault, name, cancel);
    if (record.is_error()) {
        return record;
    }

    auto removed = remove(source_vault, name, cancel);
    if (removed.is_error()) {
        Error err = removed.error();
        err.message = std::format("Copied to '{}' but could not delete source: {}",
                                  target_vault, err.message);
        return Result<SecretRecord>::error(std::move(err));
    }
    return record;
}

Result<SecretRecord> LifecycleManager::rename(const std::string& vault,
                                              const std::string& old_name,
                                              const std::string& new_name,
                                              const CancellationToken& cancel) {
    if (old_name == new_name) {
        return Result<SecretRecord>::error(ErrorCode::VALIDATION, "Old and new name are the same");
    }

    auto source = get(vault, old_name, {}, cancel);
    if (source.is_error()) {
        return source;
    }

    auto target_id = resolve(vault, new_name);
    if (target_id.is_error()) {
        return Result<SecretRecord>::error(target_id.error());
    }

    SecretMetadata metadata = source.value().metadata;
    metadata.original_name = new_name;
    auto& value = *source.value().value;

    // Both names map to one backend item: a new version re-tags it in place
    if (target_id.value().backend_id == source.value().identity.backend_id) {
        auto record = write_version(target_id.value(), std::move(value), metadata,
                                    source.value().content_type, cancel);
        if (record.is_ok()) {
            utils::log::info(std::format("Renamed '{}' to '{}' in vault '{}'", old_name, new_name, vault));
        }
        return record;
    }

    auto existing = owned_properties(target_id.value(), cancel);
    if (existing.is_ok()) {
        return Result<SecretRecord>::error(Error{
            .code = ErrorCode::CONFLICT,
            .message = std::format("Secret '{}' already exists in vault '{}'", new_name, vault),
            .http_status = 409,
        });
    }
    if (existing.error_code() != ErrorCode::NOT_FOUND) {
        return Result<SecretRecord>::error(existing.error());
    }

    auto record = write_version(target_id.value(), std::move(value), metadata,
                                source.value().content_type, cancel);
    if (record.is_error()) {
        return record;
    }

    auto removed = backend_->delete_secret(vault, source.value().identity.backend_id, cancel);
    if (removed.is_error()) {
        Error err = removed.error();
        err.message = std::format("Wrote '{}' but could not delete '{}': {}",
                                  new_name, old_name, err.message);
        return Result<SecretRecord>::error(std::move(err));
    }

    utils::log::info(std::format("Renamed '{}' to '{}' in vault '{}'", old_name, new_name, vault));
    return record;
}

// ============================================================================
// Bulk
// ============================================================================

std::vector<Result<SecretRecord>> LifecycleManager::set_many(const std::string& vault,
                                                             std::vector<BulkSetEntry> entries,
                                                             const CancellationToken& cancel) {
    std::vector<Result<SecretRecord>> results;
    results.reserve(entries.size());

    // At most kMaxBulkConcurrency writes in flight
    for (size_t start = 0; start < entries.size(); start += kMaxBulkConcurrency) {
        const size_t end = std::min(entries.size(), start + kMaxBulkConcurrency);

        std::vector<std::future<Result<SecretRecord>>> pending;
        pending.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            pending.push_back(std::async(std::launch::async,
                [this, &vault, &cancel, entry = std::move(entries[i])]() mutable {
                    return set(vault, entry.name, std::move(entry.value), entry.metadata, cancel);
                }));
        }
        for (auto& f : pending) {
            results.push_back(f.get());
        }
    }

    const auto failed = std::count_if(results.begin(), results.end(),
                                      [](const auto& r) { return r.is_error(); });
    if (failed > 0) {
        utils::log::warn(std::format("Bulk set in vault '{}': {} of {} failed",
                                     vault, failed, results.size()));
    }
    return results;
}

} // namespace kvault
