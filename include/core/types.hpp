#pragma once

#include "core/secure_string.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kvault {

using TimePoint = std::chrono::system_clock::time_point;

/// Backend-visible attribute slots: tag name -> tag value
using TagMap = std::map<std::string, std::string>;

// ============================================================================
// Identity & Metadata
// ============================================================================

/**
 * @brief Result of sanitizing a user-chosen secret name
 *
 * Never persisted locally. The user name is recovered at read time from the
 * `original_name` tag stored with the secret.
 */
struct SecretIdentity {
    std::string vault;
    std::string user_name;
    std::string backend_id;
    bool hashed = false;
};

struct SecretMetadata {
    std::set<std::string> groups;
    std::string original_name;
    std::optional<TimePoint> expires_at;
    TagMap custom;                      // caller-supplied attributes (folder, note, ...)
};

/**
 * @brief Caller's desired metadata changes for a mutating operation
 *
 * Merged onto the backend's current metadata (read-modify-write).
 */
struct MetadataUpdate {
    std::optional<std::set<std::string>> groups;
    bool replace_groups = false;        // false: union with existing groups
    std::optional<TimePoint> expires_at;
    bool clear_expiry = false;
    TagMap custom;
    bool replace_custom = false;        // false: merge, caller wins on key clash
    std::vector<std::string> remove_custom;
};

// ============================================================================
// Lifecycle
// ============================================================================

enum class SecretState : uint8_t {
    ACTIVE,
    SOFT_DELETED,
    PURGED
};

[[nodiscard]] inline const char* secret_state_to_string(SecretState s) {
    switch (s) {
        case SecretState::ACTIVE:       return "active";
        case SecretState::SOFT_DELETED: return "soft_deleted";
        case SecretState::PURGED:       return "purged";
        default:                        return "unknown";
    }
}

/**
 * @brief One immutable snapshot of a secret. `value` is only populated when
 * the caller asked for values; it is zeroed when the version is destroyed.
 */
struct SecretVersion {
    std::string version_id;
    std::optional<SecureString> value;
    TimePoint created_at{};
    TimePoint updated_at{};
    bool enabled = true;
};

/// A decoded secret as returned by get/set/rotate/rollback.
struct SecretRecord {
    SecretIdentity identity;
    SecretMetadata metadata;
    std::string version_id;
    std::optional<SecureString> value;
    TimePoint created_at{};
    TimePoint updated_at{};
    bool enabled = true;
    std::string content_type;
};

/// A decoded listing row (no value).
struct SecretEntry {
    SecretIdentity identity;
    SecretMetadata metadata;
    SecretState state = SecretState::ACTIVE;
    bool enabled = true;
    TimePoint updated_at{};
    std::optional<TimePoint> scheduled_purge;
};

} // namespace kvault
