#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace kvault {

/**
 * @brief Packs secret metadata into the backend's fixed tag budget.
 *
 * Wire format (one backend tag per reserved key):
 *   groups        = "alpha,beta"            (sorted, de-duplicated, ',' joined)
 *   original_name = verbatim user name
 *   expires       = "2026-10-19T08:30:00Z"  (UTC, second precision)
 *
 * The three reserved slots are always charged against the budget whether or
 * not the tag is emitted, so callers see a stable custom-attribute allowance
 * of kMaxSlots - kReservedSlots. Unknown tags decode as custom attributes.
 */
class MetadataCodec {
public:
    static constexpr size_t kMaxSlots = 15;
    static constexpr size_t kReservedSlots = 3;

    static constexpr std::string_view kGroupsKey = "groups";
    static constexpr std::string_view kOriginalNameKey = "original_name";
    static constexpr std::string_view kExpiresKey = "expires";
    static constexpr std::string_view kLegacyNameKey = "name";
    static constexpr char kGroupDelimiter = ',';

    /**
     * @brief Build the tag set for a write
     * @return TAG_BUDGET_EXCEEDED (with slot_count/slot_limit) when
     *         kReservedSlots + custom.size() > kMaxSlots; VALIDATION for bad
     *         group names, reserved custom keys or an empty original name
     */
    [[nodiscard]] static Result<TagMap> encode(const std::set<std::string>& groups,
                                               std::string_view original_name,
                                               const std::optional<TimePoint>& expires_at,
                                               const TagMap& custom);

    [[nodiscard]] static Result<TagMap> encode(const SecretMetadata& metadata);

    /**
     * @brief Decode a stored tag set. Never fails: missing or malformed
     * reserved tags degrade to defaults (no groups, backend id as name,
     * no expiry).
     */
    [[nodiscard]] static SecretMetadata decode(const TagMap& tags, std::string_view backend_id);

    /**
     * @brief Read-modify-write: apply a caller update onto stored metadata.
     * `original_name` always comes from the caller.
     */
    [[nodiscard]] static Result<SecretMetadata> merge(const SecretMetadata& current,
                                                      const MetadataUpdate& update,
                                                      std::string_view original_name);

    /// Trim, validate and de-duplicate group names.
    [[nodiscard]] static Result<std::set<std::string>> normalize_groups(
        const std::set<std::string>& groups);

    [[nodiscard]] static std::set<std::string> parse_groups(std::string_view joined);

    [[nodiscard]] static bool is_reserved_key(std::string_view key);

    [[nodiscard]] static constexpr size_t custom_slot_limit() {
        return kMaxSlots - kReservedSlots;
    }
};

} // namespace kvault
