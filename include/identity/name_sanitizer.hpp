#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace kvault {

/**
 * @brief Maps arbitrary user secret names onto the backend identifier
 * alphabet ([A-Za-z0-9-], 1..127 characters).
 *
 * Pipeline:
 *   1. Already valid            -> unchanged (identity fast path)
 *   2. Disallowed bytes         -> '-', runs collapsed, edges trimmed
 *   3. Empty or still too long  -> "h-" + hex(SHA-256(name)[0..16])
 *
 * Sanitization is never inverted: the user name is restored from the stored
 * `original_name` tag, and a mismatch on read is a NAME_COLLISION.
 */
class NameSanitizer {
public:
    static constexpr size_t kMaxNameLength = 127;
    static constexpr std::string_view kHashMarker = "h-";
    static constexpr size_t kHashBytes = 16;
    static constexpr char kSeparator = '-';

    struct NameInfo {
        std::string original;
        std::string sanitized;
        bool was_modified = false;
        bool is_hashed = false;
    };

    [[nodiscard]] static bool is_valid_backend_name(std::string_view name);

    /**
     * @brief Resolve the backend identifier for a user name in a vault
     * @return VALIDATION error for an empty name, otherwise always succeeds
     */
    [[nodiscard]] static Result<SecretIdentity> sanitize(std::string_view user_name,
                                                         std::string_view vault = {});

    /// Deterministic hashed identifier ("h-" + 32 hex chars).
    [[nodiscard]] static std::string hash_name(std::string_view user_name);

    /// Recover the user name from the stored attribute, falling back to the
    /// backend identifier for secrets written without one.
    [[nodiscard]] static std::string restore(const std::optional<std::string>& original_name_attr,
                                             std::string_view backend_id);

    /**
     * @brief Confirm a stored secret belongs to the requested user name
     * @param stored_name the stored item's restored user name: its
     *        original_name, else the legacy name tag, else its backend id
     * @return NAME_COLLISION when the names differ
     */
    [[nodiscard]] static Result<void> verify_owner(const SecretIdentity& requested,
                                                   std::string_view stored_name);

    [[nodiscard]] static NameInfo describe(std::string_view user_name);

    // Vault names are DNS labels: validated, never rewritten.
    [[nodiscard]] static Result<void> validate_vault_name(std::string_view vault);

private:
    [[nodiscard]] static std::string replace_disallowed(std::string_view name);
};

} // namespace kvault
