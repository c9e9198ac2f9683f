#include "identity/name_sanitizer.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <format>

namespace kvault {

namespace {

bool is_allowed_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-';
}

} // anonymous namespace

bool NameSanitizer::is_valid_backend_name(std::string_view name) {
    if (name.empty() || name.size() > kMaxNameLength) return false;
    for (const char c : name) {
        if (!is_allowed_char(c)) return false;
    }
    return true;
}

std::string NameSanitizer::replace_disallowed(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (const char c : name) {
        const char mapped = is_allowed_char(c) ? c : kSeparator;
        // Collapse separator runs as they are produced
        if (mapped == kSeparator && !out.empty() && out.back() == kSeparator) continue;
        out += mapped;
    }

    const auto start = out.find_first_not_of(kSeparator);
    if (start == std::string::npos) return {};
    const auto end = out.find_last_not_of(kSeparator);
    return out.substr(start, end - start + 1);
}

std::string NameSanitizer::hash_name(std::string_view user_name) {
    std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
    unsigned int len = 0;
    if (EVP_Digest(user_name.data(), user_name.size(), digest.data(), &len,
                   EVP_sha256(), nullptr) != 1) {
        // EVP_Digest only fails on allocation failure inside OpenSSL
        throw std::runtime_error("EVP_Digest(SHA-256) failed");
    }
    return std::string(kHashMarker) + utils::hex_encode(digest.data(), kHashBytes);
}

Result<SecretIdentity> NameSanitizer::sanitize(std::string_view user_name, std::string_view vault) {
    if (user_name.empty()) {
        return Result<SecretIdentity>::error(ErrorCode::VALIDATION,
                                             "Secret name cannot be empty");
    }

    SecretIdentity id{
        .vault = std::string(vault),
        .user_name = std::string(user_name),
    };

    if (is_valid_backend_name(user_name)) {
        id.backend_id = std::string(user_name);
        return Result<SecretIdentity>::ok(std::move(id));
    }

    std::string candidate = replace_disallowed(user_name);
    if (candidate.empty() || candidate.size() > kMaxNameLength) {
        id.backend_id = hash_name(user_name);
        id.hashed = true;
    } else {
        id.backend_id = std::move(candidate);
    }

    utils::log::debug(std::format("Sanitized secret name -> '{}'{}", id.backend_id,
                                  id.hashed ? " (hashed)" : ""));
    return Result<SecretIdentity>::ok(std::move(id));
}

std::string NameSanitizer::restore(const std::optional<std::string>& original_name_attr,
                                   std::string_view backend_id) {
    if (original_name_attr && !original_name_attr->empty()) {
        return *original_name_attr;
    }
    return std::string(backend_id);
}

Result<void> NameSanitizer::verify_owner(const SecretIdentity& requested,
                                         std::string_view stored_name) {
    // Untagged items written by other tools are owned by their backend id
    if (stored_name != requested.user_name) {
        return Result<void>::error(ErrorCode::NAME_COLLISION, std::format(
            "Backend item '{}' belongs to secret '{}', not '{}'",
            requested.backend_id, stored_name, requested.user_name));
    }
    return Result<void>::ok();
}

NameSanitizer::NameInfo NameSanitizer::describe(std::string_view user_name) {
    NameInfo info;
    info.original = std::string(user_name);

    auto id = sanitize(user_name);
    if (id.is_error()) {
        return info;
    }
    info.sanitized = id.value().backend_id;
    info.is_hashed = id.value().hashed;
    info.was_modified = info.sanitized != info.original;
    return info;
}

Result<void> NameSanitizer::validate_vault_name(std::string_view vault) {
    if (vault.size() < 3 || vault.size() > 24) {
        return Result<void>::error(ErrorCode::VALIDATION, std::format(
            "Vault name '{}' must be 3-24 characters", vault));
    }
    const auto is_letter = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
    if (!is_letter(vault.front())) {
        return Result<void>::error(ErrorCode::VALIDATION, std::format(
            "Vault name '{}' must start with a letter", vault));
    }
    if (vault.back() == '-') {
        return Result<void>::error(ErrorCode::VALIDATION, std::format(
            "Vault name '{}' must end with a letter or digit", vault));
    }
    for (size_t i = 0; i < vault.size(); ++i) {
        if (!is_allowed_char(vault[i])) {
            return Result<void>::error(ErrorCode::VALIDATION, std::format(
                "Vault name '{}' contains disallowed character at position {}", vault, i));
        }
        if (vault[i] == '-' && i > 0 && vault[i - 1] == '-') {
            return Result<void>::error(ErrorCode::VALIDATION, std::format(
                "Vault name '{}' must not contain consecutive hyphens", vault));
        }
    }
    return Result<void>::ok();
}

} // namespace kvault
