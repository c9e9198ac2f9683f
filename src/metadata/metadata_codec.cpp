#include "metadata/metadata_codec.hpp"
#include "core/utils.hpp"

#include <format>

namespace kvault {

bool MetadataCodec::is_reserved_key(std::string_view key) {
    return key == kGroupsKey || key == kOriginalNameKey || key == kExpiresKey;
}

Result<std::set<std::string>> MetadataCodec::normalize_groups(const std::set<std::string>& groups) {
    std::set<std::string> out;
    for (const auto& raw : groups) {
        std::string group = utils::trim(raw);
        if (group.empty()) {
            return Result<std::set<std::string>>::error(ErrorCode::VALIDATION,
                "Group name cannot be empty");
        }
        if (group.find(kGroupDelimiter) != std::string::npos) {
            return Result<std::set<std::string>>::error(ErrorCode::VALIDATION, std::format(
                "Group name '{}' must not contain '{}'", group, kGroupDelimiter));
        }
        out.insert(std::move(group));
    }
    return Result<std::set<std::string>>::ok(std::move(out));
}

std::set<std::string> MetadataCodec::parse_groups(std::string_view joined) {
    std::set<std::string> groups;
    for (const auto& part : utils::split(std::string(joined), kGroupDelimiter)) {
        auto group = utils::trim(part);
        if (!group.empty()) {
            groups.insert(std::move(group));
        }
    }
    return groups;
}

Result<TagMap> MetadataCodec::encode(const std::set<std::string>& groups,
                                     std::string_view original_name,
                                     const std::optional<TimePoint>& expires_at,
                                     const TagMap& custom) {
    const size_t slots = kReservedSlots + custom.size();
    if (slots > kMaxSlots) {
        return Result<TagMap>::error(Error{
            .code = ErrorCode::TAG_BUDGET_EXCEEDED,
            .message = std::format("{} attribute slots required, backend allows {} "
                                   "({} reserved, {} custom)",
                                   slots, kMaxSlots, kReservedSlots, custom.size()),
            .slot_count = slots,
            .slot_limit = kMaxSlots,
        });
    }

    if (original_name.empty()) {
        return Result<TagMap>::error(ErrorCode::VALIDATION, "original_name cannot be empty");
    }

    for (const auto& [key, _] : custom) {
        if (key.empty()) {
            return Result<TagMap>::error(ErrorCode::VALIDATION,
                "Custom attribute name cannot be empty");
        }
        if (is_reserved_key(key)) {
            return Result<TagMap>::error(ErrorCode::VALIDATION, std::format(
                "Custom attribute '{}' collides with a reserved attribute", key));
        }
    }

    auto normalized = normalize_groups(groups);
    if (normalized.is_error()) {
        return Result<TagMap>::error(normalized.error());
    }

    TagMap tags = custom;
    tags[std::string(kOriginalNameKey)] = std::string(original_name);

    if (!normalized.value().empty()) {
        std::string joined;
        for (const auto& g : normalized.value()) {
            if (!joined.empty()) joined += kGroupDelimiter;
            joined += g;
        }
        tags[std::string(kGroupsKey)] = std::move(joined);
    }

    if (expires_at) {
        tags[std::string(kExpiresKey)] = utils::format_iso8601(*expires_at);
    }

    return Result<TagMap>::ok(std::move(tags));
}

Result<TagMap> MetadataCodec::encode(const SecretMetadata& metadata) {
    return encode(metadata.groups, metadata.original_name, metadata.expires_at, metadata.custom);
}

SecretMetadata MetadataCodec::decode(const TagMap& tags, std::string_view backend_id) {
    SecretMetadata meta;

    for (const auto& [key, value] : tags) {
        if (key == kGroupsKey) {
            meta.groups = parse_groups(value);
        } else if (key == kOriginalNameKey) {
            meta.original_name = value;
        } else if (key == kExpiresKey) {
            meta.expires_at = utils::parse_iso8601(utils::trim(value));
            if (!meta.expires_at) {
                utils::log::warn(std::format(
                    "Ignoring unparseable expires tag '{}' on '{}'", value, backend_id));
            }
        } else {
            meta.custom.emplace(key, value);
        }
    }

    if (meta.original_name.empty()) {
        // Older writers stored the user name under "name"
        const auto legacy = tags.find(std::string(kLegacyNameKey));
        meta.original_name = (legacy != tags.end() && !legacy->second.empty())
            ? legacy->second
            : std::string(backend_id);
    }

    return meta;
}

Result<SecretMetadata> MetadataCodec::merge(const SecretMetadata& current,
                                            const MetadataUpdate& update,
                                            std::string_view original_name) {
    SecretMetadata merged;
    merged.original_name = std::string(original_name);

    // Groups
    merged.groups = current.groups;
    if (update.groups) {
        auto incoming = normalize_groups(*update.groups);
        if (incoming.is_error()) {
            return Result<SecretMetadata>::error(incoming.error());
        }
        if (update.replace_groups) {
            merged.groups = std::move(incoming.value());
        } else {
            merged.groups.insert(incoming.value().begin(), incoming.value().end());
        }
    }

    // Expiry
    if (update.clear_expiry) {
        merged.expires_at.reset();
    } else if (update.expires_at) {
        merged.expires_at = update.expires_at;
    } else {
        merged.expires_at = current.expires_at;
    }

    // Custom attributes
    if (update.replace_custom) {
        merged.custom = update.custom;
    } else {
        merged.custom = current.custom;
        for (const auto& [key, value] : update.custom) {
            merged.custom[key] = value;
        }
    }
    for (const auto& key : update.remove_custom) {
        merged.custom.erase(key);
    }

    for (const auto& [key, _] : merged.custom) {
        if (is_reserved_key(key)) {
            return Result<SecretMetadata>::error(ErrorCode::VALIDATION, std::format(
                "Custom attribute '{}' collides with a reserved attribute", key));
        }
    }

    return Result<SecretMetadata>::ok(std::move(merged));
}

} // namespace kvault
