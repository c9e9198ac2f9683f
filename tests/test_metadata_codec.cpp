#include <catch2/catch_test_macros.hpp>
#include "metadata/metadata_codec.hpp"
#include "core/utils.hpp"

#include <format>

using namespace kvault;

namespace {

TagMap custom_attrs(size_t n) {
    TagMap out;
    for (size_t i = 0; i < n; ++i) {
        out[std::format("attr{:02}", i)] = "v";
    }
    return out;
}

} // namespace

TEST_CASE("MetadataCodec: encode writes reserved tags", "[metadata]") {
    const auto expires = utils::parse_iso8601("2027-01-31T12:00:00Z");
    REQUIRE(expires.has_value());

    auto tags = MetadataCodec::encode({"prod", "db"}, "db/password", expires, {{"owner", "ops"}});
    REQUIRE(tags.is_ok());
    const auto& t = tags.value();
    CHECK(t.at("groups") == "db,prod");
    CHECK(t.at("original_name") == "db/password");
    CHECK(t.at("expires") == "2027-01-31T12:00:00Z");
    CHECK(t.at("owner") == "ops");
    CHECK(t.size() == 4);
}

TEST_CASE("MetadataCodec: optional reserved tags are omitted", "[metadata]") {
    auto tags = MetadataCodec::encode({}, "plain", std::nullopt, {});
    REQUIRE(tags.is_ok());
    CHECK(tags.value().size() == 1);
    CHECK_FALSE(tags.value().contains("groups"));
    CHECK_FALSE(tags.value().contains("expires"));
}

TEST_CASE("MetadataCodec: groups are trimmed and deduplicated", "[metadata]") {
    auto tags = MetadataCodec::encode({" web ", "web", "api"}, "n", std::nullopt, {});
    REQUIRE(tags.is_ok());
    CHECK(tags.value().at("groups") == "api,web");
}

TEST_CASE("MetadataCodec: invalid group names are rejected", "[metadata]") {
    auto blank = MetadataCodec::encode({"  "}, "n", std::nullopt, {});
    REQUIRE(blank.is_error());
    CHECK(blank.error_code() == ErrorCode::VALIDATION);

    auto comma = MetadataCodec::encode({"a,b"}, "n", std::nullopt, {});
    REQUIRE(comma.is_error());
    CHECK(comma.error_code() == ErrorCode::VALIDATION);
}

TEST_CASE("MetadataCodec: slot budget counts reserved slots even when empty", "[metadata][budget]") {
    REQUIRE(MetadataCodec::custom_slot_limit() == 12);

    // 3 reserved + 12 custom = 15: fits
    CHECK(MetadataCodec::encode({}, "n", std::nullopt, custom_attrs(12)).is_ok());

    // 3 reserved + 13 custom = 16: rejected, although only 14 tags would be written
    auto over = MetadataCodec::encode({}, "n", std::nullopt, custom_attrs(13));
    REQUIRE(over.is_error());
    CHECK(over.error_code() == ErrorCode::TAG_BUDGET_EXCEEDED);
    CHECK(over.error().slot_count == 16);
    CHECK(over.error().slot_limit == 15);
}

TEST_CASE("MetadataCodec: custom keys cannot shadow reserved keys", "[metadata]") {
    auto tags = MetadataCodec::encode({}, "n", std::nullopt, {{"groups", "x"}});
    REQUIRE(tags.is_error());
    CHECK(tags.error_code() == ErrorCode::VALIDATION);
}

TEST_CASE("MetadataCodec: empty original name is rejected", "[metadata]") {
    auto tags = MetadataCodec::encode({}, "", std::nullopt, {});
    REQUIRE(tags.is_error());
    CHECK(tags.error_code() == ErrorCode::VALIDATION);
}

TEST_CASE("MetadataCodec: decode restores every field", "[metadata]") {
    const TagMap stored{
        {"groups", "db,prod"},
        {"original_name", "db/password"},
        {"expires", "2027-01-31T12:00:00Z"},
        {"owner", "ops"},
    };
    const auto meta = MetadataCodec::decode(stored, "db-password");
    CHECK(meta.groups == std::set<std::string>{"db", "prod"});
    CHECK(meta.original_name == "db/password");
    REQUIRE(meta.expires_at.has_value());
    CHECK(utils::format_iso8601(*meta.expires_at) == "2027-01-31T12:00:00Z");
    CHECK(meta.custom == TagMap{{"owner", "ops"}});
}

TEST_CASE("MetadataCodec: decode tolerates foreign and malformed tags", "[metadata]") {
    SECTION("no tags at all") {
        const auto meta = MetadataCodec::decode({}, "raw-secret");
        CHECK(meta.groups.empty());
        CHECK(meta.original_name == "raw-secret");
        CHECK_FALSE(meta.expires_at.has_value());
    }
    SECTION("legacy name tag") {
        const auto meta = MetadataCodec::decode({{"name", "legacy/name"}}, "legacy-name");
        CHECK(meta.original_name == "legacy/name");
    }
    SECTION("garbage expiry and empty group entries") {
        const auto meta = MetadataCodec::decode(
            {{"expires", "next tuesday"}, {"groups", ",a,,b ,"}}, "x");
        CHECK_FALSE(meta.expires_at.has_value());
        CHECK(meta.groups == std::set<std::string>{"a", "b"});
    }
}

TEST_CASE("MetadataCodec: merge unions groups and keeps unspecified fields", "[metadata][merge]") {
    SecretMetadata current;
    current.groups = {"db"};
    current.original_name = "old";
    current.expires_at = utils::parse_iso8601("2027-01-01T00:00:00Z");
    current.custom = {{"owner", "ops"}, {"note", "keep"}};

    MetadataUpdate update;
    update.groups = std::set<std::string>{"prod"};
    update.custom = {{"owner", "sre"}};

    auto merged = MetadataCodec::merge(current, update, "db/password");
    REQUIRE(merged.is_ok());
    CHECK(merged.value().groups == std::set<std::string>{"db", "prod"});
    CHECK(merged.value().original_name == "db/password");
    CHECK(merged.value().expires_at == current.expires_at);
    CHECK(merged.value().custom == TagMap{{"note", "keep"}, {"owner", "sre"}});
}

TEST_CASE("MetadataCodec: merge replace and clear flags", "[metadata][merge]") {
    SecretMetadata current;
    current.groups = {"db", "prod"};
    current.expires_at = utils::parse_iso8601("2027-01-01T00:00:00Z");
    current.custom = {{"owner", "ops"}, {"note", "x"}};

    MetadataUpdate update;
    update.groups = std::set<std::string>{"staging"};
    update.replace_groups = true;
    update.clear_expiry = true;
    update.remove_custom = {"note"};

    auto merged = MetadataCodec::merge(current, update, "n");
    REQUIRE(merged.is_ok());
    CHECK(merged.value().groups == std::set<std::string>{"staging"});
    CHECK_FALSE(merged.value().expires_at.has_value());
    CHECK(merged.value().custom == TagMap{{"owner", "ops"}});
}

TEST_CASE("MetadataCodec: merge rejects reserved custom keys", "[metadata][merge]") {
    MetadataUpdate update;
    update.custom = {{"expires", "tomorrow"}};
    auto merged = MetadataCodec::merge({}, update, "n");
    REQUIRE(merged.is_error());
    CHECK(merged.error_code() == ErrorCode::VALIDATION);
}
