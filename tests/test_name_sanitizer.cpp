#include <catch2/catch_test_macros.hpp>
#include "identity/name_sanitizer.hpp"

using namespace kvault;

TEST_CASE("NameSanitizer: valid names pass through unchanged", "[identity]") {
    for (const char* name : {"db-password", "API-KEY-2", "a", "--edge--"}) {
        auto id = NameSanitizer::sanitize(name, "prod-vault");
        REQUIRE(id.is_ok());
        CHECK(id.value().backend_id == name);
        CHECK(id.value().user_name == name);
        CHECK(id.value().vault == "prod-vault");
        CHECK_FALSE(id.value().hashed);
    }
}

TEST_CASE("NameSanitizer: disallowed characters become separators", "[identity]") {
    auto id = NameSanitizer::sanitize("my/secret name");
    REQUIRE(id.is_ok());
    CHECK(id.value().backend_id == "my-secret-name");
    CHECK(id.value().user_name == "my/secret name");
    CHECK_FALSE(id.value().hashed);
}

TEST_CASE("NameSanitizer: separator runs collapse and edges are trimmed", "[identity]") {
    auto id = NameSanitizer::sanitize("  app::db  password!! ");
    REQUIRE(id.is_ok());
    CHECK(id.value().backend_id == "app-db-password");

    auto underscores = NameSanitizer::sanitize("__init__");
    REQUIRE(underscores.is_ok());
    CHECK(underscores.value().backend_id == "init");
}

TEST_CASE("NameSanitizer: nothing usable left falls back to hash", "[identity]") {
    auto id = NameSanitizer::sanitize("///");
    REQUIRE(id.is_ok());
    CHECK(id.value().hashed);
    CHECK(id.value().backend_id.starts_with("h-"));
    CHECK(id.value().backend_id.size() == 34);
    CHECK(NameSanitizer::is_valid_backend_name(id.value().backend_id));
}

TEST_CASE("NameSanitizer: overlong names are hashed", "[identity]") {
    const std::string long_name(200, 'a');
    auto id = NameSanitizer::sanitize(long_name);
    REQUIRE(id.is_ok());
    CHECK(id.value().hashed);
    CHECK(id.value().backend_id == NameSanitizer::hash_name(long_name));

    const std::string limit(127, 'b');
    auto at_limit = NameSanitizer::sanitize(limit);
    REQUIRE(at_limit.is_ok());
    CHECK_FALSE(at_limit.value().hashed);
    CHECK(at_limit.value().backend_id == limit);
}

TEST_CASE("NameSanitizer: hash is deterministic SHA-256 prefix", "[identity]") {
    // SHA-256("abc") = ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad
    CHECK(NameSanitizer::hash_name("abc") == "h-ba7816bf8f01cfea414140de5dae2223");
    CHECK(NameSanitizer::hash_name("abc") == NameSanitizer::hash_name("abc"));
    CHECK(NameSanitizer::hash_name("abc") != NameSanitizer::hash_name("abd"));
}

TEST_CASE("NameSanitizer: empty name is rejected", "[identity]") {
    auto id = NameSanitizer::sanitize("");
    REQUIRE(id.is_error());
    CHECK(id.error_code() == ErrorCode::VALIDATION);
}

TEST_CASE("NameSanitizer: restore prefers stored original name", "[identity]") {
    CHECK(NameSanitizer::restore(std::string("my/secret"), "my-secret") == "my/secret");
    CHECK(NameSanitizer::restore(std::nullopt, "my-secret") == "my-secret");
    CHECK(NameSanitizer::restore(std::string(""), "my-secret") == "my-secret");
}

TEST_CASE("NameSanitizer: colliding names are detected by owner check", "[identity]") {
    auto a = NameSanitizer::sanitize("a b");
    auto b = NameSanitizer::sanitize("a-b");
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(a.value().backend_id == b.value().backend_id);

    // Stored item was written for "a b"; reading it as "a-b" must fail
    auto owner = NameSanitizer::verify_owner(b.value(), std::string("a b"));
    REQUIRE(owner.is_error());
    CHECK(owner.error_code() == ErrorCode::NAME_COLLISION);

    CHECK(NameSanitizer::verify_owner(a.value(), std::string("a b")).is_ok());
}

TEST_CASE("NameSanitizer: untagged items belong to their backend id", "[identity]") {
    auto plain = NameSanitizer::sanitize("db-password");
    auto slashed = NameSanitizer::sanitize("db/password");
    REQUIRE(plain.is_ok());
    REQUIRE(slashed.is_ok());
    REQUIRE(plain.value().backend_id == slashed.value().backend_id);

    const auto stored = NameSanitizer::restore(std::nullopt, "db-password");
    CHECK(NameSanitizer::verify_owner(plain.value(), stored).is_ok());

    auto foreign = NameSanitizer::verify_owner(slashed.value(), stored);
    REQUIRE(foreign.is_error());
    CHECK(foreign.error_code() == ErrorCode::NAME_COLLISION);
}

TEST_CASE("NameSanitizer: describe reports modification", "[identity]") {
    auto info = NameSanitizer::describe("x.y");
    CHECK(info.original == "x.y");
    CHECK(info.sanitized == "x-y");
    CHECK(info.was_modified);
    CHECK_FALSE(info.is_hashed);

    auto same = NameSanitizer::describe("plain");
    CHECK_FALSE(same.was_modified);
}

TEST_CASE("NameSanitizer: vault name rules", "[identity][vault]") {
    CHECK(NameSanitizer::validate_vault_name("prod-vault").is_ok());
    CHECK(NameSanitizer::validate_vault_name("abc").is_ok());
    CHECK(NameSanitizer::validate_vault_name("ab").is_error());
    CHECK(NameSanitizer::validate_vault_name(std::string(25, 'a')).is_error());
    CHECK(NameSanitizer::validate_vault_name("1vault").is_error());
    CHECK(NameSanitizer::validate_vault_name("vault-").is_error());
    CHECK(NameSanitizer::validate_vault_name("my--vault").is_error());
    CHECK(NameSanitizer::validate_vault_name("my_vault").is_error());
}
