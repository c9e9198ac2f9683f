#include <catch2/catch_test_macros.hpp>
#include "backend/key_vault_backend.hpp"
#include "core/utils.hpp"
#include "mocks/counting_credential.hpp"
#include "mocks/mock_http_transport.hpp"

#include <nlohmann/json.hpp>

#include <memory>

using namespace kvault;
using namespace kvault::testing;
using json = nlohmann::json;

namespace {

struct BackendHarness {
    std::shared_ptr<MockHttpTransport> transport = std::make_shared<MockHttpTransport>();
    std::shared_ptr<AuthTokenProvider> tokens =
        std::make_shared<AuthTokenProvider>(std::make_shared<CountingCredential>());
    std::shared_ptr<OperationExecutor> executor =
        std::make_shared<OperationExecutor>(transport, tokens, RetryPolicy::none());
    KeyVaultBackend backend{executor, VaultConfig{}};
};

const std::string kBundle = R"({
    "value": "s3cret",
    "id": "https://demo.vault.azure.net/secrets/db-password/4387e9f3d6e14c459867679a90fd0f79",
    "contentType": "text/plain",
    "attributes": {"enabled": true, "created": 1700000000, "updated": 1700000100, "exp": 1800000000},
    "tags": {"original_name": "db/password", "groups": "db,prod"}
})";

} // namespace

TEST_CASE("KeyVaultBackend: set issues a non-idempotent PUT", "[backend]") {
    BackendHarness h;
    h.transport->respond(200, kBundle);

    SetSecretRequest req;
    req.backend_id = "db-password";
    req.value = SecureString("s3cret");
    req.tags = {{"original_name", "db/password"}};
    req.expires_at = utils::from_unix_seconds(1800000000);

    auto stored = h.backend.set_secret("demo", req, CancellationToken::none());
    REQUIRE(stored.is_ok());
    CHECK(stored.value().version_id == "4387e9f3d6e14c459867679a90fd0f79");
    CHECK(stored.value().value.view() == "s3cret");

    const auto sent = h.transport->requests();
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].method == HttpMethod::PUT);
    CHECK(sent[0].url == "https://demo.vault.azure.net/secrets/db-password?api-version=7.4");
    CHECK_FALSE(sent[0].idempotent);

    const auto body = json::parse(sent[0].body);
    CHECK(body["value"] == "s3cret");
    CHECK(body["tags"]["original_name"] == "db/password");
    CHECK(body["attributes"]["enabled"] == true);
    CHECK(body["attributes"]["exp"] == 1800000000);
}

TEST_CASE("KeyVaultBackend: get parses the secret bundle", "[backend]") {
    BackendHarness h;
    h.transport->respond(200, kBundle);

    auto stored = h.backend.get_secret("demo", "db-password", "4387e9f3d6e14c459867679a90fd0f79",
                                       CancellationToken::none());
    REQUIRE(stored.is_ok());
    const auto& s = stored.value();
    CHECK(s.backend_id == "db-password");
    CHECK(s.value.view() == "s3cret");
    CHECK(s.content_type == "text/plain");
    CHECK(s.enabled);
    CHECK(utils::to_unix_seconds(s.created_at) == 1700000000);
    CHECK(utils::to_unix_seconds(s.updated_at) == 1700000100);
    REQUIRE(s.expires_at.has_value());
    CHECK(utils::to_unix_seconds(*s.expires_at) == 1800000000);
    CHECK(s.tags.at("groups") == "db,prod");

    CHECK(h.transport->requests()[0].url ==
          "https://demo.vault.azure.net/secrets/db-password/4387e9f3d6e14c459867679a90fd0f79?api-version=7.4");
}

TEST_CASE("KeyVaultBackend: current version omits the version segment", "[backend]") {
    BackendHarness h;
    h.transport->respond(200, kBundle);
    REQUIRE(h.backend.get_secret("demo", "db-password", "", CancellationToken::none()).is_ok());
    CHECK(h.transport->requests()[0].url ==
          "https://demo.vault.azure.net/secrets/db-password?api-version=7.4");
}

TEST_CASE("KeyVaultBackend: missing secret maps to NOT_FOUND", "[backend]") {
    BackendHarness h;
    auto stored = h.backend.get_secret("demo", "nope", "", CancellationToken::none());
    REQUIRE(stored.is_error());
    CHECK(stored.error_code() == ErrorCode::NOT_FOUND);
}

TEST_CASE("KeyVaultBackend: malformed payload is INTERNAL", "[backend]") {
    BackendHarness h;
    h.transport->respond(200, "<html>gateway</html>");
    auto stored = h.backend.get_secret("demo", "x", "", CancellationToken::none());
    REQUIRE(stored.is_error());
    CHECK(stored.error_code() == ErrorCode::INTERNAL);
}

TEST_CASE("KeyVaultBackend: listing follows nextLink verbatim", "[backend][paging]") {
    BackendHarness h;
    const std::string next = "https://demo.vault.azure.net/secrets?api-version=7.4&$skiptoken=abc&maxresults=25";
    h.transport->respond(200, json{
        {"value", json::array({
            {{"id", "https://demo.vault.azure.net/secrets/alpha"},
             {"attributes", {{"enabled", true}, {"created", 1}, {"updated", 2}}},
             {"tags", {{"original_name", "alpha"}}}},
            {{"id", "https://demo.vault.azure.net/secrets/beta"},
             {"attributes", {{"enabled", false}, {"created", 3}, {"updated", 4}}}},
        })},
        {"nextLink", next},
    }.dump());
    h.transport->respond(200, R"({"value": [], "nextLink": null})");

    auto first = h.backend.list_secrets_page("demo", std::nullopt, CancellationToken::none());
    REQUIRE(first.is_ok());
    REQUIRE(first.value().items.size() == 2);
    CHECK(first.value().items[0].backend_id == "alpha");
    CHECK(first.value().items[0].version_id.empty());
    CHECK_FALSE(first.value().items[1].enabled);
    REQUIRE(first.value().next_cursor.has_value());
    CHECK(*first.value().next_cursor == next);

    auto second = h.backend.list_secrets_page("demo", first.value().next_cursor, CancellationToken::none());
    REQUIRE(second.is_ok());
    CHECK(second.value().items.empty());
    CHECK_FALSE(second.value().next_cursor.has_value());

    const auto sent = h.transport->requests();
    CHECK(sent[0].url == "https://demo.vault.azure.net/secrets?api-version=7.4&maxresults=25");
    CHECK(sent[1].url == next);
}

TEST_CASE("KeyVaultBackend: version listing carries version ids", "[backend][paging]") {
    BackendHarness h;
    h.transport->respond(200, R"({"value": [
        {"id": "https://demo.vault.azure.net/secrets/alpha/v1", "attributes": {"created": 10}},
        {"id": "https://demo.vault.azure.net/secrets/alpha/v2", "attributes": {"created": 20}}
    ]})");

    auto page = h.backend.list_versions_page("demo", "alpha", std::nullopt, CancellationToken::none());
    REQUIRE(page.is_ok());
    REQUIRE(page.value().items.size() == 2);
    CHECK(page.value().items[0].version_id == "v1");
    CHECK(page.value().items[1].version_id == "v2");
    CHECK(h.transport->requests()[0].url ==
          "https://demo.vault.azure.net/secrets/alpha/versions?api-version=7.4&maxresults=25");
}

TEST_CASE("KeyVaultBackend: properties come from the newest listed version", "[backend][paging]") {
    BackendHarness h;
    const std::string next =
        "https://demo.vault.azure.net:443/secrets/alpha/versions?api-version=7.4&$skiptoken=p2&maxresults=25";
    h.transport->respond(200, json{
        {"value", json::array({
            {{"id", "https://demo.vault.azure.net/secrets/alpha/v1"},
             {"attributes", {{"enabled", true}, {"created", 10}, {"updated", 10}}},
             {"tags", {{"original_name", "alpha"}, {"groups", "old"}}}},
        })},
        {"nextLink", next},
    }.dump());
    h.transport->respond(200, json{
        {"value", json::array({
            {{"id", "https://demo.vault.azure.net/secrets/alpha/v3"},
             {"attributes", {{"enabled", false}, {"created", 30}, {"updated", 31}}},
             {"tags", {{"original_name", "alpha"}, {"groups", "new"}}}},
            {{"id", "https://demo.vault.azure.net/secrets/alpha/v2"},
             {"attributes", {{"enabled", true}, {"created", 20}, {"updated", 20}}}},
        })},
    }.dump());

    auto props = h.backend.get_properties("demo", "alpha", CancellationToken::none());
    REQUIRE(props.is_ok());
    CHECK(props.value().version_id == "v3");
    CHECK_FALSE(props.value().enabled);
    CHECK(props.value().tags.at("groups") == "new");

    const auto sent = h.transport->requests();
    REQUIRE(sent.size() == 2);
    CHECK(sent[0].url == "https://demo.vault.azure.net/secrets/alpha/versions?api-version=7.4&maxresults=25");
    CHECK(sent[1].url == next);
}

TEST_CASE("KeyVaultBackend: properties of a secret without versions is NOT_FOUND", "[backend]") {
    BackendHarness h;
    h.transport->respond(200, R"({"value": []})");

    auto props = h.backend.get_properties("demo", "ghost", CancellationToken::none());
    REQUIRE(props.is_error());
    CHECK(props.error_code() == ErrorCode::NOT_FOUND);
    CHECK(props.error().http_status == 404);
}

TEST_CASE("KeyVaultBackend: nextLink outside the vault is not followed", "[backend][paging]") {
    BackendHarness h;
    h.transport->respond(200, R"({"value": [
        {"id": "https://demo.vault.azure.net/secrets/alpha/v1", "attributes": {"created": 10}}
    ], "nextLink": "https://evil.example.com/secrets/alpha/versions?$skiptoken=x"})");

    auto props = h.backend.get_properties("demo", "alpha", CancellationToken::none());
    REQUIRE(props.is_error());
    CHECK(props.error_code() == ErrorCode::INTERNAL);
    CHECK(h.transport->send_count() == 1);

    for (const std::string link : {"https://demo.vault.azure.net.evil.com/secrets",
                                   "http://demo.vault.azure.net/secrets",
                                   "https://other.vault.azure.net/secrets"}) {
        auto page = h.backend.list_secrets_page("demo", link, CancellationToken::none());
        REQUIRE(page.is_error());
        CHECK(page.error_code() == ErrorCode::INTERNAL);
    }
    CHECK(h.transport->send_count() == 1);
}

TEST_CASE("KeyVaultBackend: update sends a PATCH with tags and cleared expiry", "[backend]") {
    BackendHarness h;
    h.transport->respond(200, R"({"id": "https://demo.vault.azure.net/secrets/alpha/v2",
                                  "attributes": {"enabled": true}, "tags": {"original_name": "alpha"}})");

    PropertiesUpdate update;
    update.backend_id = "alpha";
    update.version_id = "v2";
    update.tags = TagMap{{"original_name", "alpha"}};
    update.clear_expiry = true;

    auto item = h.backend.update_properties("demo", update, CancellationToken::none());
    REQUIRE(item.is_ok());
    CHECK(item.value().version_id == "v2");

    const auto sent = h.transport->requests();
    CHECK(sent[0].method == HttpMethod::PATCH);
    CHECK(sent[0].url == "https://demo.vault.azure.net/secrets/alpha/v2?api-version=7.4");
    const auto body = json::parse(sent[0].body);
    CHECK(body["tags"]["original_name"] == "alpha");
    CHECK(body["attributes"]["exp"].is_null());
}

TEST_CASE("KeyVaultBackend: delete, recover and purge endpoints", "[backend][lifecycle]") {
    BackendHarness h;
    const std::string deleted = R"({
        "recoveryId": "https://demo.vault.azure.net/deletedsecrets/alpha",
        "deletedDate": 1700000500,
        "scheduledPurgeDate": 1707776500,
        "id": "https://demo.vault.azure.net/secrets/alpha",
        "attributes": {"enabled": true, "created": 1700000000, "updated": 1700000000},
        "tags": {"original_name": "alpha"}
    })";
    h.transport->respond(200, deleted);
    h.transport->respond(200, R"({"id": "https://demo.vault.azure.net/secrets/alpha/v2", "attributes": {}})");
    h.transport->respond(204);

    auto del = h.backend.delete_secret("demo", "alpha", CancellationToken::none());
    REQUIRE(del.is_ok());
    CHECK(del.value().deleted);
    REQUIRE(del.value().scheduled_purge.has_value());
    CHECK(utils::to_unix_seconds(*del.value().scheduled_purge) == 1707776500);

    auto rec = h.backend.recover_deleted_secret("demo", "alpha", CancellationToken::none());
    REQUIRE(rec.is_ok());
    CHECK_FALSE(rec.value().deleted);

    CHECK(h.backend.purge_deleted_secret("demo", "alpha", CancellationToken::none()).is_ok());

    const auto sent = h.transport->requests();
    REQUIRE(sent.size() == 3);
    CHECK(sent[0].method == HttpMethod::DELETE_);
    CHECK(sent[0].url == "https://demo.vault.azure.net/secrets/alpha?api-version=7.4");
    CHECK(sent[1].method == HttpMethod::POST);
    CHECK(sent[1].url == "https://demo.vault.azure.net/deletedsecrets/alpha/recover?api-version=7.4");
    CHECK(sent[2].method == HttpMethod::DELETE_);
    CHECK(sent[2].url == "https://demo.vault.azure.net/deletedsecrets/alpha?api-version=7.4");
}

TEST_CASE("KeyVaultBackend: secret id splitting", "[backend]") {
    std::string name, version;

    KeyVaultBackend::split_secret_id("https://v.vault.azure.net/secrets/alpha/abc", name, version);
    CHECK(name == "alpha");
    CHECK(version == "abc");

    KeyVaultBackend::split_secret_id("https://v.vault.azure.net/secrets/alpha", name, version);
    CHECK(name == "alpha");
    CHECK(version.empty());

    KeyVaultBackend::split_secret_id("https://v.vault.azure.net/deletedsecrets/beta", name, version);
    CHECK(name == "beta");

    KeyVaultBackend::split_secret_id("not a url", name, version);
    CHECK(name.empty());
    CHECK(version.empty());
}

TEST_CASE("KeyVaultBackend: parsing a bundle wipes the raw body", "[backend][hygiene]") {
    std::string body = kBundle;
    auto stored = KeyVaultBackend::parse_secret_bundle(body);
    REQUIRE(stored.is_ok());
    CHECK(body.empty());
    CHECK(stored.value().value.view() == "s3cret");
}
