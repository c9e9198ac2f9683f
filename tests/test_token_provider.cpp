#include <catch2/catch_test_macros.hpp>
#include "auth/token_provider.hpp"
#include "mocks/counting_credential.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace kvault;
using namespace kvault::testing;
using namespace std::chrono_literals;

namespace {

const std::string kScope = "https://vault.azure.net/.default";

} // namespace

TEST_CASE("TokenProvider: cached token is reused while fresh", "[auth][token]") {
    auto cred = std::make_shared<CountingCredential>();
    AuthTokenProvider provider(cred);

    auto first = provider.get_token(kScope);
    auto second = provider.get_token(kScope);
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    CHECK(first.value() == second.value());
    CHECK(first.value()->token.view() == "token-1");
    CHECK(cred->fetch_count() == 1);
    CHECK(provider.cache_hits() == 1);
}

TEST_CASE("TokenProvider: scopes are cached independently", "[auth][token]") {
    auto cred = std::make_shared<CountingCredential>();
    AuthTokenProvider provider(cred);

    auto a = provider.get_token("scope-a");
    auto b = provider.get_token("scope-b");
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK(a.value()->scope == "scope-a");
    CHECK(b.value()->scope == "scope-b");
    CHECK(cred->fetch_count() == 2);
}

TEST_CASE("TokenProvider: token inside the refresh margin is refreshed", "[auth][token]") {
    // 60s lifetime against a 300s margin: never fresh
    auto cred = std::make_shared<CountingCredential>(0ms, 60s);
    AuthTokenProvider provider(cred);

    REQUIRE(provider.get_token(kScope).is_ok());
    auto again = provider.get_token(kScope);
    REQUIRE(again.is_ok());
    CHECK(again.value()->token.view() == "token-2");
    CHECK(cred->fetch_count() == 2);
}

TEST_CASE("TokenProvider: concurrent callers share one refresh", "[auth][token][concurrency]") {
    auto cred = std::make_shared<CountingCredential>(150ms);
    AuthTokenProvider provider(cred);

    constexpr int kCallers = 10;
    std::vector<std::string> seen(kCallers);
    std::vector<int> ok(kCallers, 0);
    std::vector<std::thread> threads;
    threads.reserve(kCallers);

    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&, i] {
            auto lease = provider.get_token(kScope);
            if (lease.is_ok()) {
                ok[i] = 1;
                seen[i] = std::string(lease.value()->token.view());
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(cred->fetch_count() == 1);
    CHECK(provider.refresh_count() == 1);
    for (int i = 0; i < kCallers; ++i) {
        CHECK(ok[i] == 1);
        CHECK(seen[i] == "token-1");
    }
}

TEST_CASE("TokenProvider: cancelled leader hands over to a follower", "[auth][token][cancel]") {
    auto cred = std::make_shared<CountingCredential>(400ms);
    AuthTokenProvider provider(cred);

    CancellationToken leader_cancel;
    Result<TokenLease> leader_result = Result<TokenLease>::error(ErrorCode::INTERNAL, "unset");
    Result<TokenLease> follower_result = Result<TokenLease>::error(ErrorCode::INTERNAL, "unset");

    std::thread leader([&] { leader_result = provider.get_token(kScope, leader_cancel); });
    std::this_thread::sleep_for(50ms);
    std::thread follower([&] { follower_result = provider.get_token(kScope); });
    std::this_thread::sleep_for(50ms);
    leader_cancel.cancel();

    leader.join();
    follower.join();

    REQUIRE(leader_result.is_error());
    CHECK(leader_result.error_code() == ErrorCode::CANCELLED);
    REQUIRE(follower_result.is_ok());
    CHECK(follower_result.value()->token.view() == "token-2");
    CHECK(cred->fetch_count() == 2);
}

TEST_CASE("TokenProvider: follower cancellation does not disturb the leader", "[auth][token][cancel]") {
    auto cred = std::make_shared<CountingCredential>(300ms);
    AuthTokenProvider provider(cred);

    CancellationToken follower_cancel;
    Result<TokenLease> leader_result = Result<TokenLease>::error(ErrorCode::INTERNAL, "unset");
    Result<TokenLease> follower_result = Result<TokenLease>::error(ErrorCode::INTERNAL, "unset");

    std::thread leader([&] { leader_result = provider.get_token(kScope); });
    std::this_thread::sleep_for(50ms);
    std::thread follower([&] { follower_result = provider.get_token(kScope, follower_cancel); });
    std::this_thread::sleep_for(50ms);
    follower_cancel.cancel();

    follower.join();
    leader.join();

    REQUIRE(follower_result.is_error());
    CHECK(follower_result.error_code() == ErrorCode::CANCELLED);
    REQUIRE(leader_result.is_ok());
    CHECK(cred->fetch_count() == 1);
}

TEST_CASE("TokenProvider: failed refresh is reported and not cached", "[auth][token]") {
    auto cred = std::make_shared<CountingCredential>(0ms, 60s);
    AuthTokenProvider provider(cred);

    REQUIRE(provider.get_token(kScope).is_ok());

    cred->fail_next(Error{.code = ErrorCode::AUTH, .message = "invalid_client"});
    auto failed = provider.get_token(kScope);
    REQUIRE(failed.is_error());
    CHECK(failed.error_code() == ErrorCode::AUTH);

    auto recovered = provider.get_token(kScope);
    REQUIRE(recovered.is_ok());
    CHECK(recovered.value()->token.view() == "token-3");
}

TEST_CASE("TokenProvider: credential exceptions become AUTH errors", "[auth][token]") {
    auto cred = std::make_shared<CountingCredential>();
    AuthTokenProvider provider(cred);

    cred->throw_next();
    auto result = provider.get_token(kScope);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::AUTH);

    CHECK(provider.get_token(kScope).is_ok());
}

TEST_CASE("TokenProvider: invalidate forces a refresh", "[auth][token]") {
    auto cred = std::make_shared<CountingCredential>();
    AuthTokenProvider provider(cred);

    auto first = provider.get_token(kScope);
    REQUIRE(first.is_ok());
    provider.invalidate(kScope);

    auto second = provider.get_token(kScope);
    REQUIRE(second.is_ok());
    CHECK(second.value()->token.view() == "token-2");
    // The old lease stays readable for its holder
    CHECK(first.value()->token.view() == "token-1");
}

TEST_CASE("TokenProvider: pre-cancelled call never reaches the credential", "[auth][token][cancel]") {
    auto cred = std::make_shared<CountingCredential>();
    AuthTokenProvider provider(cred);

    CancellationToken cancel;
    cancel.cancel();
    auto result = provider.get_token(kScope, cancel);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::CANCELLED);
    CHECK(cred->fetch_count() == 0);
}

TEST_CASE("TokenProvider: shutdown rejects later calls", "[auth][token]") {
    auto cred = std::make_shared<CountingCredential>();
    AuthTokenProvider provider(cred);

    REQUIRE(provider.get_token(kScope).is_ok());
    provider.shutdown();
    CHECK(provider.is_shut_down());

    auto result = provider.get_token(kScope);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::AUTH);
}

TEST_CASE("TokenProvider: async acquisition", "[auth][token]") {
    auto cred = std::make_shared<CountingCredential>(20ms);
    AuthTokenProvider provider(cred);

    auto a = provider.get_token_async(kScope);
    auto b = provider.get_token_async(kScope);
    auto ra = a.get();
    auto rb = b.get();
    REQUIRE(ra.is_ok());
    REQUIRE(rb.is_ok());
    CHECK(ra.value()->token.view() == rb.value()->token.view());
    CHECK(cred->fetch_count() == 1);
}
