#pragma once

#include "auth/token_credential.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace kvault {

/**
 * @brief Per-scope bearer token cache with single-flight refresh
 *
 * A cached token with more than `refresh_margin` left is returned without a
 * network call. Otherwise exactly one caller (the leader) fetches while every
 * concurrent caller for the same scope waits on the same shared result.
 *
 * Cancellation:
 *   - a waiting follower whose own token fires returns CANCELLED at once
 *   - if the leader is cancelled, followers that are still live retry and
 *     one of them becomes the new leader
 *
 * A failed refresh drops the stale cached token for that scope.
 */
class AuthTokenProvider {
public:
    struct Config {
        std::chrono::seconds refresh_margin{300};
        std::chrono::milliseconds follower_poll{20};
    };

    explicit AuthTokenProvider(std::shared_ptr<ITokenCredential> credential);
    AuthTokenProvider(std::shared_ptr<ITokenCredential> credential, Config config);
    ~AuthTokenProvider();

    AuthTokenProvider(const AuthTokenProvider&) = delete;
    AuthTokenProvider& operator=(const AuthTokenProvider&) = delete;

    [[nodiscard]] Result<TokenLease> get_token(const std::string& scope,
                                               const CancellationToken& cancel = CancellationToken::none());

    [[nodiscard]] std::future<Result<TokenLease>> get_token_async(std::string scope,
                                                                  CancellationToken cancel = CancellationToken::none());

    /// Drop the cached token for a scope (after the backend answered 401).
    void invalidate(const std::string& scope);

    /// Drop every cached token. Later get_token() calls fail with AUTH.
    void shutdown();

    [[nodiscard]] bool is_shut_down() const;

    [[nodiscard]] uint64_t refresh_count() const {
        return refresh_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t cache_hits() const {
        return cache_hits_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const Config& config() const { return config_; }

private:
    using Flight = std::shared_future<Result<TokenLease>>;

    struct Entry {
        TokenLease token;
        Flight inflight;            // valid() while a refresh is running
    };

    [[nodiscard]] bool is_fresh(const AccessToken& token) const;
    [[nodiscard]] Result<TokenLease> refresh(const std::string& scope, const CancellationToken& cancel);

    std::shared_ptr<ITokenCredential> credential_;
    Config config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> cache_;
    bool shut_down_ = false;

    std::atomic<uint64_t> refresh_count_{0};
    std::atomic<uint64_t> cache_hits_{0};
};

} // namespace kvault
