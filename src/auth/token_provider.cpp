#include "auth/token_provider.hpp"
#include "core/utils.hpp"

#include <format>

namespace kvault {

AuthTokenProvider::AuthTokenProvider(std::shared_ptr<ITokenCredential> credential)
    : AuthTokenProvider(std::move(credential), Config{}) {}

AuthTokenProvider::AuthTokenProvider(std::shared_ptr<ITokenCredential> credential, Config config)
    : credential_(std::move(credential)), config_(config) {}

AuthTokenProvider::~AuthTokenProvider() {
    shutdown();
}

bool AuthTokenProvider::is_fresh(const AccessToken& token) const {
    return token.expires_on - config_.refresh_margin > std::chrono::system_clock::now();
}

Result<TokenLease> AuthTokenProvider::refresh(const std::string& scope,
                                              const CancellationToken& cancel) {
    refresh_count_.fetch_add(1, std::memory_order_relaxed);
    utils::log::debug(std::format("Refreshing token for scope '{}' via {}",
                                  scope, credential_->name()));

    try {
        auto fetched = credential_->fetch_token(scope, cancel);
        if (fetched.is_error()) {
            return Result<TokenLease>::error(fetched.error());
        }
        return Result<TokenLease>::ok(
            std::make_shared<const AccessToken>(std::move(fetched.value())));
    } catch (const std::exception& e) {
        // Followers are blocked on this flight: it must always complete
        return Result<TokenLease>::error(ErrorCode::AUTH,
            std::format("Token refresh threw: {}", e.what()));
    }
}

Result<TokenLease> AuthTokenProvider::get_token(const std::string& scope,
                                                const CancellationToken& cancel) {
    while (true) {
        if (cancel.is_cancelled()) {
            return Result<TokenLease>::error(ErrorCode::CANCELLED, "Token acquisition cancelled");
        }

        Flight flight;
        std::promise<Result<TokenLease>> promise;
        bool leader = false;
        {
            std::lock_guard lock(mutex_);
            if (shut_down_) {
                return Result<TokenLease>::error(ErrorCode::AUTH, "Token provider has been shut down");
            }

            auto& entry = cache_[scope];
            if (entry.token && is_fresh(*entry.token)) {
                cache_hits_.fetch_add(1, std::memory_order_relaxed);
                return Result<TokenLease>::ok(entry.token);
            }

            if (!entry.inflight.valid()) {
                entry.inflight = promise.get_future().share();
                leader = true;
            }
            flight = entry.inflight;
        }

        if (leader) {
            auto result = refresh(scope, cancel);
            {
                std::lock_guard lock(mutex_);
                if (!shut_down_) {
                    auto& entry = cache_[scope];
                    if (result.is_ok()) {
                        entry.token = result.value();
                    } else if (result.error_code() != ErrorCode::CANCELLED) {
                        entry.token.reset();
                    }
                    entry.inflight = Flight{};
                }
            }

            if (result.is_error() && result.error_code() != ErrorCode::CANCELLED) {
                utils::log::error(std::format("Token refresh for scope '{}' failed: {}",
                                              scope, result.error().describe()));
            }
            promise.set_value(result);
            return result;
        }

        // Follower: wait on the leader, but honour our own cancellation
        while (flight.wait_for(config_.follower_poll) != std::future_status::ready) {
            if (cancel.is_cancelled()) {
                return Result<TokenLease>::error(ErrorCode::CANCELLED, "Token acquisition cancelled");
            }
        }

        auto result = flight.get();
        if (result.is_error() && result.error_code() == ErrorCode::CANCELLED) {
            // Leader gave up; take another turn, possibly as the new leader
            continue;
        }
        return result;
    }
}

std::future<Result<TokenLease>> AuthTokenProvider::get_token_async(std::string scope,
                                                                   CancellationToken cancel) {
    return std::async(std::launch::async, [this, scope = std::move(scope), cancel = std::move(cancel)] {
        return get_token(scope, cancel);
    });
}

void AuthTokenProvider::invalidate(const std::string& scope) {
    std::lock_guard lock(mutex_);
    const auto it = cache_.find(scope);
    if (it != cache_.end()) {
        // Outstanding leases keep their copy alive until the call finishes
        it->second.token.reset();
        utils::log::debug(std::format("Invalidated token for scope '{}'", scope));
    }
}

void AuthTokenProvider::shutdown() {
    std::lock_guard lock(mutex_);
    if (shut_down_) return;
    shut_down_ = true;
    cache_.clear();
}

bool AuthTokenProvider::is_shut_down() const {
    std::lock_guard lock(mutex_);
    return shut_down_;
}

} // namespace kvault
