#pragma once

#include "auth/token_provider.hpp"
#include "core/cancellation.hpp"
#include "core/error.hpp"
#include "executor/retry_policy.hpp"
#include "transport/http_transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace kvault {

/**
 * @brief Turns one logical backend call into authenticated HTTP attempts
 *
 * Outcome classes:
 * - 2xx:                          success
 * - 400/401/403/404/409:          returned at once as VALIDATION/AUTH/FORBIDDEN/NOT_FOUND/CONFLICT
 * - 408/429/500/502/503/504:      TRANSIENT, retried with backoff
 * - transport failure:            TRANSIENT, retried with backoff
 * - any other status:             INTERNAL
 *
 * Retries stop at max_attempts or max_elapsed and surface RETRY_EXHAUSTED
 * with the last cause. Cancellation is checked before every attempt and
 * wakes any backoff sleep.
 *
 * Non-idempotent requests (new secret version) are retried freely on
 * throttling statuses and CONNECT/TLS failures, where the server provably did
 * nothing. After an ambiguous TIMEOUT/READ/WRITE failure only one more
 * attempt is made, and a duplicate version may result.
 */
class OperationExecutor {
public:
    struct Stats {
        uint64_t attempts = 0;
        uint64_t retries = 0;
        uint64_t exhausted = 0;
        uint64_t cancelled = 0;
        uint64_t auth_retries = 0;
    };

    OperationExecutor(std::shared_ptr<IHttpTransport> transport,
                      std::shared_ptr<AuthTokenProvider> tokens,
                      RetryPolicy policy = RetryPolicy{});

    /**
     * @brief Execute with a caller-held token. A 401 is surfaced as AUTH.
     */
    [[nodiscard]] Result<HttpResponse> execute(const HttpRequest& request,
                                               const AccessToken& token,
                                               const CancellationToken& cancel);

    /**
     * @brief Execute with a token leased per attempt from the provider.
     * A 401 invalidates the scope and retries once with a fresh token.
     */
    [[nodiscard]] Result<HttpResponse> execute_authenticated(const HttpRequest& request,
                                                             const std::string& scope,
                                                             const CancellationToken& cancel);

    [[nodiscard]] static ErrorCode map_status(int status);
    [[nodiscard]] static bool is_transient_status(int status);
    [[nodiscard]] static bool is_ambiguous_failure(TransportFailure failure);
    [[nodiscard]] static bool is_ambiguous_status(int status);

    /// Retry-After in delta-seconds form; HTTP-date values are ignored.
    [[nodiscard]] static std::optional<std::chrono::milliseconds>
    parse_retry_after(const HttpResponse& response);

    /// Pull {"error":{"code","message"}} out of a backend error body.
    [[nodiscard]] static std::string describe_error_body(const std::string& body);

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] const RetryPolicy& policy() const { return policy_; }

private:
    using TokenSource = std::function<Result<TokenLease>()>;

    [[nodiscard]] Result<HttpResponse> run(const HttpRequest& request,
                                           const TokenSource& next_token,
                                           const std::string* scope,
                                           const CancellationToken& cancel);

    [[nodiscard]] std::chrono::milliseconds next_delay(uint32_t failed_attempt);

    std::shared_ptr<IHttpTransport> transport_;
    std::shared_ptr<AuthTokenProvider> tokens_;
    RetryPolicy policy_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> exhausted_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint64_t> auth_retries_{0};
};

} // namespace kvault
