#include "executor/operation_executor.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

#include <algorithm>
#include <format>

namespace kvault {

using json = nlohmann::json;

namespace {

uint64_t random_seed() {
    uint64_t seed = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&seed), sizeof(seed)) != 1) {
        seed = static_cast<uint64_t>(
            std::chrono::steady_clock::now().time_since_epoch().count());
    }
    return seed;
}

} // anonymous namespace

OperationExecutor::OperationExecutor(std::shared_ptr<IHttpTransport> transport,
                                     std::shared_ptr<AuthTokenProvider> tokens,
                                     RetryPolicy policy)
    : transport_(std::move(transport)),
      tokens_(std::move(tokens)),
      policy_(policy),
      rng_(random_seed()) {
    if (policy_.max_attempts == 0) {
        policy_.max_attempts = 1;
    }
}

// ============================================================================
// Classification
// ============================================================================

ErrorCode OperationExecutor::map_status(int status) {
    if (status >= 200 && status < 300) return ErrorCode::NONE;
    switch (status) {
        case 400: return ErrorCode::VALIDATION;
        case 401: return ErrorCode::AUTH;
        case 403: return ErrorCode::FORBIDDEN;
        case 404: return ErrorCode::NOT_FOUND;
        case 409: return ErrorCode::CONFLICT;
        default:
            return is_transient_status(status) ? ErrorCode::TRANSIENT : ErrorCode::INTERNAL;
    }
}

bool OperationExecutor::is_transient_status(int status) {
    return status == 408 || status == 429 || status == 500 ||
           status == 502 || status == 503 || status == 504;
}

bool OperationExecutor::is_ambiguous_failure(TransportFailure failure) {
    switch (failure) {
        case TransportFailure::CONNECT:
        case TransportFailure::TLS:
            return false;
        default:
            return true;
    }
}

bool OperationExecutor::is_ambiguous_status(int status) {
    // 408, 429 and 503 are refusals; the gateway errors may follow a commit
    return status == 500 || status == 502 || status == 504;
}

std::optional<std::chrono::milliseconds>
OperationExecutor::parse_retry_after(const HttpResponse& response) {
    const auto it = response.headers.find(http::kRetryAfterHeader);
    if (it == response.headers.end()) return std::nullopt;

    const auto seconds = utils::try_parse_int<int64_t>(utils::trim(it->second));
    if (!seconds || *seconds < 0) return std::nullopt;
    return std::chrono::milliseconds(*seconds * 1000);
}

std::string OperationExecutor::describe_error_body(const std::string& body) {
    if (body.empty()) return {};
    try {
        const auto parsed = json::parse(body);
        if (parsed.is_object() && parsed.contains("error") && parsed["error"].is_object()) {
            const auto& err = parsed["error"];
            std::string code = err.value("code", "");
            std::string message = err.value("message", "");
            if (!code.empty() && !message.empty()) return code + ": " + message;
            return !message.empty() ? message : code;
        }
    } catch (const json::exception&) {
        // Not a JSON error envelope
    }
    return body.substr(0, 200);
}

// ============================================================================
// Execution
// ============================================================================

std::chrono::milliseconds OperationExecutor::next_delay(uint32_t failed_attempt) {
    std::lock_guard lock(rng_mutex_);
    return policy_.compute_backoff(failed_attempt, rng_);
}

Result<HttpResponse> OperationExecutor::execute(const HttpRequest& request,
                                                const AccessToken& token,
                                                const CancellationToken& cancel) {
    // Non-owning lease: the caller keeps `token` alive for the whole call
    const TokenLease borrowed(std::shared_ptr<const AccessToken>{}, &token);
    return run(request, [&borrowed] { return Result<TokenLease>::ok(borrowed); }, nullptr, cancel);
}

Result<HttpResponse> OperationExecutor::execute_authenticated(const HttpRequest& request,
                                                              const std::string& scope,
                                                              const CancellationToken& cancel) {
    if (!tokens_) {
        return Result<HttpResponse>::error(ErrorCode::INTERNAL, "Executor has no token provider");
    }
    return run(request, [&] { return tokens_->get_token(scope, cancel); }, &scope, cancel);
}

Result<HttpResponse> OperationExecutor::run(const HttpRequest& request,
                                            const TokenSource& next_token,
                                            const std::string* scope,
                                            const CancellationToken& cancel) {
    const auto start = std::chrono::steady_clock::now();
    const char* method = http_method_to_string(request.method);

    uint32_t attempt = 0;
    bool auth_retry_used = false;
    bool ambiguous_retry_used = false;
    std::string last_cause;
    int last_status = 0;

    const auto cancelled = [&] {
        cancelled_.fetch_add(1, std::memory_order_relaxed);
        return Result<HttpResponse>::error(Error{
            .code = ErrorCode::CANCELLED,
            .message = std::format("{} {} cancelled", method, request.url),
            .http_status = last_status,
            .attempts = attempt,
        });
    };

    const auto exhausted = [&](std::string why) {
        exhausted_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("{} {} gave up after {} attempt(s): {}",
                                      method, request.url, attempt, why));
        return Result<HttpResponse>::error(Error{
            .code = ErrorCode::RETRY_EXHAUSTED,
            .message = std::move(why),
            .http_status = last_status,
            .attempts = attempt,
            .cause = last_cause,
        });
    };

    while (true) {
        if (cancel.is_cancelled()) {
            return cancelled();
        }

        TransportResult sent;
        {
            // The lease lives only for this attempt
            auto lease = next_token();
            if (lease.is_error()) {
                if (lease.error_code() == ErrorCode::CANCELLED) return cancelled();
                return Result<HttpResponse>::error(lease.error());
            }

            ++attempt;
            attempts_.fetch_add(1, std::memory_order_relaxed);

            HttpRequest attempt_req = request;
            std::string& auth_header = attempt_req.headers[http::kAuthorizationHeader];
            auth_header.reserve(http::kBearerPrefix.size() + lease.value()->token.size());
            auth_header.append(http::kBearerPrefix);
            auth_header.append(lease.value()->token.view());

            sent = transport_->send(attempt_req);

            utils::secure_wipe(auth_header);
            utils::secure_wipe(attempt_req.body);
        }

        std::optional<std::chrono::milliseconds> retry_after;
        bool ambiguous = false;

        if (sent.ok) {
            const int status = sent.response.status;
            last_status = status;

            if (status >= 200 && status < 300) {
                if (attempt > 1) {
                    utils::log::info(std::format("{} {} succeeded on attempt {}",
                                                 method, request.url, attempt));
                }
                return Result<HttpResponse>::ok(std::move(sent.response));
            }

            if (status == 401 && scope && !auth_retry_used) {
                auth_retry_used = true;
                auth_retries_.fetch_add(1, std::memory_order_relaxed);
                utils::log::warn(std::format("{} {} returned 401, refreshing token for '{}'",
                                             method, request.url, *scope));
                tokens_->invalidate(*scope);
                continue;
            }

            const ErrorCode code = map_status(status);
            if (code != ErrorCode::TRANSIENT) {
                return Result<HttpResponse>::error(Error{
                    .code = code,
                    .message = std::format("{} {} failed with HTTP {}: {}", method, request.url,
                                           status, describe_error_body(sent.response.body)),
                    .http_status = status,
                    .attempts = attempt,
                });
            }

            last_cause = std::format("HTTP {}", status);
            retry_after = parse_retry_after(sent.response);
            ambiguous = is_ambiguous_status(status);
        } else {
            last_cause = std::format("{} failure: {}",
                                     transport_failure_to_string(sent.failure), sent.error);
            ambiguous = is_ambiguous_failure(sent.failure);
        }

        // A write that may have been applied gets one retry at most
        if (!request.idempotent && ambiguous) {
            if (ambiguous_retry_used) {
                return exhausted(std::format(
                    "Non-idempotent request failed ambiguously twice ({})", last_cause));
            }
            ambiguous_retry_used = true;
            utils::log::warn(std::format(
                "{} {} may have reached the server ({}); retrying once, "
                "a duplicate version may be created", method, request.url, last_cause));
        }

        if (attempt >= policy_.max_attempts) {
            return exhausted(std::format("Retry budget of {} attempt(s) spent", policy_.max_attempts));
        }

        auto delay = retry_after ? std::min(*retry_after, policy_.max_backoff) : next_delay(attempt);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (elapsed + delay > policy_.max_elapsed) {
            return exhausted(std::format("Retry window of {}ms would be exceeded",
                                         policy_.max_elapsed.count()));
        }

        retries_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("{} {} attempt {}/{} failed ({}), retrying in {}ms",
                                     method, request.url, attempt, policy_.max_attempts,
                                     last_cause, delay.count()));

        if (cancel.wait_for(delay)) {
            return cancelled();
        }
    }
}

OperationExecutor::Stats OperationExecutor::stats() const {
    return Stats{
        .attempts = attempts_.load(std::memory_order_relaxed),
        .retries = retries_.load(std::memory_order_relaxed),
        .exhausted = exhausted_.load(std::memory_order_relaxed),
        .cancelled = cancelled_.load(std::memory_order_relaxed),
        .auth_retries = auth_retries_.load(std::memory_order_relaxed),
    };
}

} // namespace kvault
