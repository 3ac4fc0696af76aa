#pragma once

#include "objxfer/net/http.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace objxfer {

class CancellationToken;

/// How aggressively requests without an idempotency guarantee are retried.
enum class IdempotencyStrategy {
    RetryAlways,       // treat every request as idempotent
    RetryConditional,  // retry only requests that carry a precondition or session URI
    RetryNever         // never retry
};

/// Result of a single request attempt as seen by the retry policy.
struct TransferOutcome {
    int status_code = 0;             // 0 when no response was received
    bool is_network_error = false;
    bool malformed_response = false;  // response arrived but could not be parsed
    bool cancelled = false;
    std::string reason;   // service error reason, e.g. "rateLimitExceeded"
    std::string message;  // last server-provided (or transport) message

    /// Classify an HTTP response. Pulls `reason`/`message` out of a JSON
    /// error body when one is present.
    static TransferOutcome from_response(const net::HttpResponse& response);
};

/// Idempotency context of the request that produced an outcome.
struct RequestContext {
    net::HttpMethod method = net::HttpMethod::GET;
    bool has_precondition = false;  // ifGenerationMatch, ifMetagenerationMatch or ETag
    bool has_session_uri = false;   // next byte range is query-able on the session
    bool creates_no_object = false; // e.g. resumable session initiation

    bool is_idempotent() const;
};

/// Injectable retry classifier.
class RetryStrategy {
public:
    virtual ~RetryStrategy() = default;

    virtual bool should_retry(const TransferOutcome& outcome,
                              const RequestContext& context) const = 0;
};

/// Default rules:
///  - cancellation is never retried
///  - 429 and rate-limit reasons are always retried (the request was not applied)
///  - network errors, 408, 5xx, backend reasons and malformed responses are
///    retried only when the request is idempotent
///  - every other status (401, 403, 404, ...) is final
class DefaultRetryStrategy : public RetryStrategy {
public:
    explicit DefaultRetryStrategy(
        IdempotencyStrategy idempotency = IdempotencyStrategy::RetryConditional)
        : idempotency_(idempotency) {}

    bool should_retry(const TransferOutcome& outcome,
                      const RequestContext& context) const override;

private:
    IdempotencyStrategy idempotency_;
};

struct RetryOptions {
    bool auto_retry = true;
    int max_retries = 5;
    double retry_delay_multiplier = 2.0;
    std::chrono::milliseconds max_retry_delay{64000};
    std::chrono::milliseconds total_timeout{600000};
    IdempotencyStrategy idempotency = IdempotencyStrategy::RetryConditional;

    // Null selects DefaultRetryStrategy(idempotency)
    std::shared_ptr<RetryStrategy> strategy;

    // Replaces the backoff sleep (tests)
    std::function<void(std::chrono::milliseconds)> sleep;
};

/// Per logical operation. Not reset between chunks of the same transfer.
struct RetryState {
    int attempt = 0;
    std::chrono::steady_clock::time_point first_attempt_time;
    double delay_multiplier = 2.0;
    std::chrono::milliseconds max_delay{0};
    std::chrono::milliseconds total_timeout_budget{0};
};

/// Classification plus exponential backoff with jitter.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions options = {});

    const RetryOptions& options() const { return options_; }

    /// Fresh state for a new logical operation.
    RetryState begin() const;

    bool should_retry(const TransferOutcome& outcome, const RequestContext& context) const;

    /// multiplier^attempt * 1000ms plus up to 1000ms of jitter, clamped to
    /// max_retry_delay.
    std::chrono::milliseconds backoff_delay(int attempt) const;

    /// Record a failed attempt and return the delay before the next one.
    /// Throws RetryLimitExceeded once the attempt cap or the time budget is
    /// used up; the message embeds the attempt count and `outcome.message`.
    std::chrono::milliseconds next_delay(RetryState& state, const TransferOutcome& outcome) const;

    /// Sleep out a backoff delay. Returns false if cancelled while waiting.
    bool wait(std::chrono::milliseconds delay, CancellationToken* token) const;

private:
    RetryOptions options_;
    std::shared_ptr<RetryStrategy> strategy_;
};

}  // namespace objxfer
