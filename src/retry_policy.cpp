#include "objxfer/retry_policy.hpp"
#include "objxfer/cancellation.hpp"
#include "objxfer/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace objxfer {

namespace {

bool is_rate_limit_reason(const std::string& reason) {
    return reason == "rateLimitExceeded" || reason == "userRateLimitExceeded";
}

bool is_backend_reason(const std::string& reason) {
    return reason == "backendError" || reason == "internalError";
}

int64_t random_jitter_ms() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int64_t> dist(0, 999);
    return dist(rng);
}

}  // namespace

// ============================================================================
// TransferOutcome / RequestContext
// ============================================================================

TransferOutcome TransferOutcome::from_response(const net::HttpResponse& response) {
    TransferOutcome outcome;
    outcome.status_code = response.status_code;
    outcome.is_network_error = response.is_network_error;
    outcome.cancelled = response.cancelled;

    if (!response.error.empty()) {
        outcome.message = response.error;
        return outcome;
    }

    std::string body = response.body_string();
    outcome.message = body.empty() ? "HTTP " + std::to_string(response.status_code) : body;

    // {"error": {"code": 429, "message": "...", "errors": [{"reason": "..."}]}}
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error") &&
        parsed["error"].is_object()) {
        const auto& err = parsed["error"];
        if (err.contains("message") && err["message"].is_string()) {
            outcome.message = err["message"].get<std::string>();
        }
        if (err.contains("errors") && err["errors"].is_array() && !err["errors"].empty()) {
            const auto& first = err["errors"][0];
            if (first.is_object() && first.contains("reason") && first["reason"].is_string()) {
                outcome.reason = first["reason"].get<std::string>();
            }
        }
    }
    return outcome;
}

bool RequestContext::is_idempotent() const {
    switch (method) {
        case net::HttpMethod::GET:
        case net::HttpMethod::HEAD:
        case net::HttpMethod::OPTIONS:
            return true;
        default:
            return has_precondition || has_session_uri || creates_no_object;
    }
}

// ============================================================================
// DefaultRetryStrategy
// ============================================================================

bool DefaultRetryStrategy::should_retry(const TransferOutcome& outcome,
                                        const RequestContext& context) const {
    if (outcome.cancelled) return false;
    if (idempotency_ == IdempotencyStrategy::RetryNever) return false;

    // Rejected before being applied, safe regardless of idempotency
    if (outcome.status_code == 429 || is_rate_limit_reason(outcome.reason)) {
        return true;
    }

    bool ambiguous = outcome.is_network_error ||
                     outcome.malformed_response ||
                     outcome.status_code == 408 ||
                     net::is_server_error_status(outcome.status_code) ||
                     is_backend_reason(outcome.reason);
    if (!ambiguous) return false;

    return idempotency_ == IdempotencyStrategy::RetryAlways || context.is_idempotent();
}

// ============================================================================
// RetryPolicy
// ============================================================================

RetryPolicy::RetryPolicy(RetryOptions options)
    : options_(std::move(options))
    , strategy_(options_.strategy
                    ? options_.strategy
                    : std::make_shared<DefaultRetryStrategy>(options_.idempotency)) {}

RetryState RetryPolicy::begin() const {
    RetryState state;
    state.first_attempt_time = std::chrono::steady_clock::now();
    state.delay_multiplier = options_.retry_delay_multiplier;
    state.max_delay = options_.max_retry_delay;
    state.total_timeout_budget = options_.total_timeout;
    return state;
}

bool RetryPolicy::should_retry(const TransferOutcome& outcome,
                               const RequestContext& context) const {
    if (!options_.auto_retry) return false;
    return strategy_->should_retry(outcome, context);
}

std::chrono::milliseconds RetryPolicy::backoff_delay(int attempt) const {
    double base = std::pow(options_.retry_delay_multiplier, attempt) * 1000.0;
    double max_ms = static_cast<double>(options_.max_retry_delay.count());
    double delay = std::min(base + static_cast<double>(random_jitter_ms()), max_ms);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

std::chrono::milliseconds RetryPolicy::next_delay(RetryState& state,
                                                  const TransferOutcome& outcome) const {
    int attempts = state.attempt + 1;

    if (state.attempt >= options_.max_retries) {
        throw RetryLimitExceeded(
            "Retry limit exceeded after " + std::to_string(attempts) + " attempts - " +
                outcome.message,
            outcome.status_code, attempts, outcome.message);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - state.first_attempt_time);
    auto remaining = state.total_timeout_budget - elapsed;

    auto delay = std::min(backoff_delay(state.attempt), remaining);
    if (delay.count() <= 0) {
        throw RetryLimitExceeded(
            "Retry total time limit exceeded after " + std::to_string(attempts) +
                " attempts - " + outcome.message,
            outcome.status_code, attempts, outcome.message);
    }

    state.attempt++;
    return delay;
}

bool RetryPolicy::wait(std::chrono::milliseconds delay, CancellationToken* token) const {
    if (options_.sleep) {
        options_.sleep(delay);
        return !(token && token->cancelled());
    }
    if (token) {
        return token->wait_for(delay);
    }
    std::this_thread::sleep_for(delay);
    return true;
}

}  // namespace objxfer
