// Test suite for objxfer.
//
// Tests:
//   1. CRC32C vectors, representations and combine
//   2. Retry classification, backoff bounds and budgets
//   3. Chunk pipeline buffering and checksums
//   4. Session stores (memory and SQLite)
//   5. Resumable upload sessions against a fake upload endpoint
//      - Single request and chunked uploads
//      - Partial acknowledgement, transient failures
//      - Stale persisted sessions, manual URI expiry, content mismatch
//      - Session expiry mid-upload, cancellation
//   6. Object client metadata, resumed downloads, media uploads
//   7. Parallel batches (run_many)
//   8. Multipart uploads (part bookkeeping, resume, abort, XML protocol)
//   9. Transfer manager bulk and chunked transfers
//  10. TransferConfig CLI parsing, JSON loading and validation
//  11. Metrics

#include "objxfer/cancellation.hpp"
#include "objxfer/chunk_pipeline.hpp"
#include "objxfer/config_store.hpp"
#include "objxfer/crc32c.hpp"
#include "objxfer/errors.hpp"
#include "objxfer/metrics.hpp"
#include "objxfer/net/http.hpp"
#include "objxfer/object_client.hpp"
#include "objxfer/resumable_upload.hpp"
#include "objxfer/retry_policy.hpp"
#include "objxfer/transfer_config.hpp"
#include "objxfer/transfer_manager.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace objxfer;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Wait for a condition with timeout (milliseconds). Returns true if met.
static bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return cond();
}

static std::string crc_of(const std::string& data) {
    Crc32c crc;
    crc.update(std::string_view(data));
    return crc.to_string();
}

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

/// Deterministic, non-repeating-per-chunk test payload.
static std::string make_payload(size_t size) {
    std::string data(size, '\0');
    uint32_t x = 2463534242u;
    for (size_t i = 0; i < size; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        data[i] = static_cast<char>(x & 0xff);
    }
    return data;
}

/// Retry options that never actually sleep.
static RetryOptions fast_retry(int max_retries = 3) {
    RetryOptions options;
    options.max_retries = max_retries;
    options.sleep = [](std::chrono::milliseconds) {};
    return options;
}

static net::HttpResponse make_response(int status, const std::string& body = "") {
    net::HttpResponse response;
    response.status_code = status;
    response.body.assign(body.begin(), body.end());
    return response;
}

/// Deliver a successful body through the request's sink, as the curl
/// transport does for streaming requests.
static net::HttpResponse stream_response(const net::HttpRequest& request, int status,
                                         const std::string& body) {
    net::HttpResponse response;
    response.status_code = status;
    if (request.body_sink && net::is_success_status(status)) {
        if (!body.empty()) {
            request.body_sink(reinterpret_cast<const uint8_t*>(body.data()), body.size());
        }
    } else {
        response.body.assign(body.begin(), body.end());
    }
    return response;
}

// ---------------------------------------------------------------------------
// Fake transport
// ---------------------------------------------------------------------------

/// Records every request and answers through a handler. Thread-safe as
/// long as the handler is.
class FakeTransport : public net::HttpTransport {
public:
    using Handler = std::function<net::HttpResponse(const net::HttpRequest&)>;

    explicit FakeTransport(Handler handler) : handler_(std::move(handler)) {}

    net::HttpResponse execute(const net::HttpRequest& request) override {
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);
        }
        return handler_(request);
    }

    std::vector<net::HttpRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    size_t count(net::HttpMethod method, const std::string& url_part = "") const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& r : requests_) {
            if (r.method == method && r.url.find(url_part) != std::string::npos) ++n;
        }
        return n;
    }

private:
    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<net::HttpRequest> requests_;
};

/// Resumable upload endpoint for a single object. Sessions are numbered
/// from 1; a new session drops whatever the previous one held.
struct FakeUploadServer {
    std::mutex mutex;
    std::string stored;
    int sessions_created = 0;
    std::set<std::string> expired;  // session URIs answering 404
    size_t short_ack_once = 0;      // keep only this many bytes of the next chunk
    int fail_next_chunk = 0;        // status returned once for the next chunk
    std::string crc_override;
    size_t expire_after = 0;        // expire the session once it holds this many bytes

    net::HttpResponse handle(const net::HttpRequest& request) {
        std::lock_guard lock(mutex);

        if (request.method == net::HttpMethod::POST &&
            request.url.find("uploadType=resumable") != std::string::npos) {
            ++sessions_created;
            stored.clear();
            auto response = make_response(200);
            response.headers.set("Location",
                                 "https://fake.test/session/" + std::to_string(sessions_created));
            return response;
        }
        if (request.method != net::HttpMethod::PUT) {
            return make_response(400, "unexpected request");
        }
        if (expired.count(request.url)) {
            return make_response(404, "Not Found");
        }

        std::string range = request.headers.get("Content-Range").value_or("");
        if (range == "bytes */*") {
            return incomplete();
        }

        if (fail_next_chunk) {
            int status = fail_next_chunk;
            fail_next_chunk = 0;
            return make_response(status);
        }

        // "bytes S-E/T" or "bytes */T"
        std::string range_value = range.substr(6);
        std::string total = range_value.substr(range_value.find('/') + 1);
        if (range_value[0] != '*') {
            uint64_t start = std::stoull(range_value.substr(0, range_value.find('-')));
            if (start != stored.size()) {
                return make_response(400, "non-contiguous write");
            }
            size_t keep = request.body.size();
            if (short_ack_once) {
                keep = std::min(keep, short_ack_once);
                short_ack_once = 0;
            }
            stored.append(reinterpret_cast<const char*>(request.body.data()), keep);
            if (expire_after && stored.size() >= expire_after) {
                expired.insert(request.url);
                expire_after = 0;
            }
        }

        if (total != "*" && stored.size() == std::stoull(total)) {
            nlohmann::json metadata = {
                {"bucket", "bkt"},
                {"name", "obj"},
                {"size", std::to_string(stored.size())},
                {"crc32c", crc_override.empty() ? crc_of(stored) : crc_override},
            };
            return make_response(200, metadata.dump());
        }
        return incomplete();
    }

    net::HttpResponse incomplete() const {
        auto response = make_response(308);
        if (!stored.empty()) {
            response.headers.set("Range", "bytes=0-" + std::to_string(stored.size() - 1));
        }
        return response;
    }
};

static std::shared_ptr<FakeTransport> transport_for(const std::shared_ptr<FakeUploadServer>& server) {
    return std::make_shared<FakeTransport>(
        [server](const net::HttpRequest& request) { return server->handle(request); });
}

static ResumableUploadConfig upload_config() {
    ResumableUploadConfig config;
    config.api_endpoint = "https://fake.test";
    config.bucket = "bkt";
    config.object = "obj";
    config.retry = fast_retry();
    return config;
}

// ---------------------------------------------------------------------------
// 1. CRC32C
// ---------------------------------------------------------------------------

static void test_crc32c() {
    std::cout << "\n=== CRC32C ===" << std::endl;

    {
        TEST(known_vectors);
        ASSERT_EQ(crc_of(""), "AAAAAA==", "empty input");
        ASSERT_EQ(crc_of("data"), "rth90Q==", "data");
        ASSERT_EQ(crc_of("some text\n"), "DkjKuA==", "some text");
        ASSERT_EQ(crc_of(std::string(65536, 'a')), "TpXtPw==", "64KiB of 'a'");

        Crc32c check;
        check.update(std::string_view("123456789"));
        ASSERT_TRUE(static_cast<uint32_t>(check.value()) == 0xE3069283u, "check value");
        ASSERT_TRUE(check.value() < 0, "signed interpretation is negative");
        PASS();
    }
    {
        TEST(incremental_matches_one_shot);
        auto payload = make_payload(100000);
        Crc32c incremental;
        for (size_t pos = 0; pos < payload.size(); pos += 777) {
            incremental.update(std::string_view(payload).substr(pos, 777));
        }
        ASSERT_EQ(incremental.to_string(), crc_of(payload), "incremental crc");
        PASS();
    }
    {
        TEST(order_sensitive);
        Crc32c ab;
        ab.update(std::string_view("first"));
        ab.update(std::string_view("second"));
        Crc32c ba;
        ba.update(std::string_view("second"));
        ba.update(std::string_view("first"));
        ASSERT_TRUE(ab.value() != ba.value(), "reordered input should differ");
        PASS();
    }
    {
        TEST(validate_across_representations);
        Crc32c crc;
        crc.update(std::string_view("data"));
        ASSERT_TRUE(crc.validate(std::string_view("rth90Q==")), "base64");
        ASSERT_TRUE(crc.validate(crc.value()), "int32");
        auto buffer = crc.to_buffer();
        ASSERT_TRUE(crc.validate(std::span<const uint8_t>(buffer)), "buffer");
        Crc32c other;
        other.update(std::string_view("data"));
        ASSERT_TRUE(crc.validate(static_cast<const Crc32cValidator&>(other)), "validator");
        ASSERT_TRUE(!crc.validate(std::string_view("AAAAAA==")), "mismatch");
        PASS();
    }
    {
        TEST(from_seeds_independent_copy);
        auto seeded = Crc32c::from(std::string_view("rth90Q=="));
        ASSERT_EQ(seeded.to_string(), "rth90Q==", "seeded from base64");
        auto from_int = Crc32c::from(static_cast<int64_t>(0xE3069283LL));
        ASSERT_EQ(from_int.to_string(), crc_of("123456789"), "seeded from unsigned value");

        Crc32c original;
        original.update(std::string_view("abc"));
        auto copy = Crc32c::from(static_cast<const Crc32cValidator&>(original));
        copy.update(std::string_view("def"));
        ASSERT_EQ(original.to_string(), crc_of("abc"), "original untouched");
        ASSERT_EQ(copy.to_string(), crc_of("abcdef"), "copy continued");
        PASS();
    }
    {
        TEST(from_rejects_wrong_length);
        std::vector<uint8_t> three = {1, 2, 3};
        std::string msg;
        try {
            Crc32c::from(std::span<const uint8_t>(three));
        } catch (const std::range_error& e) {
            msg = e.what();
        }
        ASSERT_TRUE(msg.find("received 3") != std::string::npos, "should report 3 bytes: " + msg);

        std::vector<int32_t> two = {1, 2};
        msg.clear();
        try {
            Crc32c::from(std::span<const int32_t>(two));
        } catch (const std::range_error& e) {
            msg = e.what();
        }
        ASSERT_TRUE(msg.find("received 8") != std::string::npos, "should report 8 bytes: " + msg);

        bool threw = false;
        try {
            Crc32c::from(static_cast<int64_t>(1) << 40);
        } catch (const std::range_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "40-bit integer should be rejected");
        PASS();
    }
    {
        TEST(combine_adjacent_ranges);
        auto payload = make_payload(5000);
        Crc32c head;
        head.update(std::string_view(payload).substr(0, 1234));
        Crc32c tail;
        tail.update(std::string_view(payload).substr(1234));
        auto combined = Crc32c::combine(head, tail, payload.size() - 1234);
        ASSERT_EQ(combined.to_string(), crc_of(payload), "combined crc");

        auto with_empty = Crc32c::combine(Crc32c(), head, 1234);
        ASSERT_EQ(with_empty.to_string(), head.to_string(), "empty first range");
        PASS();
    }
    {
        TEST(from_file);
        auto tmpdir = make_temp_dir("objxfer-crc");
        write_file(tmpdir / "a.bin", std::string(65536, 'a'));
        ASSERT_EQ(Crc32c::from_file(tmpdir / "a.bin").to_string(), "TpXtPw==", "file crc");
        fs::remove_all(tmpdir);
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Retry policy
// ---------------------------------------------------------------------------

class AlwaysRetryStrategy : public RetryStrategy {
public:
    bool should_retry(const TransferOutcome&, const RequestContext&) const override {
        return true;
    }
};

static void test_retry_policy() {
    std::cout << "\n=== Retry policy ===" << std::endl;

    {
        TEST(error_kind_names);
        ASSERT_EQ(std::string(error_kind_to_string(ErrorKind::SessionExpired)), "session-expired",
                  "session expired");
        ASSERT_EQ(std::string(error_kind_to_string(ErrorKind::FatalCaller)), "fatal", "fatal");
        ASSERT_EQ(std::string(error_kind_to_string(ErrorKind::Cancelled)), "cancelled", "cancelled");
        PASS();
    }
    {
        TEST(backoff_bounds);
        RetryOptions options;
        options.max_retry_delay = std::chrono::milliseconds(1000000);
        RetryPolicy policy(options);
        for (int attempt = 0; attempt < 5; ++attempt) {
            int64_t base = static_cast<int64_t>(1000) << attempt;
            for (int sample = 0; sample < 50; ++sample) {
                auto delay = policy.backoff_delay(attempt).count();
                ASSERT_TRUE(delay >= base && delay < base + 1000,
                            "attempt " + std::to_string(attempt) + " delay " +
                                std::to_string(delay) + " out of range");
            }
        }
        PASS();
    }
    {
        TEST(backoff_clamped_to_max);
        RetryPolicy policy;
        ASSERT_EQ(policy.backoff_delay(10).count(), 64000, "clamped delay");
        PASS();
    }
    {
        TEST(default_classification);
        RetryPolicy policy;

        RequestContext get;
        RequestContext post;
        post.method = net::HttpMethod::POST;
        RequestContext post_precondition = post;
        post_precondition.has_precondition = true;
        RequestContext put_session;
        put_session.method = net::HttpMethod::PUT;
        put_session.has_session_uri = true;

        TransferOutcome unavailable;
        unavailable.status_code = 503;
        ASSERT_TRUE(policy.should_retry(unavailable, get), "503 GET retried");
        ASSERT_TRUE(!policy.should_retry(unavailable, post), "503 unconditional POST not retried");
        ASSERT_TRUE(policy.should_retry(unavailable, post_precondition), "503 POST with precondition");
        ASSERT_TRUE(policy.should_retry(unavailable, put_session), "503 PUT to session URI");

        TransferOutcome throttled;
        throttled.status_code = 429;
        ASSERT_TRUE(policy.should_retry(throttled, post), "429 always retried");

        TransferOutcome rate_reason;
        rate_reason.status_code = 403;
        rate_reason.reason = "rateLimitExceeded";
        ASSERT_TRUE(policy.should_retry(rate_reason, post), "rate limit reason retried");

        TransferOutcome not_found;
        not_found.status_code = 404;
        ASSERT_TRUE(!policy.should_retry(not_found, get), "404 final");

        TransferOutcome forbidden;
        forbidden.status_code = 403;
        ASSERT_TRUE(!policy.should_retry(forbidden, get), "403 final");

        TransferOutcome timeout;
        timeout.status_code = 408;
        ASSERT_TRUE(policy.should_retry(timeout, get), "408 GET retried");

        TransferOutcome network;
        network.is_network_error = true;
        ASSERT_TRUE(policy.should_retry(network, get), "network error GET retried");
        ASSERT_TRUE(!policy.should_retry(network, post), "network error POST not retried");

        TransferOutcome malformed;
        malformed.status_code = 200;
        malformed.malformed_response = true;
        ASSERT_TRUE(policy.should_retry(malformed, get), "malformed response retried");

        TransferOutcome cancelled;
        cancelled.cancelled = true;
        ASSERT_TRUE(!policy.should_retry(cancelled, get), "cancellation never retried");
        PASS();
    }
    {
        TEST(idempotency_strategies);
        TransferOutcome unavailable;
        unavailable.status_code = 503;
        RequestContext post;
        post.method = net::HttpMethod::POST;
        RequestContext get;

        RetryOptions always;
        always.idempotency = IdempotencyStrategy::RetryAlways;
        ASSERT_TRUE(RetryPolicy(always).should_retry(unavailable, post), "always retries POST");

        RetryOptions never;
        never.idempotency = IdempotencyStrategy::RetryNever;
        TransferOutcome throttled;
        throttled.status_code = 429;
        ASSERT_TRUE(!RetryPolicy(never).should_retry(throttled, get), "never retries anything");

        RetryOptions disabled;
        disabled.auto_retry = false;
        ASSERT_TRUE(!RetryPolicy(disabled).should_retry(unavailable, get), "auto_retry off");
        PASS();
    }
    {
        TEST(custom_strategy);
        RetryOptions options;
        options.strategy = std::make_shared<AlwaysRetryStrategy>();
        RetryPolicy policy(options);
        TransferOutcome not_found;
        not_found.status_code = 404;
        ASSERT_TRUE(policy.should_retry(not_found, RequestContext{}), "custom strategy consulted");
        PASS();
    }
    {
        TEST(outcome_from_json_error);
        auto response = make_response(429,
            R"({"error":{"code":429,"message":"slow down","errors":[{"reason":"rateLimitExceeded"}]}})");
        auto outcome = TransferOutcome::from_response(response);
        ASSERT_EQ(outcome.status_code, 429, "status");
        ASSERT_EQ(outcome.reason, "rateLimitExceeded", "reason");
        ASSERT_EQ(outcome.message, "slow down", "message");

        auto empty = TransferOutcome::from_response(make_response(503));
        ASSERT_EQ(empty.message, "HTTP 503", "empty body message");

        net::HttpResponse failed;
        failed.is_network_error = true;
        failed.error = "Couldn't connect to server";
        auto network = TransferOutcome::from_response(failed);
        ASSERT_TRUE(network.is_network_error, "network flag");
        ASSERT_EQ(network.message, "Couldn't connect to server", "transport message");
        PASS();
    }
    {
        TEST(attempt_limit);
        RetryOptions options;
        options.max_retries = 2;
        RetryPolicy policy(options);
        auto state = policy.begin();

        TransferOutcome outcome;
        outcome.status_code = 503;
        outcome.message = "backend down";
        policy.next_delay(state, outcome);
        policy.next_delay(state, outcome);
        ASSERT_EQ(state.attempt, 2, "two retries recorded");

        std::string msg;
        int attempts = 0;
        ErrorKind kind = ErrorKind::Transient;
        try {
            policy.next_delay(state, outcome);
        } catch (const RetryLimitExceeded& e) {
            msg = e.what();
            attempts = e.attempts();
            kind = e.kind();
        }
        ASSERT_EQ(msg, "Retry limit exceeded after 3 attempts - backend down", "limit message");
        ASSERT_EQ(attempts, 3, "attempts");
        ASSERT_TRUE(kind == ErrorKind::BudgetExhausted, "budget kind");
        PASS();
    }
    {
        TEST(total_time_budget);
        RetryOptions options;
        options.total_timeout = std::chrono::milliseconds(0);
        RetryPolicy policy(options);
        auto state = policy.begin();
        TransferOutcome outcome;
        outcome.status_code = 500;
        outcome.message = "boom";

        std::string msg;
        try {
            policy.next_delay(state, outcome);
        } catch (const RetryLimitExceeded& e) {
            msg = e.what();
        }
        ASSERT_TRUE(msg.find("Retry total time limit exceeded") != std::string::npos,
                    "time budget message: " + msg);
        PASS();
    }
    {
        TEST(wait_observes_cancellation);
        int sleeps = 0;
        RetryOptions options;
        options.sleep = [&](std::chrono::milliseconds) { ++sleeps; };
        RetryPolicy policy(options);

        CancellationToken token;
        ASSERT_TRUE(policy.wait(std::chrono::milliseconds(10), &token), "uncancelled wait");
        token.cancel();
        ASSERT_TRUE(!policy.wait(std::chrono::milliseconds(10), &token), "cancelled wait");
        ASSERT_EQ(sleeps, 2, "sleep hook used");

        RetryPolicy real_sleep;
        auto start = std::chrono::steady_clock::now();
        ASSERT_TRUE(!real_sleep.wait(std::chrono::milliseconds(5000), &token),
                    "cancelled token cuts the sleep short");
        ASSERT_TRUE(std::chrono::steady_clock::now() - start < std::chrono::seconds(2),
                    "wait should not sleep out the delay");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Chunk pipeline
// ---------------------------------------------------------------------------

static void test_chunk_pipeline() {
    std::cout << "\n=== Chunk pipeline ===" << std::endl;

    {
        TEST(peek_pull_unshift);
        ChunkPipeline pipe;
        pipe.write(std::string_view("hello "));
        pipe.write(std::string_view("world"));
        pipe.close();

        auto head = pipe.peek(5);
        ASSERT_EQ(std::string(head.begin(), head.end()), "hello", "peek");
        ASSERT_EQ(pipe.buffered(), 11u, "peek does not consume");

        auto first = pipe.pull(4);
        ASSERT_EQ(std::string(first.begin(), first.end()), "hell", "pull respects limit");

        pipe.unshift(bytes_of("XY"));
        auto second = pipe.pull(100);
        ASSERT_EQ(std::string(second.begin(), second.end()), "XYo world", "unshift goes to front");
        ASSERT_TRUE(pipe.exhausted(), "drained and closed");
        ASSERT_TRUE(!pipe.wait_for_data(), "no more data");
        PASS();
    }
    {
        TEST(checksums_count_each_byte_once);
        ChunkPipeline pipe(1024 * 1024, true);
        pipe.write(std::string_view("hello world"));
        pipe.close();
        auto taken = pipe.pull(5);
        pipe.unshift(taken);
        pipe.pull(100);
        ASSERT_EQ(pipe.crc32c().to_string(), crc_of("hello world"), "crc over input");
        ASSERT_EQ(pipe.total_written(), 11u, "bytes written");
        ASSERT_EQ(pipe.md5_base64(), "XrY7u+Ae7tCTyyK7j1rNww==", "md5 over input");
        PASS();
    }
    {
        TEST(skip_discards);
        ChunkPipeline pipe;
        pipe.write(std::string_view("0123456789"));
        pipe.close();
        ASSERT_EQ(pipe.skip(4), 4u, "skipped");
        auto rest = pipe.pull(100);
        ASSERT_EQ(std::string(rest.begin(), rest.end()), "456789", "remaining");
        ASSERT_EQ(pipe.skip(10), 0u, "nothing left to skip");
        PASS();
    }
    {
        TEST(backpressure_releases_on_demand);
        ChunkPipeline pipe(4);
        std::thread producer([&] {
            for (int i = 0; i < 8; ++i) pipe.write(std::string_view("abcd"));
            pipe.close();
        });
        std::string received;
        while (pipe.wait_for_data()) {
            auto chunk = pipe.pull(6);
            received.append(chunk.begin(), chunk.end());
        }
        producer.join();
        ASSERT_EQ(received.size(), 32u, "all bytes delivered");
        PASS();
    }
    {
        TEST(write_after_close_or_cancel);
        ChunkPipeline closed;
        closed.close();
        bool logic_error = false;
        try {
            closed.write(std::string_view("x"));
        } catch (const std::logic_error&) {
            logic_error = true;
        }
        ASSERT_TRUE(logic_error, "write after close");

        ChunkPipeline cancelled;
        cancelled.cancel();
        bool was_cancelled = false;
        try {
            cancelled.write(std::string_view("x"));
        } catch (const TransferError& e) {
            was_cancelled = e.kind() == ErrorKind::Cancelled;
        }
        ASSERT_TRUE(was_cancelled, "write after cancel");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. Session stores
// ---------------------------------------------------------------------------

static void test_config_store() {
    std::cout << "\n=== Session stores ===" << std::endl;

    {
        TEST(cache_key_format);
        ASSERT_EQ(session_cache_key("bkt", "dir/obj"), "bkt/dir/obj", "no generation");
        ASSERT_EQ(session_cache_key("bkt", "obj", 42), "bkt/obj/42", "with generation");
        PASS();
    }
    {
        TEST(memory_store);
        MemoryConfigStore store;
        SessionRecord record;
        record.uri = "https://fake.test/session/1";
        record.first_chunk = bytes_of("head");
        store.set("b/o", record);
        auto got = store.get("b/o");
        ASSERT_TRUE(got.has_value(), "record stored");
        ASSERT_EQ(got->uri, record.uri, "uri");
        ASSERT_TRUE(got->first_chunk == record.first_chunk, "prefix");
        store.remove("b/o");
        ASSERT_TRUE(!store.get("b/o").has_value(), "record removed");
        PASS();
    }

    auto tmpdir = make_temp_dir("objxfer-store");
    auto db_path = tmpdir / "nested" / "sessions.db";

    {
        TEST(sqlite_store_persists);
        {
            SqliteConfigStore store(db_path);
            SessionRecord a;
            a.uri = "https://fake.test/session/a";
            a.first_chunk = bytes_of(std::string("\0\1binary", 8));
            store.set("bkt/b-obj", a);
            SessionRecord b;
            b.uri = "https://fake.test/session/b";
            store.set("bkt/a-obj", b);
        }
        ASSERT_TRUE(fs::exists(db_path), "database created with parent directories");

        SqliteConfigStore reopened(db_path);
        auto a = reopened.get("bkt/b-obj");
        ASSERT_TRUE(a.has_value(), "record survives reopen");
        ASSERT_EQ(a->uri, "https://fake.test/session/a", "uri");
        ASSERT_TRUE(a->first_chunk == bytes_of(std::string("\0\1binary", 8)), "binary prefix");
        ASSERT_TRUE(a->updated_at > 0, "timestamp filled in");

        auto all = reopened.list();
        ASSERT_EQ(all.size(), 2u, "two records");
        ASSERT_EQ(all[0].first, "bkt/a-obj", "ordered by key");
        PASS();
    }
    {
        TEST(sqlite_store_last_writer_wins);
        SqliteConfigStore store(db_path);
        SessionRecord record;
        record.uri = "https://fake.test/session/replaced";
        store.set("bkt/a-obj", record);
        ASSERT_EQ(store.get("bkt/a-obj")->uri, "https://fake.test/session/replaced", "overwritten");
        PASS();
    }
    {
        TEST(sqlite_store_remove_and_clear);
        SqliteConfigStore store(db_path);
        store.remove("bkt/a-obj");
        ASSERT_TRUE(!store.get("bkt/a-obj").has_value(), "removed");
        store.remove("bkt/never-existed");
        ASSERT_EQ(store.clear(), 1u, "one record cleared");
        ASSERT_TRUE(store.list().empty(), "empty after clear");
        PASS();
    }
    {
        TEST(sqlite_store_lists_each_row_once);
        SqliteConfigStore store(db_path);
        for (int i = 0; i < 50; ++i) {
            SessionRecord record;
            record.uri = "https://fake.test/session/" + std::to_string(i);
            store.set("bkt/obj-" + std::to_string(100 + i), record);
        }
        auto all = store.list();
        ASSERT_EQ(all.size(), 50u, "every row listed");
        std::set<std::string> keys;
        for (const auto& entry : all) keys.insert(entry.first);
        ASSERT_EQ(keys.size(), 50u, "no row listed twice");
        ASSERT_EQ(all.front().first, "bkt/obj-100", "first key");
        ASSERT_EQ(all.back().first, "bkt/obj-149", "last key");
        ASSERT_EQ(store.clear(), 50u, "cleared");
        PASS();
    }
    {
        TEST(sqlite_store_failed_open_closes_database);
        auto legacy_path = tmpdir / "legacy.db";
        sqlite3* db = nullptr;
        ASSERT_TRUE(sqlite3_open(legacy_path.c_str(), &db) == SQLITE_OK, "create legacy database");
        int rc = sqlite3_exec(db,
            "CREATE TABLE upload_sessions (cache_key TEXT PRIMARY KEY, uri TEXT)",
            nullptr, nullptr, nullptr);
        sqlite3_close(db);
        ASSERT_TRUE(rc == SQLITE_OK, "legacy table created");

        bool threw = false;
        try {
            SqliteConfigStore store(legacy_path);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "incompatible table rejected");
        // The WAL file only disappears once the last connection closes
        ASSERT_TRUE(!fs::exists(legacy_path.string() + "-wal"), "connection closed after failure");

        ASSERT_TRUE(sqlite3_open(legacy_path.c_str(), &db) == SQLITE_OK, "reopen");
        rc = sqlite3_exec(db, "PRAGMA journal_mode=DELETE", nullptr, nullptr, nullptr);
        sqlite3_close(db);
        ASSERT_TRUE(rc == SQLITE_OK, "no other connection holds the database");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 5. Resumable uploads
// ---------------------------------------------------------------------------

static void test_resumable_upload() {
    std::cout << "\n=== Resumable upload ===" << std::endl;

    {
        TEST(config_validation);
        auto c = upload_config();
        ASSERT_EMPTY(c.validate(), "default config valid");

        c.bucket.clear();
        ASSERT_EQ(c.validate(), "A bucket and file name are required", "bucket");

        c = upload_config();
        c.offset = 5;
        ASSERT_EQ(c.validate(), "Cannot provide an `offset` without providing a `uri`", "offset");

        c = upload_config();
        c.is_partial_upload = true;
        ASSERT_EQ(c.validate(), "Cannot set `is_partial_upload` without providing a `chunk_size`",
                  "partial");

        c = upload_config();
        c.chunk_size = 1000;
        ASSERT_EQ(c.validate(), "chunk_size must be a multiple of 262144 bytes", "granularity");

        c = upload_config();
        c.encryption_key = bytes_of("short");
        ASSERT_NOT_EMPTY(c.validate(), "short encryption key");

        bool threw = false;
        try {
            auto bad = upload_config();
            bad.chunk_size = 1000;
            ResumableUpload upload(bad, transport_for(std::make_shared<FakeUploadServer>()));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "constructor rejects invalid config");
        PASS();
    }
    {
        TEST(single_request_upload);
        auto server = std::make_shared<FakeUploadServer>();
        auto transport = transport_for(server);
        auto store = std::make_shared<MemoryConfigStore>();

        auto config = upload_config();
        config.config_store = store;
        std::string seen_uri;
        config.on_uri = [&](const std::string& uri) { seen_uri = uri; };

        ResumableUpload upload(config, transport);
        std::istringstream in("hello world");
        auto result = upload.upload_stream(in);

        ASSERT_EQ(result.size, 11u, "size");
        ASSERT_EQ(server->stored, "hello world", "server content");
        ASSERT_EQ(seen_uri, "https://fake.test/session/1", "on_uri");
        ASSERT_EQ(result.metadata["name"].get<std::string>(), "obj", "metadata");

        auto requests = transport->requests();
        ASSERT_EQ(requests.size(), 2u, "initiation and one PUT, no probe");
        ASSERT_TRUE(requests[0].url.find("/upload/storage/v1/b/bkt/o?uploadType=resumable&name=obj") !=
                        std::string::npos,
                    "initiation url: " + requests[0].url);
        ASSERT_EQ(requests[1].headers.get("Content-Range").value_or(""), "bytes 0-10/11", "range");
        ASSERT_EQ(requests[1].headers.get("X-Goog-Hash").value_or(""),
                  "crc32c=" + crc_of("hello world"), "checksum header");
        ASSERT_TRUE(!store->get(upload.cache_key()).has_value(), "session record dropped");
        ASSERT_TRUE(upload.state() == SessionState::Completed, "completed state");
        PASS();
    }
    {
        TEST(chunked_upload_ranges);
        auto server = std::make_shared<FakeUploadServer>();
        auto transport = transport_for(server);
        auto config = upload_config();
        config.chunk_size = CHUNK_GRANULARITY;

        auto payload = make_payload(2 * CHUNK_GRANULARITY + 1000);
        ResumableUpload upload(config, transport);
        std::istringstream in(payload);
        auto result = upload.upload_stream(in);

        ASSERT_TRUE(server->stored == payload, "server content matches");
        ASSERT_EQ(result.size, payload.size(), "size");

        auto requests = transport->requests();
        ASSERT_EQ(requests.size(), 4u, "initiation plus three chunks");
        ASSERT_EQ(requests[1].headers.get("Content-Range").value_or(""), "bytes 0-262143/*", "chunk 1");
        ASSERT_EQ(requests[2].headers.get("Content-Range").value_or(""), "bytes 262144-524287/*",
                  "chunk 2");
        ASSERT_EQ(requests[3].headers.get("Content-Range").value_or(""), "bytes 524288-525287/525288",
                  "final chunk carries total");
        ASSERT_TRUE(!requests[1].headers.has("X-Goog-Hash"), "no checksum on intermediate chunks");
        ASSERT_TRUE(requests[3].headers.has("X-Goog-Hash"), "checksum on final chunk");
        PASS();
    }
    {
        TEST(partial_acknowledgement_resends_tail);
        auto server = std::make_shared<FakeUploadServer>();
        server->short_ack_once = 100000;
        auto transport = transport_for(server);
        auto config = upload_config();
        config.chunk_size = CHUNK_GRANULARITY;

        auto payload = make_payload(2 * CHUNK_GRANULARITY + 1000);
        ResumableUpload upload(config, transport);
        std::istringstream in(payload);
        auto result = upload.upload_stream(in);

        ASSERT_TRUE(server->stored == payload, "server content matches");
        ASSERT_EQ(result.size, payload.size(), "size");
        auto requests = transport->requests();
        ASSERT_EQ(requests[2].headers.get("Content-Range").value_or(""), "bytes 100000-362143/*",
                  "resent from acknowledged offset");
        PASS();
    }
    {
        TEST(transient_failure_reprobes_offset);
        auto server = std::make_shared<FakeUploadServer>();
        server->fail_next_chunk = 503;
        auto transport = transport_for(server);
        auto config = upload_config();
        int sleeps = 0;
        config.retry.sleep = [&](std::chrono::milliseconds) { ++sleeps; };

        ResumableUpload upload(config, transport);
        std::istringstream in("retry me please");
        auto result = upload.upload_stream(in);

        ASSERT_EQ(server->stored, "retry me please", "server content");
        ASSERT_EQ(sleeps, 1, "one backoff");
        auto requests = transport->requests();
        ASSERT_EQ(requests.size(), 4u, "initiate, failed PUT, probe, PUT");
        ASSERT_EQ(requests[2].headers.get("Content-Range").value_or(""), "bytes */*", "offset probe");
        PASS();
    }
    {
        TEST(query_offset_parses_range);
        std::atomic<int> mode{0};
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest&) {
            if (mode == 0) {
                auto response = make_response(308);
                response.headers.set("Range", "bytes=0-122");
                return response;
            }
            if (mode == 1) return make_response(308);
            return make_response(404, "Not Found");
        });

        auto config = upload_config();
        config.uri = "https://fake.test/session/manual";
        ResumableUpload upload(config, transport);

        auto offset = upload.query_offset();
        ASSERT_TRUE(offset.has_value() && *offset == 123, "acknowledged 123 bytes");
        mode = 1;
        offset = upload.query_offset();
        ASSERT_TRUE(offset.has_value() && *offset == 0, "no Range header means nothing stored");
        mode = 2;
        ASSERT_TRUE(!upload.query_offset().has_value(), "expired session");

        auto requests = transport->requests();
        ASSERT_EQ(requests[0].url, "https://fake.test/session/manual", "probe url");
        ASSERT_EQ(requests[0].headers.get("Content-Range").value_or(""), "bytes */*", "probe range");
        PASS();
    }
    {
        TEST(stale_persisted_session_restarts);
        auto server = std::make_shared<FakeUploadServer>();
        server->expired.insert("https://fake.test/session/stale");
        auto transport = transport_for(server);
        auto store = std::make_shared<MemoryConfigStore>();

        std::string content = "persisted content";
        SessionRecord stale;
        stale.uri = "https://fake.test/session/stale";
        stale.first_chunk = bytes_of(content);
        store->set(session_cache_key("bkt", "obj"), stale);

        auto config = upload_config();
        config.config_store = store;
        ResumableUpload upload(config, transport);
        std::istringstream in(content);
        auto result = upload.upload_stream(in);

        ASSERT_EQ(server->stored, content, "uploaded through a new session");
        ASSERT_EQ(server->sessions_created, 1, "one new session");
        auto requests = transport->requests();
        ASSERT_EQ(requests[0].url, "https://fake.test/session/stale", "stale session probed first");
        ASSERT_EQ(result.uri, "https://fake.test/session/1", "new session uri");
        ASSERT_TRUE(!store->get(session_cache_key("bkt", "obj")).has_value(), "record dropped");
        PASS();
    }
    {
        TEST(persisted_session_resumes_at_offset);
        auto server = std::make_shared<FakeUploadServer>();
        std::string content = "0123456789abcdefghij";
        server->stored = content.substr(0, 8);
        auto transport = transport_for(server);
        auto store = std::make_shared<MemoryConfigStore>();

        SessionRecord record;
        record.uri = "https://fake.test/session/kept";
        record.first_chunk = bytes_of(content);
        store->set(session_cache_key("bkt", "obj"), record);

        auto config = upload_config();
        config.config_store = store;
        ResumableUpload upload(config, transport);
        std::istringstream in(content);
        auto result = upload.upload_stream(in);

        ASSERT_EQ(server->stored, content, "server content");
        ASSERT_EQ(server->sessions_created, 0, "no new session");
        auto requests = transport->requests();
        ASSERT_EQ(requests.size(), 2u, "probe and one PUT");
        ASSERT_EQ(requests[1].headers.get("Content-Range").value_or(""), "bytes 8-19/20",
                  "resumed after acknowledged bytes");
        ASSERT_EQ(result.size, 20u, "size");
        PASS();
    }
    {
        TEST(manual_uri_expiry_is_fatal);
        auto server = std::make_shared<FakeUploadServer>();
        server->expired.insert("https://fake.test/session/stale");
        auto transport = transport_for(server);

        auto config = upload_config();
        config.uri = "https://fake.test/session/stale";
        ResumableUpload upload(config, transport);
        std::istringstream in("some data");

        bool fatal = false;
        int status = 0;
        std::string msg;
        try {
            upload.upload_stream(in);
        } catch (const TransferError& e) {
            fatal = e.kind() == ErrorKind::FatalCaller;
            status = e.status_code();
            msg = e.what();
        }
        ASSERT_TRUE(fatal, "fatal caller error: " + msg);
        ASSERT_EQ(status, 404, "status");
        ASSERT_TRUE(msg.find("no longer exists") != std::string::npos, "message: " + msg);
        ASSERT_EQ(transport->count(net::HttpMethod::POST), 0u, "no new session created");
        PASS();
    }
    {
        TEST(session_expiry_after_written_bytes_is_fatal);
        auto server = std::make_shared<FakeUploadServer>();
        server->expire_after = CHUNK_GRANULARITY;
        auto transport = transport_for(server);
        auto config = upload_config();
        config.chunk_size = CHUNK_GRANULARITY;

        auto payload = make_payload(2 * CHUNK_GRANULARITY + 1000);
        ResumableUpload upload(config, transport);
        std::istringstream in(payload);

        bool fatal = false;
        std::string msg;
        try {
            upload.upload_stream(in);
        } catch (const TransferError& e) {
            fatal = e.kind() == ErrorKind::FatalCaller;
            msg = e.what();
        }
        ASSERT_TRUE(fatal, "fatal caller error: " + msg);
        ASSERT_TRUE(msg.find("unrecoverable bytes have been written") != std::string::npos,
                    "message: " + msg);
        ASSERT_EQ(server->sessions_created, 1, "no replacement session");
        ASSERT_EQ(transport->count(net::HttpMethod::PUT), 2u, "accepted chunk and rejected chunk");
        auto requests = transport->requests();
        ASSERT_EQ(requests.back().headers.get("Content-Range").value_or(""), "bytes 262144-524287/*",
                  "second chunk hit the expired session");
        ASSERT_TRUE(upload.state() == SessionState::Errored, "errored state");
        PASS();
    }
    {
        TEST(manual_uri_expiry_mid_upload_is_fatal);
        auto server = std::make_shared<FakeUploadServer>();
        server->expire_after = CHUNK_GRANULARITY;
        auto transport = transport_for(server);
        auto config = upload_config();
        config.chunk_size = CHUNK_GRANULARITY;
        config.uri = "https://fake.test/session/manual";

        auto payload = make_payload(2 * CHUNK_GRANULARITY + 1000);
        ResumableUpload upload(config, transport);
        std::istringstream in(payload);

        bool fatal = false;
        int status = 0;
        std::string msg;
        try {
            upload.upload_stream(in);
        } catch (const TransferError& e) {
            fatal = e.kind() == ErrorKind::FatalCaller;
            status = e.status_code();
            msg = e.what();
        }
        ASSERT_TRUE(fatal, "fatal caller error: " + msg);
        ASSERT_EQ(status, 404, "status");
        ASSERT_TRUE(msg.find("supplied by the caller") != std::string::npos, "message: " + msg);
        ASSERT_EQ(transport->count(net::HttpMethod::POST), 0u, "no new session initiated");
        ASSERT_EQ(server->stored.size(), CHUNK_GRANULARITY, "first chunk kept");
        PASS();
    }
    {
        TEST(cancel_mid_stream_stops_uploading);
        auto server = std::make_shared<FakeUploadServer>();
        auto transport = transport_for(server);
        auto config = upload_config();
        config.chunk_size = CHUNK_GRANULARITY;

        ResumableUpload upload(config, transport);
        auto future = upload.start();
        // One full chunk goes out; the task then waits for the rest of the next one
        upload.write(make_payload(CHUNK_GRANULARITY + 1000));
        bool first_chunk = wait_for([&] {
            std::lock_guard lock(server->mutex);
            return server->stored.size() == CHUNK_GRANULARITY;
        });
        ASSERT_TRUE(first_chunk, "first chunk uploaded");

        upload.cancel();
        bool cancelled = false;
        try {
            future.get();
        } catch (const TransferError& e) {
            cancelled = e.kind() == ErrorKind::Cancelled;
        }
        ASSERT_TRUE(cancelled, "future fails as cancelled");
        ASSERT_EQ(transport->count(net::HttpMethod::PUT), 1u, "no PUT after cancel");
        ASSERT_TRUE(upload.state() == SessionState::Errored, "errored state");

        bool write_rejected = false;
        try {
            upload.write(std::string_view("late"));
        } catch (const TransferError& e) {
            write_rejected = e.kind() == ErrorKind::Cancelled;
        }
        ASSERT_TRUE(write_rejected, "writes rejected after cancel");
        PASS();
    }
    {
        TEST(content_mismatch_on_resume);
        auto server = std::make_shared<FakeUploadServer>();
        auto transport = transport_for(server);
        auto store = std::make_shared<MemoryConfigStore>();

        SessionRecord record;
        record.uri = "https://fake.test/session/9";
        record.first_chunk = bytes_of("other content");
        store->set(session_cache_key("bkt", "obj"), record);

        auto config = upload_config();
        config.config_store = store;
        ResumableUpload upload(config, transport);
        std::istringstream in("new content here");

        bool fatal = false;
        try {
            upload.upload_stream(in);
        } catch (const TransferError& e) {
            fatal = e.kind() == ErrorKind::FatalCaller;
        }
        ASSERT_TRUE(fatal, "content mismatch is fatal");
        ASSERT_TRUE(transport->requests().empty(), "nothing sent");
        ASSERT_TRUE(store->get(session_cache_key("bkt", "obj")).has_value(), "record kept");
        PASS();
    }
    {
        TEST(checksum_mismatch_is_integrity_error);
        auto server = std::make_shared<FakeUploadServer>();
        server->crc_override = "AAAAAA==";
        auto transport = transport_for(server);
        ResumableUpload upload(upload_config(), transport);
        std::istringstream in("hello world");

        std::string msg;
        bool integrity = false;
        try {
            upload.upload_stream(in);
        } catch (const TransferError& e) {
            integrity = e.kind() == ErrorKind::Integrity;
            msg = e.what();
        }
        ASSERT_TRUE(integrity, "integrity error");
        ASSERT_TRUE(msg.find("Upload mismatch") != std::string::npos, "message: " + msg);
        ASSERT_TRUE(msg.find("AAAAAA==") != std::string::npos, "server value in message");
        PASS();
    }
    {
        TEST(retry_budget_exhausted);
        auto transport = std::make_shared<FakeTransport>(
            [](const net::HttpRequest&) { return make_response(503); });
        auto config = upload_config();
        config.retry = fast_retry(2);
        ResumableUpload upload(config, transport);
        std::istringstream in("x");

        std::string msg;
        int attempts = 0;
        try {
            upload.upload_stream(in);
        } catch (const RetryLimitExceeded& e) {
            msg = e.what();
            attempts = e.attempts();
        }
        ASSERT_TRUE(msg.find("Retry limit exceeded after 3 attempts") != std::string::npos,
                    "message: " + msg);
        ASSERT_EQ(attempts, 3, "attempts");
        ASSERT_EQ(transport->count(net::HttpMethod::POST), 3u, "three initiation attempts");
        PASS();
    }
    {
        TEST(partial_upload_leaves_session_open);
        auto server = std::make_shared<FakeUploadServer>();
        auto transport = transport_for(server);
        auto config = upload_config();
        config.chunk_size = CHUNK_GRANULARITY;
        config.is_partial_upload = true;

        auto payload = make_payload(CHUNK_GRANULARITY);
        ResumableUpload upload(config, transport);
        std::istringstream in(payload);
        auto result = upload.upload_stream(in);

        ASSERT_TRUE(result.partial, "partial result");
        ASSERT_EQ(result.size, payload.size(), "acknowledged bytes");
        ASSERT_EQ(result.uri, "https://fake.test/session/1", "session uri returned");
        auto requests = transport->requests();
        ASSERT_EQ(requests.back().headers.get("Content-Range").value_or(""), "bytes 0-262143/*",
                  "total left open");
        PASS();
    }
    {
        TEST(customer_encryption_headers);
        auto server = std::make_shared<FakeUploadServer>();
        auto transport = transport_for(server);
        auto config = upload_config();
        config.encryption_key = std::vector<uint8_t>(32, 'k');

        ResumableUpload upload(config, transport);
        std::istringstream in("secret");
        upload.upload_stream(in);

        for (const auto& request : transport->requests()) {
            ASSERT_EQ(request.headers.get("x-goog-encryption-algorithm").value_or(""), "AES256",
                      "algorithm header");
            ASSERT_EQ(request.headers.get("x-goog-encryption-key").value_or(""),
                      net::base64_encode(std::vector<uint8_t>(32, 'k')), "key header");
            ASSERT_NOT_EMPTY(request.headers.get("x-goog-encryption-key-sha256").value_or(""),
                             "key hash header");
        }
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. Object client
// ---------------------------------------------------------------------------

static ObjectClientOptions client_options() {
    ObjectClientOptions options;
    options.api_endpoint = "https://fake.test";
    options.retry = fast_retry();
    return options;
}

static void test_object_client() {
    std::cout << "\n=== Object client ===" << std::endl;

    {
        TEST(metadata_lookup);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& request) {
            if (request.url.find("/o/missing") != std::string::npos) {
                return make_response(404, R"({"error":{"code":404,"message":"No such object"}})");
            }
            return make_response(200,
                R"({"bucket":"bkt","name":"obj","size":"42","generation":"7","crc32c":"rth90Q=="})");
        });
        ObjectClient client(client_options(), transport);

        auto meta = client.get_metadata("bkt", "obj");
        ASSERT_TRUE(meta.has_value(), "found");
        ASSERT_EQ(meta->size, 42u, "size parsed from string");
        ASSERT_EQ(meta->generation, 7, "generation");
        ASSERT_EQ(meta->crc32c, "rth90Q==", "crc32c");
        ASSERT_TRUE(!client.get_metadata("bkt", "missing").has_value(), "missing object");
        PASS();
    }
    {
        TEST(download_resumes_after_interruption);
        std::string content = "0123456789abcdef";
        std::atomic<int> calls{0};
        std::string resume_range;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& request) {
            if (calls++ == 0) {
                request.body_sink(reinterpret_cast<const uint8_t*>(content.data()), 6);
                net::HttpResponse response;
                response.is_network_error = true;
                response.error = "Connection reset by peer";
                return response;
            }
            resume_range = request.headers.get("Range").value_or("");
            auto response = stream_response(request, 206, content.substr(6));
            response.headers.set("x-goog-hash", "crc32c=" + crc_of(content) + ",md5=unused");
            return response;
        });
        ObjectClient client(client_options(), transport);

        auto data = client.download_to_memory("bkt", "obj");
        ASSERT_EQ(std::string(data.begin(), data.end()), content, "full content");
        ASSERT_EQ(resume_range, "bytes=6-", "resumed after received bytes");
        ASSERT_EQ(calls.load(), 2, "two requests");
        PASS();
    }
    {
        TEST(download_checksum_mismatch);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& request) {
            auto response = stream_response(request, 200, "payload");
            response.headers.set("x-goog-hash", "crc32c=AAAAAA==");
            return response;
        });
        ObjectClient client(client_options(), transport);

        std::string msg;
        try {
            client.download_to_memory("bkt", "obj");
        } catch (const TransferError& e) {
            if (e.kind() == ErrorKind::Integrity) msg = e.what();
        }
        ASSERT_TRUE(msg.find("CONTENT_DOWNLOAD_MISMATCH") != std::string::npos,
                    "mismatch reported: " + msg);

        DownloadOptions no_check;
        no_check.validate_crc32c = false;
        auto data = client.download_to_memory("bkt", "obj", no_check);
        ASSERT_EQ(data.size(), 7u, "validation can be disabled");
        PASS();
    }
    {
        TEST(ranged_download_uses_byte_range);
        std::string content = "0123456789";
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& request) {
            if (!request.byte_range) return stream_response(request, 200, content);
            auto [start, end] = *request.byte_range;
            return stream_response(request, 206, content.substr(start, end - start + 1));
        });
        ObjectClient client(client_options(), transport);

        DownloadOptions range;
        range.range_start = 2;
        range.range_end = 5;
        range.generation = 9;
        auto data = client.download_to_memory("bkt", "obj", range);
        ASSERT_EQ(std::string(data.begin(), data.end()), "2345", "ranged content");
        ASSERT_TRUE(transport->requests()[0].url.find("generation=9") != std::string::npos,
                    "generation pinned");
        PASS();
    }
    {
        TEST(media_upload_sends_checksum);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& request) {
            std::string body(request.body.begin(), request.body.end());
            nlohmann::json meta = {{"name", "obj"}, {"size", std::to_string(body.size())},
                                   {"crc32c", crc_of(body)}};
            return make_response(200, meta.dump());
        });
        ObjectClient client(client_options(), transport);

        MediaUploadOptions options;
        options.if_generation_match = 0;
        options.content_type = "text/plain";
        auto data = bytes_of("small object");
        auto meta = client.upload_media("bkt", "obj", data, options);

        ASSERT_EQ(meta.size, 12u, "size");
        auto request = transport->requests()[0];
        ASSERT_TRUE(request.url.find("uploadType=media") != std::string::npos, "media upload");
        ASSERT_TRUE(request.url.find("ifGenerationMatch=0") != std::string::npos, "precondition");
        ASSERT_EQ(request.headers.get("X-Goog-Hash").value_or(""), "crc32c=" + crc_of("small object"),
                  "checksum header");
        ASSERT_EQ(request.headers.content_type().value_or(""), "text/plain", "content type");
        PASS();
    }
    {
        TEST(unconditional_upload_not_retried);
        auto transport = std::make_shared<FakeTransport>(
            [](const net::HttpRequest&) { return make_response(503); });
        ObjectClient client(client_options(), transport);

        int status = 0;
        try {
            client.upload_media("bkt", "obj", bytes_of("data"));
        } catch (const TransferError& e) {
            status = e.status_code();
        }
        ASSERT_EQ(status, 503, "surfaced without retry");
        ASSERT_EQ(transport->requests().size(), 1u, "single attempt");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. Parallel batches
// ---------------------------------------------------------------------------

static std::vector<TransferJob> make_jobs(size_t n) {
    std::vector<TransferJob> jobs;
    for (size_t i = 0; i < n; ++i) {
        TransferJob job;
        job.source = "job-" + std::to_string(i);
        job.destination = "dest-" + std::to_string(i);
        jobs.push_back(job);
    }
    return jobs;
}

static void test_run_many() {
    std::cout << "\n=== Parallel batches ===" << std::endl;

    {
        TEST(non_standard_throw_recorded_as_failure);
        auto result = run_many(make_jobs(3), [](TransferJob& job) {
            if (job.source == "job-1") throw 42;
        });
        ASSERT_EQ(result.succeeded.size(), 2u, "two succeeded");
        ASSERT_EQ(result.failed.size(), 1u, "one failed");
        ASSERT_EQ(result.failed[0].job.source, "job-1", "failed job");
        ASSERT_EQ(result.failed[0].message, "unknown error", "failure message");
        PASS();
    }
    {
        TEST(partial_failure_reports_every_job);
        std::atomic<int> in_flight{0};
        std::atomic<int> max_in_flight{0};

        BatchOptions options;
        options.concurrency_limit = 3;
        auto result = run_many(make_jobs(10), [&](TransferJob& job) {
            int now = ++in_flight;
            int seen = max_in_flight.load();
            while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --in_flight;

            int index = std::stoi(job.source.substr(4));
            if (index % 2 == 1) {
                throw TransferError(ErrorKind::Transient, "odd job failed", 503);
            }
        }, options);

        ASSERT_EQ(result.succeeded.size(), 5u, "five succeeded");
        ASSERT_EQ(result.failed.size(), 5u, "five failed");
        ASSERT_TRUE(result.skipped.empty(), "none skipped");
        for (size_t i = 0; i < 5; ++i) {
            ASSERT_EQ(result.succeeded[i].source, "job-" + std::to_string(2 * i), "succeeded order");
            ASSERT_EQ(result.failed[i].job.source, "job-" + std::to_string(2 * i + 1), "failed order");
            ASSERT_EQ(result.failed[i].message, "odd job failed", "failure message");
        }
        ASSERT_TRUE(max_in_flight.load() <= 3, "concurrency limit honored");
        ASSERT_TRUE(!result.ok(), "batch not ok");

        bool partial = false;
        try {
            result.throw_if_failed();
        } catch (const TransferError& e) {
            partial = e.kind() == ErrorKind::PartialBatch &&
                      std::string(e.what()).find("5 of 10 transfers failed") != std::string::npos;
        }
        ASSERT_TRUE(partial, "throw_if_failed summarizes");
        PASS();
    }
    {
        TEST(fail_fast_skips_remaining);
        BatchOptions options;
        options.concurrency_limit = 1;
        options.fail_fast = true;
        std::atomic<int> ran{0};
        auto result = run_many(make_jobs(5), [&](TransferJob&) {
            ++ran;
            throw std::runtime_error("disk full");
        }, options);

        ASSERT_EQ(ran.load(), 1, "only the first job ran");
        ASSERT_EQ(result.failed.size(), 1u, "one failure");
        ASSERT_EQ(result.skipped.size(), 4u, "rest skipped");
        ASSERT_EQ(result.failed[0].message, "disk full", "std::exception message kept");
        ASSERT_TRUE(result.skipped[0].status == JobStatus::Skipped, "skipped status");
        PASS();
    }
    {
        TEST(empty_batch);
        auto result = run_many({}, [](TransferJob&) {});
        ASSERT_TRUE(result.ok(), "empty batch ok");
        ASSERT_TRUE(result.succeeded.empty(), "nothing succeeded");
        result.throw_if_failed();
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. Multipart uploads
// ---------------------------------------------------------------------------

/// In-memory multipart protocol that records every call.
class FakeMultipartUploader : public MultipartUploader {
public:
    std::string initiate_upload() override {
        std::lock_guard lock(mutex_);
        ++initiated;
        return "upload-1";
    }

    std::string upload_part(const std::string& upload_id, int part_number,
                            std::span<const uint8_t> data) override {
        std::lock_guard lock(mutex_);
        if (fail_parts.count(part_number)) {
            throw TransferError(ErrorKind::Transient, "part rejected", 503);
        }
        upload_ids.insert(upload_id);
        part_data[part_number] = std::string(data.begin(), data.end());
        return "\"etag-" + std::to_string(part_number) + "\"";
    }

    nlohmann::json complete_upload(const MultipartState& state) override {
        std::lock_guard lock(mutex_);
        completed = state;
        return nlohmann::json{{"name", "obj"}};
    }

    void abort_upload(const std::string& upload_id) override {
        std::lock_guard lock(mutex_);
        aborted.push_back(upload_id);
    }

    int initiated = 0;
    std::set<std::string> upload_ids;
    std::map<int, std::string> part_data;
    std::set<int> fail_parts;
    std::optional<MultipartState> completed;
    std::vector<std::string> aborted;

private:
    std::mutex mutex_;
};

static void test_multipart() {
    std::cout << "\n=== Multipart upload ===" << std::endl;

    auto tmpdir = make_temp_dir("objxfer-multipart");
    auto file = tmpdir / "ten.bin";
    write_file(file, "abcdefghij");

    ChunkedUploadOptions base;
    base.chunk_size = 4;
    base.concurrency_limit = 2;

    {
        TEST(fresh_upload_splits_parts);
        FakeMultipartUploader uploader;
        auto result = upload_file_in_chunks(uploader, file, base);

        ASSERT_EQ(uploader.initiated, 1, "initiated once");
        ASSERT_EQ(uploader.part_data.size(), 3u, "three parts");
        ASSERT_EQ(uploader.part_data[1], "abcd", "part 1");
        ASSERT_EQ(uploader.part_data[2], "efgh", "part 2");
        ASSERT_EQ(uploader.part_data[3], "ij", "short last part");
        ASSERT_TRUE(uploader.completed.has_value(), "completed");
        ASSERT_EQ(uploader.completed->upload_id, "upload-1", "upload id");
        ASSERT_EQ(uploader.completed->parts_map.size(), 3u, "every part in completion");
        ASSERT_EQ(result.crc32c, crc_of("abcdefghij"), "combined checksum");
        ASSERT_EQ(result.parts_uploaded, 3u, "uploaded count");
        ASSERT_EQ(result.size, 10u, "size");
        PASS();
    }
    {
        TEST(resume_uploads_only_missing_parts);
        FakeMultipartUploader uploader;
        auto options = base;
        options.upload_id = "existing";
        options.parts_map = {{1, "\"etag-old\""}};
        auto result = upload_file_in_chunks(uploader, file, options);

        ASSERT_EQ(uploader.initiated, 0, "no new upload");
        ASSERT_TRUE(uploader.part_data.count(1) == 0, "part 1 not re-sent");
        ASSERT_EQ(uploader.part_data.size(), 2u, "parts 2 and 3 sent");
        ASSERT_EQ(*uploader.upload_ids.begin(), "existing", "existing upload id used");
        ASSERT_EQ(uploader.completed->parts_map[1], "\"etag-old\"", "resumed etag kept");
        ASSERT_EQ(result.parts_resumed, 1u, "one resumed part");
        ASSERT_EQ(result.crc32c, crc_of("abcdefghij"), "checksum covers resumed parts");
        PASS();
    }
    {
        TEST(abort_existing_only_aborts);
        FakeMultipartUploader uploader;
        auto options = base;
        options.upload_id = "existing";
        options.abort_existing = true;
        auto result = upload_file_in_chunks(uploader, file, options);

        ASSERT_TRUE(result.aborted, "aborted");
        ASSERT_EQ(uploader.aborted.size(), 1u, "one abort");
        ASSERT_EQ(uploader.aborted[0], "existing", "aborted id");
        ASSERT_EQ(uploader.initiated, 0, "no initiation");
        ASSERT_TRUE(uploader.part_data.empty(), "no parts");
        ASSERT_TRUE(!uploader.completed.has_value(), "no completion");

        bool threw = false;
        options.upload_id.clear();
        try {
            upload_file_in_chunks(uploader, file, options);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "abort_existing needs an upload id");
        PASS();
    }
    {
        TEST(failure_keeps_resume_state);
        FakeMultipartUploader uploader;
        uploader.fail_parts = {2};
        auto options = base;
        options.auto_abort_failure = false;

        bool caught = false;
        std::string upload_id;
        std::map<int, std::string> parts;
        try {
            upload_file_in_chunks(uploader, file, options);
        } catch (const MultipartUploadError& e) {
            caught = true;
            upload_id = e.upload_id();
            parts = e.parts_map();
        }
        ASSERT_TRUE(caught, "MultipartUploadError raised");
        ASSERT_EQ(upload_id, "upload-1", "upload id carried");
        ASSERT_EQ(parts.size(), 2u, "landed parts carried");
        ASSERT_TRUE(parts.count(1) && parts.count(3) && !parts.count(2), "parts 1 and 3 only");
        ASSERT_TRUE(uploader.aborted.empty(), "not aborted");
        ASSERT_TRUE(!uploader.completed.has_value(), "not completed");
        PASS();
    }
    {
        TEST(failure_auto_aborts);
        FakeMultipartUploader uploader;
        uploader.fail_parts = {2};

        std::string msg;
        bool resumable_error = false;
        try {
            upload_file_in_chunks(uploader, file, base);
        } catch (const MultipartUploadError&) {
            resumable_error = true;
        } catch (const TransferError& e) {
            msg = e.what();
        }
        ASSERT_TRUE(!resumable_error, "no resume state after abort");
        ASSERT_TRUE(msg.find("upload aborted") != std::string::npos, "message: " + msg);
        ASSERT_EQ(uploader.aborted.size(), 1u, "aborted once");
        ASSERT_EQ(uploader.aborted[0], "upload-1", "aborted id");
        PASS();
    }
    {
        TEST(empty_file_single_part);
        auto empty = tmpdir / "empty.bin";
        write_file(empty, "");
        FakeMultipartUploader uploader;
        auto result = upload_file_in_chunks(uploader, empty, base);
        ASSERT_EQ(uploader.part_data.size(), 1u, "one part");
        ASSERT_EQ(uploader.part_data[1], "", "empty part");
        ASSERT_EQ(result.crc32c, "AAAAAA==", "empty checksum");
        PASS();
    }
    {
        TEST(completion_xml_ordered_and_escaped);
        auto body = build_complete_multipart_xml({{2, "\"b\""}, {1, "\"a\""}, {10, "\"j\""}});
        auto p1 = body.find("<PartNumber>1</PartNumber>");
        auto p2 = body.find("<PartNumber>2</PartNumber>");
        auto p10 = body.find("<PartNumber>10</PartNumber>");
        ASSERT_TRUE(p1 != std::string::npos && p2 != std::string::npos && p10 != std::string::npos,
                    "all parts present");
        ASSERT_TRUE(p1 < p2 && p2 < p10, "ascending part numbers");
        ASSERT_TRUE(body.find("<ETag>&quot;a&quot;</ETag>") != std::string::npos, "etag escaped");
        ASSERT_TRUE(body.find("<CompleteMultipartUpload>") != std::string::npos, "root element");
        PASS();
    }
    {
        TEST(xml_protocol_round_trip);
        std::string completion_body;
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& request) {
            if (request.method == net::HttpMethod::POST && request.url.find("?uploads") != std::string::npos) {
                return make_response(200,
                    "<InitiateMultipartUploadResult><Bucket>bkt</Bucket><Key>dir/obj</Key>"
                    "<UploadId>abc&amp;123</UploadId></InitiateMultipartUploadResult>");
            }
            if (request.method == net::HttpMethod::PUT) {
                auto response = make_response(200);
                response.headers.set("ETag", "d41d8cd9");
                return response;
            }
            if (request.method == net::HttpMethod::POST) {
                completion_body.assign(request.body.begin(), request.body.end());
                return make_response(200,
                    "<CompleteMultipartUploadResult><Location>http://fake.test/bkt/dir/obj</Location>"
                    "<Bucket>bkt</Bucket><Key>dir/obj</Key><ETag>\"final\"</ETag>"
                    "</CompleteMultipartUploadResult>");
            }
            return make_response(204);
        });

        XmlMultipartConfig config;
        config.xml_endpoint = "http://fake.test/";
        config.bucket = "bkt";
        config.object = "dir/obj";
        config.retry = fast_retry();
        XmlMultipartUploader uploader(config, transport);
        ASSERT_EQ(uploader.object_url(), "http://fake.test/bkt/dir/obj", "path-style url");

        auto upload_id = uploader.initiate_upload();
        ASSERT_EQ(upload_id, "abc&123", "upload id decoded");

        auto etag = uploader.upload_part(upload_id, 1, bytes_of("part"));
        ASSERT_EQ(etag, "\"d41d8cd9\"", "etag quoted");
        auto put = transport->requests()[1];
        ASSERT_TRUE(put.url.find("?partNumber=1&uploadId=abc%26123") != std::string::npos,
                    "part url: " + put.url);

        MultipartState state;
        state.upload_id = upload_id;
        state.parts_map = {{1, etag}};
        auto metadata = uploader.complete_upload(state);
        ASSERT_EQ(metadata["etag"].get<std::string>(), "\"final\"", "final etag");
        ASSERT_EQ(metadata["location"].get<std::string>(), "http://fake.test/bkt/dir/obj", "location");
        ASSERT_TRUE(completion_body.find("<ETag>&quot;d41d8cd9&quot;</ETag>") != std::string::npos,
                    "completion body: " + completion_body);

        uploader.abort_upload(upload_id);
        ASSERT_EQ(transport->count(net::HttpMethod::DELETE, "uploadId=abc%26123"), 1u, "abort sent");
        PASS();
    }
    {
        TEST(xml_error_inside_success_response);
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest&) {
            return make_response(200,
                "<?xml version='1.0'?><Error><Code>InvalidPart</Code>"
                "<Message>One or more parts could not be found</Message></Error>");
        });
        XmlMultipartConfig config;
        config.bucket = "bkt";
        config.object = "obj";
        config.retry = fast_retry();
        XmlMultipartUploader uploader(config, transport);
        ASSERT_EQ(uploader.object_url(), "https://bkt.storage.googleapis.com/obj", "virtual-hosted url");

        std::string msg;
        MultipartState state;
        state.upload_id = "u";
        state.parts_map = {{1, "\"e\""}};
        try {
            uploader.complete_upload(state);
        } catch (const TransferError& e) {
            msg = e.what();
        }
        ASSERT_TRUE(msg.find("InvalidPart") != std::string::npos, "error code surfaced: " + msg);
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 9. Transfer manager
// ---------------------------------------------------------------------------

static void test_transfer_manager() {
    std::cout << "\n=== Transfer manager ===" << std::endl;

    {
        TEST(object_names_from_paths);
        ASSERT_EQ(TransferManager::object_name_for("dir/sub/file.txt", "pre/"), "pre/dir/sub/file.txt",
                  "prefix joined");
        ASSERT_EQ(TransferManager::object_name_for("./a/../b.txt", ""), "b.txt", "normalized");
        ASSERT_EQ(TransferManager::object_name_for("/abs/x.bin", "p"), "p/abs/x.bin",
                  "leading slash dropped");
        PASS();
    }
    {
        TEST(local_paths_from_objects);
        DownloadManyOptions options;
        options.destination_dir = "/out";
        options.strip_prefix = "data/";
        ASSERT_EQ(TransferManager::local_path_for("data/2024/a.txt", options).string(),
                  "/out/2024/a.txt", "prefix stripped");
        options.prefix = "p";
        ASSERT_EQ(TransferManager::local_path_for("data/2024/a.txt", options).string(),
                  "/out/p/2024/a.txt", "local prefix joined");

        options.prefix.clear();
        bool escaped = false;
        try {
            TransferManager::local_path_for("data/../../etc/passwd", options);
        } catch (const TransferError& e) {
            escaped = e.kind() == ErrorKind::FatalCaller;
        }
        ASSERT_TRUE(escaped, "paths outside the destination rejected");
        PASS();
    }

    auto tmpdir = make_temp_dir("objxfer-manager");

    {
        TEST(upload_many_expands_directories);
        auto src = tmpdir / "src";
        write_file(src / "a.txt", "alpha");
        write_file(src / "sub" / "b.txt", "bravo");

        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& request) {
            std::string body(request.body.begin(), request.body.end());
            nlohmann::json meta = {{"size", std::to_string(body.size())}, {"crc32c", crc_of(body)}};
            return make_response(200, meta.dump());
        });
        ObjectClient client(client_options(), transport);
        TransferManager manager("bkt", client);

        UploadManyOptions options;
        options.concurrency_limit = 2;
        options.destination_builder = [&](const fs::path& file) {
            return "backup/" + file.lexically_relative(src).generic_string();
        };
        auto result = manager.upload_many_files({src}, options);

        ASSERT_EQ(result.succeeded.size(), 2u, "both uploaded");
        ASSERT_EQ(result.succeeded[0].destination, "backup/a.txt", "first object");
        ASSERT_EQ(result.succeeded[1].destination, "backup/sub/b.txt", "second object");
        ASSERT_EQ(transport->count(net::HttpMethod::POST, "name=backup%2Fsub%2Fb.txt"), 1u,
                  "object name encoded in url");
        PASS();
    }
    {
        TEST(upload_many_skip_if_exists);
        auto src = tmpdir / "skip";
        write_file(src / "new.txt", "new");
        write_file(src / "old.txt", "old");

        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& request) {
            if (request.url.find("old.txt") != std::string::npos) {
                return make_response(412, R"({"error":{"code":412,"message":"Precondition Failed"}})");
            }
            std::string body(request.body.begin(), request.body.end());
            return make_response(200, nlohmann::json{{"crc32c", crc_of(body)}}.dump());
        });
        ObjectClient client(client_options(), transport);
        TransferManager manager("bkt", client);

        UploadManyOptions options;
        options.skip_if_exists = true;
        auto result = manager.upload_many_files({src / "new.txt", src / "old.txt"}, options);

        ASSERT_EQ(result.succeeded.size(), 2u, "existing object counts as done");
        ASSERT_TRUE(result.failed.empty(), "no failures");
        for (const auto& request : transport->requests()) {
            ASSERT_TRUE(request.url.find("ifGenerationMatch=0") != std::string::npos,
                        "precondition on every upload");
        }
        PASS();
    }
    {
        TEST(upload_many_isolates_failures);
        auto src = tmpdir / "isolate";
        write_file(src / "good.txt", "good");
        write_file(src / "bad.txt", "bad");

        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& request) {
            if (request.url.find("bad.txt") != std::string::npos) {
                return make_response(403, R"({"error":{"code":403,"message":"Forbidden"}})");
            }
            std::string body(request.body.begin(), request.body.end());
            return make_response(200, nlohmann::json{{"crc32c", crc_of(body)}}.dump());
        });
        ObjectClient client(client_options(), transport);
        TransferManager manager("bkt", client);

        auto result = manager.upload_many_files({src / "good.txt", src / "bad.txt", src / "gone.txt"});
        ASSERT_EQ(result.succeeded.size(), 1u, "one success");
        ASSERT_EQ(result.failed.size(), 2u, "two failures");
        ASSERT_TRUE(result.failed[0].job.source.find("bad.txt") != std::string::npos, "bad.txt failed");
        ASSERT_TRUE(result.failed[0].kind == ErrorKind::FatalCaller, "403 is final");
        ASSERT_TRUE(result.failed[1].job.source.find("gone.txt") != std::string::npos,
                    "missing file failed");
        PASS();
    }
    {
        TEST(upload_many_large_file_uses_resumable);
        auto src = tmpdir / "large";
        auto payload = make_payload(5000);
        write_file(src / "big.bin", payload);

        auto server = std::make_shared<FakeUploadServer>();
        auto transport = transport_for(server);
        ObjectClient client(client_options(), transport);
        TransferManager manager("bkt", client);

        UploadManyOptions options;
        options.resumable_threshold = 1024;
        auto result = manager.upload_many_files({src / "big.bin"}, options);

        ASSERT_EQ(result.succeeded.size(), 1u, "uploaded");
        ASSERT_TRUE(server->stored == payload, "content through resumable session");
        ASSERT_EQ(transport->count(net::HttpMethod::POST, "uploadType=resumable"), 1u, "session created");
        PASS();
    }
    {
        TEST(download_many_writes_files);
        auto dest = tmpdir / "download";
        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& request) {
            if (request.url.find("missing") != std::string::npos) {
                return make_response(404, R"({"error":{"code":404,"message":"No such object"}})");
            }
            std::string name = request.url.find("a.txt") != std::string::npos ? "a" : "c";
            return stream_response(request, 200, "content:" + name);
        });
        ObjectClient client(client_options(), transport);
        TransferManager manager("bkt", client);

        DownloadManyOptions options;
        options.destination_dir = dest;
        auto result = manager.download_many_files(
            {"a.txt", "nested/c.txt", "folder/", "missing.txt"}, options);

        ASSERT_EQ(result.succeeded.size(), 3u, "three succeeded");
        ASSERT_EQ(result.failed.size(), 1u, "one failed");
        ASSERT_EQ(result.failed[0].job.source, "missing.txt", "missing object failed");
        ASSERT_EQ(read_file(dest / "a.txt"), "content:a", "a.txt content");
        ASSERT_EQ(read_file(dest / "nested" / "c.txt"), "content:c", "nested content");
        ASSERT_TRUE(fs::is_directory(dest / "folder"), "directory placeholder created");
        ASSERT_TRUE(!fs::exists(dest / "missing.txt"), "no file for failed download");
        ASSERT_TRUE(!fs::exists(dest / "missing.txt.objxfer.tmp"), "temp file removed");
        PASS();
    }
    {
        TEST(download_in_chunks);
        auto content = make_payload(1000);
        auto transport = std::make_shared<FakeTransport>([&](const net::HttpRequest& request) {
            if (request.url.find("alt=media") == std::string::npos) {
                nlohmann::json meta = {{"name", "big.bin"}, {"size", "1000"},
                                       {"generation", "5"}, {"crc32c", crc_of(content)}};
                return make_response(200, meta.dump());
            }
            if (request.url.find("generation=5") == std::string::npos || !request.byte_range) {
                return make_response(400, "expected a pinned ranged read");
            }
            auto [start, end] = *request.byte_range;
            return stream_response(request, 206, content.substr(start, end - start + 1));
        });
        ObjectClient client(client_options(), transport);
        TransferManager manager("bkt", client);

        ChunkedDownloadOptions options;
        options.chunk_size = 300;
        options.concurrency_limit = 3;
        options.validate_crc32c = true;
        auto target = tmpdir / "chunks" / "big.bin";
        auto result = manager.download_file_in_chunks("big.bin", target, options);

        ASSERT_EQ(result.chunks, 4u, "four ranges");
        ASSERT_EQ(result.size, 1000u, "size");
        ASSERT_EQ(result.crc32c, crc_of(content), "combined checksum");
        ASSERT_TRUE(read_file(target) == content, "file content");
        ASSERT_EQ(transport->count(net::HttpMethod::GET, "alt=media"), 4u, "one GET per range");
        PASS();
    }
    {
        TEST(download_in_chunks_missing_object);
        auto transport = std::make_shared<FakeTransport>(
            [](const net::HttpRequest&) { return make_response(404, "Not Found"); });
        ObjectClient client(client_options(), transport);
        TransferManager manager("bkt", client);

        int status = 0;
        try {
            manager.download_file_in_chunks("nope", tmpdir / "nope.bin");
        } catch (const TransferError& e) {
            status = e.status_code();
        }
        ASSERT_EQ(status, 404, "missing object reported");
        PASS();
    }
    {
        TEST(upload_in_chunks_over_xml);
        auto file = tmpdir / "parts.bin";
        write_file(file, "0123456789");

        auto transport = std::make_shared<FakeTransport>([](const net::HttpRequest& request) {
            if (request.method == net::HttpMethod::POST && request.url.find("?uploads") != std::string::npos) {
                return make_response(200, "<InitiateMultipartUploadResult><UploadId>u-1</UploadId>"
                                          "</InitiateMultipartUploadResult>");
            }
            if (request.method == net::HttpMethod::PUT) {
                auto response = make_response(200);
                response.headers.set("ETag", "\"part\"");
                return response;
            }
            return make_response(200, "<CompleteMultipartUploadResult><ETag>\"done\"</ETag>"
                                      "</CompleteMultipartUploadResult>");
        });
        ObjectClient client(client_options(), transport);
        TransferManager manager("bkt", client, "http://fake.test");

        ChunkedUploadOptions options;
        options.chunk_size = 4;
        auto result = manager.upload_file_in_chunks(file, "dir/parts.bin", options,
                                                    {{"x-goog-meta-origin", "test"}});

        ASSERT_EQ(result.state.upload_id, "u-1", "upload id");
        ASSERT_EQ(result.parts_uploaded, 3u, "three parts");
        ASSERT_EQ(result.metadata["etag"].get<std::string>(), "\"done\"", "final etag");
        ASSERT_EQ(transport->count(net::HttpMethod::PUT, "http://fake.test/bkt/dir/parts.bin?partNumber="),
                  3u, "parts sent path-style");
        auto initiate = transport->requests()[0];
        ASSERT_EQ(initiate.headers.get("x-goog-meta-origin").value_or(""), "test", "custom header");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 10. TransferConfig
// ---------------------------------------------------------------------------

static void test_transfer_config() {
    std::cout << "\n=== TransferConfig ===" << std::endl;

    {
        TEST(cli_upload_args);
        const char* args[] = {
            "objxfer", "upload",
            "--bucket", "my-bucket",
            "--chunk-size", "1048576",
            "--concurrency", "4",
            "--resumable-chunk-size", "524288",
            "--idempotency", "always",
            "--max-retries", "7",
            "local.bin", "remote/obj",
        };
        auto cfg = TransferConfig::from_args(16, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->command, "upload", "command");
        ASSERT_EQ(cfg->bucket, "my-bucket", "bucket");
        ASSERT_EQ(cfg->chunk_size, 1048576u, "chunk_size");
        ASSERT_EQ(cfg->concurrency_limit, 4u, "concurrency");
        ASSERT_EQ(cfg->resumable_chunk_size, 524288u, "resumable chunk size");
        ASSERT_TRUE(cfg->idempotency == IdempotencyStrategy::RetryAlways, "idempotency");
        ASSERT_EQ(cfg->max_retries, 7, "max retries");
        ASSERT_EQ(cfg->args.size(), 2u, "positional args");
        ASSERT_EQ(cfg->args[1], "remote/obj", "object arg");
        ASSERT_TRUE(!cfg->state_db.empty(), "state db defaulted");
        ASSERT_EMPTY(cfg->validate(), "should validate");
        PASS();
    }
    {
        TEST(cli_multipart_resume_flags);
        const char* args[] = {
            "objxfer", "upload-chunks",
            "--bucket", "b",
            "--upload-id", "u1",
            "--part", "1=\"e1\"",
            "--part", "3=e3",
            "--no-auto-abort",
            "file.bin", "obj",
        };
        auto cfg = TransferConfig::from_args(13, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->upload_id, "u1", "upload id");
        ASSERT_EQ(cfg->parts_map.size(), 2u, "two parts");
        ASSERT_EQ(cfg->parts_map[1], "\"e1\"", "part 1 etag");
        ASSERT_EQ(cfg->parts_map[3], "e3", "part 3 etag");
        ASSERT_TRUE(!cfg->auto_abort_failure, "auto abort off");
        ASSERT_EMPTY(cfg->validate(), "should validate");
        PASS();
    }
    {
        TEST(cli_rejects_bad_input);
        const char* unknown_opt[] = {"objxfer", "upload", "--bogus"};
        ASSERT_TRUE(!TransferConfig::from_args(3, const_cast<char**>(unknown_opt)).has_value(),
                    "unknown option");
        const char* unknown_cmd[] = {"objxfer", "sync", "--bucket", "b"};
        ASSERT_TRUE(!TransferConfig::from_args(4, const_cast<char**>(unknown_cmd)).has_value(),
                    "unknown command");
        const char* bad_number[] = {"objxfer", "upload", "--concurrency", "many"};
        ASSERT_TRUE(!TransferConfig::from_args(4, const_cast<char**>(bad_number)).has_value(),
                    "bad number");
        const char* bad_part[] = {"objxfer", "upload-chunks", "--part", "etag-only"};
        ASSERT_TRUE(!TransferConfig::from_args(4, const_cast<char**>(bad_part)).has_value(),
                    "bad part");
        const char* no_command[] = {"objxfer", "--bucket", "b"};
        ASSERT_TRUE(!TransferConfig::from_args(3, const_cast<char**>(no_command)).has_value(),
                    "missing command");
        PASS();
    }
    {
        TEST(json_config);
        auto tmpdir = make_temp_dir("objxfer-json");
        auto path = tmpdir / "config.json";
        write_file(path, R"({
            "bucket": "json-bucket",
            "concurrency_limit": 16,
            "chunk_size": 8388608,
            "skip_if_exists": true,
            "validate_crc32c": false,
            "retry": {
                "max_retries": 2,
                "retry_delay_multiplier": 1.5,
                "max_retry_delay": 10,
                "idempotency": "never"
            }
        })");

        TransferConfig cfg;
        ASSERT_TRUE(cfg.load_json(path), "should load");
        ASSERT_EQ(cfg.bucket, "json-bucket", "bucket");
        ASSERT_EQ(cfg.concurrency_limit, 16u, "concurrency");
        ASSERT_EQ(cfg.chunk_size, 8388608u, "chunk size");
        ASSERT_TRUE(cfg.skip_if_exists, "skip_if_exists");
        ASSERT_TRUE(!cfg.validate_crc32c, "validate off");
        ASSERT_EQ(cfg.max_retries, 2, "max retries");
        ASSERT_TRUE(cfg.idempotency == IdempotencyStrategy::RetryNever, "idempotency");

        auto retry = cfg.retry_options();
        ASSERT_EQ(retry.max_retry_delay.count(), 10000, "delay cap in ms");
        ASSERT_TRUE(retry.retry_delay_multiplier == 1.5, "multiplier");

        write_file(tmpdir / "bad.json", R"({"retry": {"idempotency": "sometimes"}})");
        TransferConfig bad;
        ASSERT_TRUE(!bad.load_json(tmpdir / "bad.json"), "bad idempotency rejected");
        ASSERT_TRUE(!bad.load_json(tmpdir / "absent.json"), "missing file rejected");

        // CLI flags after --config override the file
        auto path_str = path.string();
        const char* args[] = {"objxfer", "download-many", "--config", path_str.c_str(),
                              "--concurrency", "3", "a", "b"};
        auto merged = TransferConfig::from_args(8, const_cast<char**>(args));
        ASSERT_TRUE(merged.has_value(), "should parse");
        ASSERT_EQ(merged->bucket, "json-bucket", "bucket from file");
        ASSERT_EQ(merged->concurrency_limit, 3u, "flag overrides file");
        fs::remove_all(tmpdir);
        PASS();
    }
    {
        TEST(validation_messages);
        TransferConfig cfg;
        cfg.command = "upload";
        cfg.args = {"a", "b"};
        ASSERT_EQ(cfg.validate(), "bucket is required (--bucket)", "bucket");

        cfg.bucket = "b";
        ASSERT_EMPTY(cfg.validate(), "valid upload");

        cfg.args = {"a"};
        ASSERT_EQ(cfg.validate(), "upload expects exactly two arguments", "arg count");

        cfg.command = "download-many";
        cfg.args.clear();
        ASSERT_EQ(cfg.validate(), "download-many expects at least one argument", "many args");

        cfg.command = "upload-chunks";
        cfg.args = {"a", "b"};
        cfg.abort_existing = true;
        ASSERT_EQ(cfg.validate(), "--abort-existing requires --upload-id", "abort needs id");
        cfg.abort_existing = false;

        cfg.parts_map[1] = "e";
        ASSERT_EQ(cfg.validate(), "--part requires --upload-id", "parts need id");
        cfg.parts_map.clear();

        cfg.offset = 10;
        ASSERT_EQ(cfg.validate(), "--offset requires --uri", "offset needs uri");
        cfg.offset.reset();

        cfg.resumable_chunk_size = 1000;
        ASSERT_EQ(cfg.validate(), "resumable_chunk_size must be a multiple of 262144 bytes",
                  "granularity");
        cfg.resumable_chunk_size = 0;

        cfg.concurrency_limit = 0;
        ASSERT_EQ(cfg.validate(), "concurrency_limit must be > 0", "concurrency");
        cfg.concurrency_limit = 1;

        TransferConfig sessions;
        sessions.command = "sessions";
        sessions.state_db = "/tmp/s.db";
        sessions.args = {"purge"};
        ASSERT_EQ(sessions.validate(), "sessions expects 'list' or 'clear'", "sessions action");
        sessions.args = {"list"};
        ASSERT_EMPTY(sessions.validate(), "sessions list needs no bucket");
        PASS();
    }
    {
        TEST(retry_options_mapping);
        TransferConfig cfg;
        cfg.max_retries = 0;
        cfg.total_timeout_secs = 30;
        auto retry = cfg.retry_options();
        ASSERT_TRUE(!retry.auto_retry, "zero retries disables retrying");
        ASSERT_EQ(retry.total_timeout.count(), 30000, "total timeout in ms");
        ASSERT_EQ(std::string(idempotency_to_string(retry.idempotency)), "conditional",
                  "default idempotency");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 11. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("objxfer-metrics");
    auto prom_path = tmpdir / "test.prom";

    {
        TEST(creates_prom_file);
        std::map<std::string, std::string> labels = {{"command", "upload"}};
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), labels);
        exporter.start();

        bool created = wait_for([&]{ return fs::exists(prom_path); }, 5000);
        exporter.stop();

        ASSERT_TRUE(created, ".prom file should be created");
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("objxfer_uploads_total") != std::string::npos,
                    "should contain objxfer_uploads_total");
        ASSERT_TRUE(content.find("objxfer_jobs_in_flight") != std::string::npos,
                    "should contain objxfer_jobs_in_flight");
        ASSERT_TRUE(content.find("objxfer_request_duration_seconds") != std::string::npos,
                    "should contain objxfer_request_duration_seconds");
        ASSERT_TRUE(content.find("command=\"upload\"") != std::string::npos, "constant label");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(batch_counters_recorded);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});

        BatchOptions options;
        options.metrics = &exporter;
        run_many(make_jobs(3), [](TransferJob& job) {
            if (job.source == "job-1") throw std::runtime_error("nope");
        }, options);
        exporter.stop();

        ASSERT_TRUE(exporter.jobs_succeeded().Value() == 2.0, "two succeeded");
        ASSERT_TRUE(exporter.jobs_failed().Value() == 1.0, "one failed");
        ASSERT_TRUE(exporter.jobs_in_flight().Value() == 0.0, "nothing in flight");
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("objxfer_batch_jobs_total{") != std::string::npos, "batch counter");
        ASSERT_TRUE(content.find("result=\"failed\"") != std::string::npos, "failed label");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(upload_counters_recorded);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        auto server = std::make_shared<FakeUploadServer>();
        auto config = upload_config();
        config.metrics = &exporter;
        ResumableUpload upload(config, transport_for(server));
        std::istringstream in("metered");
        upload.upload_stream(in);

        ASSERT_TRUE(exporter.uploads_success().Value() == 1.0, "upload counted");
        ASSERT_TRUE(exporter.upload_bytes_total().Value() == 7.0, "bytes counted");
        exporter.stop();
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("objxfer_upload_duration_seconds_count") != std::string::npos,
                    "duration histogram");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "objxfer test suite" << std::endl;
    std::cout << "==================" << std::endl;

    test_crc32c();
    test_retry_policy();
    test_chunk_pipeline();
    test_config_store();
    test_resumable_upload();
    test_object_client();
    test_run_many();
    test_multipart();
    test_transfer_manager();
    test_transfer_config();
    test_metrics();

    std::cout << "\n==================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
