#pragma once

#include "objxfer/chunk_pipeline.hpp"
#include "objxfer/config_store.hpp"
#include "objxfer/net/http.hpp"
#include "objxfer/retry_policy.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace objxfer {

class CancellationToken;
class MetricsExporter;

enum class SessionState {
    Uninitialized,
    SessionCreated,
    Uploading,
    Restarting,
    Completed,
    Errored
};

const char* session_state_to_string(SessionState state);

struct UploadProgress {
    uint64_t bytes_written = 0;
    std::optional<uint64_t> content_length;  // nullopt when unknown
};

struct ResumableUploadConfig {
    std::string api_endpoint = "https://storage.googleapis.com";
    std::string bucket;
    std::string object;

    // Object resource sent with the initiation request
    nlohmann::json metadata = nlohmann::json::object();
    std::string content_type;
    std::optional<uint64_t> content_length;

    // Preconditions; `generation` also distinguishes the session cache key
    std::optional<int64_t> generation;
    std::optional<int64_t> metageneration_match;

    std::string kms_key_name;
    std::string predefined_acl;
    std::string user_project;
    std::string origin;

    // Customer-supplied AES-256 key (raw bytes)
    std::vector<uint8_t> encryption_key;

    // Resume a session the caller kept; `offset` is the server-acknowledged
    // byte count and the written stream starts there
    std::string uri;
    std::optional<uint64_t> offset;

    // 0 sends the whole object in one request
    size_t chunk_size = 0;
    bool is_partial_upload = false;

    // Checksums sent on the final request and checked against the result
    bool validate_crc32c = true;
    bool validate_md5 = false;
    std::string client_crc32c;  // precomputed base64, replaces the running value
    std::string client_md5;

    RetryOptions retry;
    std::chrono::milliseconds request_timeout{300000};

    // Null disables persistence of session URIs
    std::shared_ptr<ConfigStore> config_store;

    std::function<void(const UploadProgress&)> on_progress;
    std::function<void(const std::string& uri)> on_uri;

    MetricsExporter* metrics = nullptr;

    /// Empty on success.
    std::string validate() const;
};

/// Final object resource returned by the server.
struct UploadResult {
    nlohmann::json metadata;
    uint64_t size = 0;
    std::string uri;
    bool partial = false;  // partial upload ended with the session still open
};

/// One object's chunked resumable upload.
///
/// The caller writes object bytes from any thread while a background task
/// drives the session: initiate (or reuse a persisted/caller-supplied
/// session URI), probe the acknowledged offset, PUT successive
/// Content-Range requests, and on success validate checksums and drop the
/// persisted record. A 404/410 on a known session restarts it unless the
/// URI was supplied manually.
///
/// Usage:
///   ResumableUpload upload(config, transport, auth);
///   auto result = upload.start();
///   upload.write(data);
///   upload.finish();
///   auto metadata = result.get().metadata;
class ResumableUpload {
public:
    /// Throws std::invalid_argument if the config is invalid.
    ResumableUpload(ResumableUploadConfig config,
                    std::shared_ptr<net::HttpTransport> transport,
                    std::shared_ptr<net::Authenticator> auth = nullptr);
    ~ResumableUpload();

    ResumableUpload(const ResumableUpload&) = delete;
    ResumableUpload& operator=(const ResumableUpload&) = delete;

    /// Launch the upload task. May be called once.
    std::future<UploadResult> start();

    /// Feed object bytes. Blocks under backpressure.
    void write(std::span<const uint8_t> data);
    void write(std::string_view data);

    /// Signal end of input.
    void finish();

    /// Abort the upload; the pending future fails with ErrorKind::Cancelled.
    void cancel();

    /// start(), stream `in` through the session, finish() and wait.
    UploadResult upload_stream(std::istream& in);

    /// Initiate a session without uploading. Returns the session URI.
    std::string create_uri();

    /// Ask the server how many bytes the session holds.
    /// nullopt when the session has expired (404/410).
    std::optional<uint64_t> query_offset();

    SessionState state() const;
    std::string uri() const;
    uint64_t bytes_written() const { return bytes_written_.load(); }
    const std::string& cache_key() const { return cache_key_; }

private:
    struct ProbeResult {
        enum class Kind { Incomplete, Finished, Expired };
        Kind kind = Kind::Incomplete;
        uint64_t offset = 0;
        net::HttpResponse response;
    };

    UploadResult drive();
    void resume_from_store();
    void start_upload_session();
    bool sync_offset();
    ProbeResult probe();
    std::optional<UploadResult> send_next_request();
    UploadResult finalize(const net::HttpResponse& response);
    void restart();
    void rewind_last_request();

    net::HttpResponse send(net::HttpRequest& request);
    net::HttpResponse execute(net::HttpRequest request, const RequestContext& context,
                              const char* what);
    void backoff_or_throw(const TransferOutcome& outcome, const RequestContext& context,
                          const char* what);
    void apply_common(net::HttpRequest& request) const;
    std::string build_initiate_url() const;
    std::string with_user_project(const std::string& url) const;
    std::string checksum_header() const;
    void set_state(SessionState state);
    void report_progress();

    ResumableUploadConfig config_;
    std::shared_ptr<net::HttpTransport> transport_;
    std::shared_ptr<net::Authenticator> auth_;
    RetryPolicy retry_policy_;
    RetryState retry_state_;
    std::string cache_key_;

    ChunkPipeline pipeline_;
    std::shared_ptr<CancellationToken> cancel_token_;

    mutable std::mutex state_mutex_;
    SessionState state_ = SessionState::Uninitialized;
    std::string uri_;
    bool uri_provided_manually_ = false;

    std::optional<uint64_t> offset_;
    std::atomic<uint64_t> bytes_written_{0};
    std::vector<uint8_t> last_request_body_;  // retained for re-transmission
    std::vector<uint8_t> content_prefix_;
    std::optional<net::HttpResponse> finished_response_;

    std::string encryption_key_b64_;
    std::string encryption_key_sha256_b64_;

    std::promise<UploadResult> promise_;
    std::thread worker_;
    bool started_ = false;
};

}  // namespace objxfer
