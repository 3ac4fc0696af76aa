#include "objxfer/resumable_upload.hpp"
#include "objxfer/cancellation.hpp"
#include "objxfer/errors.hpp"
#include "objxfer/log.hpp"
#include "objxfer/metrics.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace objxfer {

namespace {

constexpr int RESUME_INCOMPLETE = 308;
constexpr size_t STREAM_READ_SIZE = 64 * 1024;

bool is_session_gone(int status) {
    return status == 404 || status == 410;
}

// "bytes=0-122" -> 123
std::optional<uint64_t> parse_acknowledged_range(const std::optional<std::string>& header) {
    if (!header) return std::nullopt;
    auto dash = header->rfind('-');
    if (dash == std::string::npos || dash + 1 >= header->size()) return std::nullopt;
    try {
        return std::stoull(header->substr(dash + 1)) + 1;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string describe(const TransferOutcome& outcome) {
    if (outcome.status_code == 0) return outcome.message;
    return "HTTP " + std::to_string(outcome.status_code) + ": " + outcome.message;
}

ErrorKind error_kind_for(const TransferOutcome& outcome) {
    if (outcome.cancelled) return ErrorKind::Cancelled;
    if (net::is_client_error_status(outcome.status_code) &&
        outcome.status_code != 408 && outcome.status_code != 429) {
        return ErrorKind::FatalCaller;
    }
    return ErrorKind::Transient;
}

std::string sha256_base64(const std::vector<uint8_t>& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest of encryption key failed");
    }
    return net::base64_encode(std::vector<uint8_t>(digest, digest + len));
}

}  // namespace

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::SessionCreated: return "session-created";
        case SessionState::Uploading: return "uploading";
        case SessionState::Restarting: return "restarting";
        case SessionState::Completed: return "completed";
        case SessionState::Errored: return "errored";
    }
    return "unknown";
}

std::string ResumableUploadConfig::validate() const {
    if (bucket.empty() || object.empty()) {
        return "A bucket and file name are required";
    }
    if (offset && uri.empty()) {
        return "Cannot provide an `offset` without providing a `uri`";
    }
    if (is_partial_upload && chunk_size == 0) {
        return "Cannot set `is_partial_upload` without providing a `chunk_size`";
    }
    if (chunk_size % CHUNK_GRANULARITY != 0) {
        return "chunk_size must be a multiple of " + std::to_string(CHUNK_GRANULARITY) + " bytes";
    }
    if (!encryption_key.empty() && encryption_key.size() != 32) {
        return "Customer-supplied encryption key must be 32 bytes, received " +
               std::to_string(encryption_key.size());
    }
    if (api_endpoint.empty()) {
        return "api_endpoint is required";
    }
    return "";
}

// ============================================================================
// Lifecycle
// ============================================================================

ResumableUpload::ResumableUpload(ResumableUploadConfig config,
                                 std::shared_ptr<net::HttpTransport> transport,
                                 std::shared_ptr<net::Authenticator> auth)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , auth_(std::move(auth))
    , retry_policy_(config_.retry)
    , retry_state_(retry_policy_.begin())
    , cache_key_(session_cache_key(config_.bucket, config_.object, config_.generation.value_or(0)))
    , pipeline_(std::max<size_t>(16 * 1024 * 1024, config_.chunk_size * 2),
                config_.validate_md5 && config_.client_md5.empty())
    , cancel_token_(std::make_shared<CancellationToken>()) {
    auto err = config_.validate();
    if (!err.empty()) {
        throw std::invalid_argument(err);
    }
    if (!transport_) {
        throw std::invalid_argument("ResumableUpload requires an HTTP transport");
    }

    while (!config_.api_endpoint.empty() && config_.api_endpoint.back() == '/') {
        config_.api_endpoint.pop_back();
    }

    if (!config_.encryption_key.empty()) {
        encryption_key_b64_ = net::base64_encode(config_.encryption_key);
        encryption_key_sha256_b64_ = sha256_base64(config_.encryption_key);
    }

    if (!config_.uri.empty()) {
        uri_ = config_.uri;
        uri_provided_manually_ = true;
        if (config_.offset) {
            // The caller's stream starts at the acknowledged offset
            offset_ = *config_.offset;
            bytes_written_ = *config_.offset;
        }
    }
}

ResumableUpload::~ResumableUpload() {
    if (worker_.joinable()) {
        auto s = state();
        if (s != SessionState::Completed && s != SessionState::Errored) {
            cancel();
        }
        worker_.join();
    }
}

std::future<UploadResult> ResumableUpload::start() {
    if (started_) {
        throw std::logic_error("Upload already started");
    }
    started_ = true;

    auto future = promise_.get_future();
    worker_ = std::thread([this] {
        std::optional<ScopedTimer> timer;
        if (config_.metrics) timer.emplace(config_.metrics->upload_duration());

        try {
            auto result = drive();
            if (config_.metrics) config_.metrics->uploads_success().Increment();
            // Reject writes past the end of a finished upload
            pipeline_.cancel();
            promise_.set_value(std::move(result));
        } catch (const std::exception& e) {
            set_state(SessionState::Errored);
            log_error("Upload of gs://%s/%s failed: %s",
                      config_.bucket.c_str(), config_.object.c_str(), e.what());
            if (config_.metrics) config_.metrics->uploads_failure().Increment();
            // Unblock a producer waiting on backpressure
            pipeline_.cancel();
            promise_.set_exception(std::current_exception());
        }
    });
    return future;
}

void ResumableUpload::write(std::span<const uint8_t> data) {
    pipeline_.write(data);
}

void ResumableUpload::write(std::string_view data) {
    pipeline_.write(data);
}

void ResumableUpload::finish() {
    pipeline_.close();
}

void ResumableUpload::cancel() {
    cancel_token_->cancel();
    pipeline_.cancel();
}

UploadResult ResumableUpload::upload_stream(std::istream& in) {
    auto future = start();

    std::vector<char> buffer(STREAM_READ_SIZE);
    try {
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = in.gcount();
            if (got <= 0) break;
            write(std::string_view(buffer.data(), static_cast<size_t>(got)));
        }
    } catch (const TransferError& e) {
        // The task failed and closed the pipeline; its error is in the future
        if (e.kind() != ErrorKind::Cancelled) throw;
        return future.get();
    }

    if (in.bad()) {
        cancel();
        future.wait();
        throw std::runtime_error("Read error on upload source for gs://" +
                                 config_.bucket + "/" + config_.object);
    }

    finish();
    return future.get();
}

SessionState ResumableUpload::state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

std::string ResumableUpload::uri() const {
    std::lock_guard lock(state_mutex_);
    return uri_;
}

void ResumableUpload::set_state(SessionState state) {
    std::lock_guard lock(state_mutex_);
    if (state_ != state) {
        log_debug("Upload %s: %s -> %s", cache_key_.c_str(),
                  session_state_to_string(state_), session_state_to_string(state));
    }
    state_ = state;
}

void ResumableUpload::report_progress() {
    if (config_.on_progress) {
        config_.on_progress(UploadProgress{bytes_written_.load(), config_.content_length});
    }
}

// ============================================================================
// State machine
// ============================================================================

UploadResult ResumableUpload::drive() {
    resume_from_store();

    for (;;) {
        if (cancel_token_->cancelled()) {
            throw TransferError(ErrorKind::Cancelled, "Upload cancelled");
        }

        switch (state()) {
            case SessionState::Uninitialized:
                if (uri().empty()) start_upload_session();
                set_state(SessionState::SessionCreated);
                break;

            case SessionState::SessionCreated:
                if (!offset_ && !sync_offset()) {
                    set_state(SessionState::Restarting);
                    break;
                }
                if (finished_response_) {
                    set_state(SessionState::Completed);
                    return finalize(*finished_response_);
                }
                set_state(SessionState::Uploading);
                break;

            case SessionState::Uploading:
                if (auto result = send_next_request()) {
                    set_state(SessionState::Completed);
                    return std::move(*result);
                }
                break;

            case SessionState::Restarting:
                restart();
                set_state(SessionState::Uninitialized);
                break;

            case SessionState::Completed:
            case SessionState::Errored:
                throw std::logic_error("Upload task resumed in a terminal state");
        }
    }
}

void ResumableUpload::resume_from_store() {
    if (!uri_.empty() || !config_.config_store) return;

    auto record = config_.config_store->get(cache_key_);
    if (!record || record->uri.empty()) return;

    if (!record->first_chunk.empty()) {
        auto head = pipeline_.peek(record->first_chunk.size());
        if (head != record->first_chunk) {
            throw TransferError(ErrorKind::FatalCaller,
                "Upload data for " + cache_key_ + " does not match the content of the "
                "persisted session. Remove the session record to start a new upload");
        }
    }

    {
        std::lock_guard lock(state_mutex_);
        uri_ = record->uri;
    }
    content_prefix_ = record->first_chunk;
    log_info("Resuming upload session for %s", cache_key_.c_str());
}

void ResumableUpload::start_upload_session() {
    if (bytes_written_ == 0) {
        content_prefix_ = pipeline_.peek(CONTENT_PREFIX_SIZE);
    }

    auto session_uri = create_uri();

    if (config_.config_store) {
        SessionRecord record;
        record.uri = session_uri;
        record.first_chunk = content_prefix_;
        config_.config_store->set(cache_key_, record);
    }
}

std::string ResumableUpload::create_uri() {
    auto metadata = config_.metadata.is_object() ? config_.metadata : nlohmann::json::object();

    // Content type and length travel as headers, not in the resource
    std::string content_type = config_.content_type;
    if (metadata.contains("contentType")) {
        if (content_type.empty() && metadata["contentType"].is_string()) {
            content_type = metadata["contentType"].get<std::string>();
        }
        metadata.erase("contentType");
    }
    metadata.erase("contentLength");

    auto request = net::HttpRequest::post(build_initiate_url(), metadata.dump());
    request.headers.set_content_type("application/json; charset=UTF-8");
    if (!content_type.empty()) {
        request.headers.set("X-Upload-Content-Type", content_type);
    }
    if (config_.content_length) {
        request.headers.set("X-Upload-Content-Length", std::to_string(*config_.content_length));
    }
    if (!config_.origin.empty()) {
        request.headers.set("Origin", config_.origin);
    }

    RequestContext context;
    context.method = net::HttpMethod::POST;
    context.has_precondition = config_.generation || config_.metageneration_match;
    context.creates_no_object = true;

    for (;;) {
        auto response = execute(request, context, "Session initiation");
        auto location = response.headers.get("location");
        if (location && !location->empty()) {
            {
                std::lock_guard lock(state_mutex_);
                uri_ = *location;
            }
            offset_ = 0;
            log_info("Created upload session for gs://%s/%s",
                     config_.bucket.c_str(), config_.object.c_str());
            log_debug("Session URI: %s", location->c_str());
            if (config_.on_uri) config_.on_uri(*location);
            return *location;
        }

        TransferOutcome outcome = TransferOutcome::from_response(response);
        outcome.malformed_response = true;
        outcome.message = "Session initiation response carried no session URI";
        backoff_or_throw(outcome, context, "Session initiation");
    }
}

std::optional<uint64_t> ResumableUpload::query_offset() {
    auto result = probe();
    switch (result.kind) {
        case ProbeResult::Kind::Incomplete:
            return result.offset;
        case ProbeResult::Kind::Finished: {
            auto metadata = nlohmann::json::parse(result.response.body_string(), nullptr, false);
            if (!metadata.is_discarded() && metadata.contains("size")) {
                const auto& size = metadata["size"];
                if (size.is_number_unsigned()) return size.get<uint64_t>();
                if (size.is_string()) {
                    try {
                        return std::stoull(size.get<std::string>());
                    } catch (const std::exception&) {
                        return result.offset;
                    }
                }
            }
            return result.offset;
        }
        case ProbeResult::Kind::Expired:
            return std::nullopt;
    }
    return std::nullopt;
}

ResumableUpload::ProbeResult ResumableUpload::probe() {
    auto session_uri = uri();
    if (session_uri.empty()) {
        throw std::logic_error("Offset probe requires a session URI");
    }

    net::HttpRequest request;
    request.method = net::HttpMethod::PUT;
    request.url = with_user_project(session_uri);
    request.headers.set("Content-Range", "bytes */*");
    request.headers.set_content_length(0);

    RequestContext context;
    context.method = net::HttpMethod::PUT;
    context.has_session_uri = true;

    ProbeResult result;
    result.response = execute(std::move(request), context, "Offset probe");

    int status = result.response.status_code;
    if (is_session_gone(status)) {
        result.kind = ProbeResult::Kind::Expired;
    } else if (status == RESUME_INCOMPLETE) {
        result.kind = ProbeResult::Kind::Incomplete;
        result.offset = parse_acknowledged_range(result.response.headers.get("range")).value_or(0);
    } else {
        result.kind = ProbeResult::Kind::Finished;
        result.offset = bytes_written_;
    }
    return result;
}

bool ResumableUpload::sync_offset() {
    auto result = probe();

    switch (result.kind) {
        case ProbeResult::Kind::Incomplete:
            offset_ = result.offset;
            log_debug("Session for %s holds %llu bytes", cache_key_.c_str(),
                      static_cast<unsigned long long>(result.offset));
            return true;

        case ProbeResult::Kind::Finished:
            offset_ = bytes_written_.load();
            finished_response_ = std::move(result.response);
            return true;

        case ProbeResult::Kind::Expired:
            if (uri_provided_manually_) {
                throw TransferError(ErrorKind::FatalCaller,
                    "Upload session " + uri() + " no longer exists (HTTP " +
                        std::to_string(result.response.status_code) +
                        "). The session URI was supplied by the caller and cannot be restarted",
                    result.response.status_code, retry_state_.attempt + 1);
            }
            log_warn("Upload session for %s expired (HTTP %d)",
                     cache_key_.c_str(), result.response.status_code);
            return false;
    }
    return false;
}

void ResumableUpload::restart() {
    if (bytes_written_ > 0) {
        throw TransferError(ErrorKind::FatalCaller,
            "Attempting to restart an upload after unrecoverable bytes have been written "
            "from upstream. Stopping as this could result in data loss. Initiate a new "
            "upload to continue.");
    }

    if (config_.config_store) {
        config_.config_store->remove(cache_key_);
    }
    if (config_.metrics) config_.metrics->session_restarts_total().Increment();

    {
        std::lock_guard lock(state_mutex_);
        uri_.clear();
    }
    offset_.reset();
    last_request_body_.clear();
    log_info("Restarting upload session for %s", cache_key_.c_str());
}

void ResumableUpload::rewind_last_request() {
    bytes_written_ -= last_request_body_.size();
    pipeline_.unshift(std::move(last_request_body_));
    last_request_body_.clear();
}

std::optional<UploadResult> ResumableUpload::send_next_request() {
    uint64_t offset = *offset_;
    uint64_t written = bytes_written_;

    if (offset < written) {
        uint64_t delta = written - offset;
        throw TransferError(ErrorKind::FatalCaller,
            "The offset is lower than the number of bytes written. The server has " +
                std::to_string(offset) + " bytes and while " + std::to_string(written) +
                " bytes has been uploaded - thus " + std::to_string(delta) +
                " bytes are missing. Stopping as this could result in data loss. "
                "Initiate a new upload to continue.");
    }

    if (written < offset) {
        // Fast-forward past bytes the server already holds
        uint64_t skipped = pipeline_.skip(offset - written);
        bytes_written_ += skipped;
        if (skipped < offset - written) {
            throw TransferError(ErrorKind::FatalCaller,
                "Upload data ended after " + std::to_string(written + skipped) +
                    " bytes but the session already holds " + std::to_string(offset));
        }
        written = offset;
    }

    bool multi_chunk = config_.chunk_size > 0;
    size_t limit = std::numeric_limits<size_t>::max();
    if (multi_chunk) {
        limit = config_.chunk_size;
        if (config_.content_length && *config_.content_length >= written) {
            limit = static_cast<size_t>(std::min<uint64_t>(limit, *config_.content_length - written));
        }
    }

    last_request_body_ = pipeline_.pull(limit);
    bool last = !multi_chunk || !pipeline_.wait_for_data();
    uint64_t size = last_request_body_.size();

    std::string total = "*";
    if (config_.content_length) {
        total = std::to_string(*config_.content_length);
    } else if (last && !config_.is_partial_upload) {
        total = std::to_string(written + size);
    }

    net::HttpRequest request;
    request.method = net::HttpMethod::PUT;
    request.url = with_user_project(uri());
    request.body = last_request_body_;
    request.headers.set("Content-Range", size == 0
        ? "bytes */" + total
        : "bytes " + std::to_string(written) + "-" + std::to_string(written + size - 1) + "/" + total);
    if (last && !config_.is_partial_upload) {
        auto hash = checksum_header();
        if (!hash.empty()) request.headers.set("X-Goog-Hash", hash);
    }

    bytes_written_ += size;
    report_progress();

    auto response = send(request);
    int status = response.status_code;

    if (status == RESUME_INCOMPLETE) {
        uint64_t acknowledged =
            parse_acknowledged_range(response.headers.get("range")).value_or(0);
        if (config_.metrics && acknowledged > offset) {
            config_.metrics->upload_bytes_total().Increment(static_cast<double>(acknowledged - offset));
        }

        uint64_t sent = bytes_written_;
        if (acknowledged < sent) {
            // Server kept less than was sent; resend the tail
            uint64_t missing = sent - acknowledged;
            if (missing <= last_request_body_.size()) {
                std::vector<uint8_t> tail(
                    last_request_body_.end() - static_cast<std::ptrdiff_t>(missing),
                    last_request_body_.end());
                pipeline_.unshift(std::move(tail));
                bytes_written_ -= missing;
            }
        }
        last_request_body_.clear();
        offset_ = acknowledged;

        if (last && config_.is_partial_upload && pipeline_.exhausted()) {
            log_info("Partial upload to %s paused at %llu bytes", cache_key_.c_str(),
                     static_cast<unsigned long long>(acknowledged));
            UploadResult result;
            result.uri = uri();
            result.size = acknowledged;
            result.partial = true;
            return result;
        }
        return std::nullopt;
    }

    if (net::is_success_status(status)) {
        if (config_.metrics && written + size > offset) {
            config_.metrics->upload_bytes_total().Increment(static_cast<double>(written + size - offset));
        }
        last_request_body_.clear();
        return finalize(response);
    }

    if (is_session_gone(status)) {
        rewind_last_request();
        offset_.reset();
        if (uri_provided_manually_) {
            throw TransferError(ErrorKind::FatalCaller,
                "Upload session " + uri() + " no longer exists (HTTP " + std::to_string(status) +
                    "). The session URI was supplied by the caller and cannot be restarted",
                status, retry_state_.attempt + 1);
        }
        log_warn("Upload session for %s expired mid-upload (HTTP %d)", cache_key_.c_str(), status);
        set_state(SessionState::Restarting);
        return std::nullopt;
    }

    // Unknown how much landed: put the request back and re-probe the offset
    auto outcome = TransferOutcome::from_response(response);
    rewind_last_request();
    offset_.reset();

    RequestContext context;
    context.method = net::HttpMethod::PUT;
    context.has_session_uri = true;
    backoff_or_throw(outcome, context, "Chunk upload");

    set_state(SessionState::SessionCreated);
    return std::nullopt;
}

UploadResult ResumableUpload::finalize(const net::HttpResponse& response) {
    auto metadata = nlohmann::json::parse(response.body_string(), nullptr, false);
    if (metadata.is_discarded() || !metadata.is_object()) {
        metadata = nlohmann::json::object();
    }

    UploadResult result;
    result.uri = uri();
    result.size = bytes_written_;

    // The JSON API reports size as a string
    if (metadata.contains("size")) {
        auto& size = metadata["size"];
        if (size.is_string()) {
            try {
                result.size = std::stoull(size.get<std::string>());
            } catch (const std::exception&) {
                log_warn("Unparseable object size '%s'", size.get<std::string>().c_str());
            }
        } else if (size.is_number_unsigned()) {
            result.size = size.get<uint64_t>();
        }
        size = result.size;
    }

    // The running checksums only cover the whole object when the stream did
    bool whole_stream = !config_.offset && pipeline_.closed();

    std::string client_crc = config_.client_crc32c;
    if (client_crc.empty() && config_.validate_crc32c && whole_stream) {
        client_crc = pipeline_.crc32c().to_string();
    }
    if (!client_crc.empty() && metadata.contains("crc32c") && metadata["crc32c"].is_string()) {
        auto server_crc = metadata["crc32c"].get<std::string>();
        if (server_crc != client_crc) {
            throw TransferError(ErrorKind::Integrity,
                "Upload mismatch: CRC32C checksum mismatch. Client calculated: " + client_crc +
                    ", Server returned: " + server_crc,
                response.status_code);
        }
    }

    std::string client_md5 = config_.client_md5;
    if (client_md5.empty() && config_.validate_md5 && whole_stream) {
        client_md5 = pipeline_.md5_base64();
    }
    if (!client_md5.empty() && metadata.contains("md5Hash") && metadata["md5Hash"].is_string()) {
        auto server_md5 = metadata["md5Hash"].get<std::string>();
        if (server_md5 != client_md5) {
            throw TransferError(ErrorKind::Integrity,
                "Upload mismatch: MD5 checksum mismatch. Client calculated: " + client_md5 +
                    ", Server returned: " + server_md5,
                response.status_code);
        }
    }

    if (config_.config_store) {
        config_.config_store->remove(cache_key_);
    }

    log_info("Uploaded gs://%s/%s (%llu bytes)", config_.bucket.c_str(), config_.object.c_str(),
             static_cast<unsigned long long>(result.size));
    result.metadata = std::move(metadata);
    return result;
}

// ============================================================================
// Requests
// ============================================================================

std::string ResumableUpload::build_initiate_url() const {
    std::string url = config_.api_endpoint + "/upload/storage/v1/b/" +
                      net::url_encode(config_.bucket) + "/o?uploadType=resumable&name=" +
                      net::url_encode(config_.object);
    if (config_.generation) {
        url += "&ifGenerationMatch=" + std::to_string(*config_.generation);
    }
    if (config_.metageneration_match) {
        url += "&ifMetagenerationMatch=" + std::to_string(*config_.metageneration_match);
    }
    if (!config_.kms_key_name.empty()) {
        url += "&kmsKeyName=" + net::url_encode(config_.kms_key_name);
    }
    if (!config_.predefined_acl.empty()) {
        url += "&predefinedAcl=" + net::url_encode(config_.predefined_acl);
    }
    if (!config_.user_project.empty()) {
        url += "&userProject=" + net::url_encode(config_.user_project);
    }
    return url;
}

std::string ResumableUpload::with_user_project(const std::string& url) const {
    if (config_.user_project.empty()) return url;
    char sep = url.find('?') == std::string::npos ? '?' : '&';
    return url + sep + "userProject=" + net::url_encode(config_.user_project);
}

std::string ResumableUpload::checksum_header() const {
    std::string header;
    bool whole_stream = !config_.offset && pipeline_.closed();

    if (!config_.client_crc32c.empty()) {
        header = "crc32c=" + config_.client_crc32c;
    } else if (config_.validate_crc32c && whole_stream) {
        header = "crc32c=" + pipeline_.crc32c().to_string();
    }

    std::string md5 = config_.client_md5;
    if (md5.empty() && config_.validate_md5 && whole_stream) {
        md5 = pipeline_.md5_base64();
    }
    if (!md5.empty()) {
        if (!header.empty()) header += ",";
        header += "md5=" + md5;
    }
    return header;
}

void ResumableUpload::apply_common(net::HttpRequest& request) const {
    if (auth_) auth_->authorize(request);
    if (!encryption_key_b64_.empty()) {
        request.headers.set("x-goog-encryption-algorithm", "AES256");
        request.headers.set("x-goog-encryption-key", encryption_key_b64_);
        request.headers.set("x-goog-encryption-key-sha256", encryption_key_sha256_b64_);
    }
}

net::HttpResponse ResumableUpload::send(net::HttpRequest& request) {
    apply_common(request);
    request.cancel_token = cancel_token_;
    request.total_timeout = config_.request_timeout;

    net::HttpResponse response;
    if (config_.metrics) {
        ScopedTimer timer(config_.metrics->request_duration());
        response = transport_->execute(request);
    } else {
        response = transport_->execute(request);
    }

    if (response.cancelled || cancel_token_->cancelled()) {
        throw TransferError(ErrorKind::Cancelled, "Upload cancelled", 0, retry_state_.attempt + 1);
    }
    return response;
}

net::HttpResponse ResumableUpload::execute(net::HttpRequest request, const RequestContext& context,
                                           const char* what) {
    for (;;) {
        auto response = send(request);
        int status = response.status_code;

        if (net::is_success_status(status) || status == RESUME_INCOMPLETE) {
            return response;
        }
        // Expiry of a known session is the caller's to handle
        if (context.has_session_uri && is_session_gone(status)) {
            return response;
        }

        backoff_or_throw(TransferOutcome::from_response(response), context, what);
    }
}

void ResumableUpload::backoff_or_throw(const TransferOutcome& outcome, const RequestContext& context,
                                       const char* what) {
    if (!retry_policy_.should_retry(outcome, context)) {
        throw TransferError(error_kind_for(outcome),
                            std::string(what) + " failed: " + describe(outcome),
                            outcome.status_code, retry_state_.attempt + 1);
    }

    auto delay = retry_policy_.next_delay(retry_state_, outcome);
    log_warn("%s failed (%s), retry %d in %lld ms", what, describe(outcome).c_str(),
             retry_state_.attempt, static_cast<long long>(delay.count()));
    if (config_.metrics) config_.metrics->retries_total().Increment();

    if (!retry_policy_.wait(delay, cancel_token_.get())) {
        throw TransferError(ErrorKind::Cancelled, "Upload cancelled",
                            outcome.status_code, retry_state_.attempt);
    }
}

}  // namespace objxfer
