#include "objxfer/object_client.hpp"
#include "objxfer/cancellation.hpp"
#include "objxfer/crc32c.hpp"
#include "objxfer/errors.hpp"
#include "objxfer/log.hpp"
#include "objxfer/metrics.hpp"

#include <stdexcept>

namespace objxfer {

namespace {

std::string json_string(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "";
}

// The JSON API encodes 64-bit integers as strings
uint64_t json_uint64(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return 0;
    const auto& v = j[key];
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer()) return static_cast<uint64_t>(v.get<int64_t>());
    if (v.is_string()) {
        try {
            return std::stoull(v.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

// x-goog-hash: crc32c=AAAAAA==,md5=1B2M2Y8AsgTpgAmY7PhCfg==
std::string hash_from_header(const std::vector<std::string>& values, const std::string& name) {
    std::string prefix = name + "=";
    for (const auto& value : values) {
        size_t pos = 0;
        while (pos < value.size()) {
            size_t comma = value.find(',', pos);
            if (comma == std::string::npos) comma = value.size();
            std::string item = value.substr(pos, comma - pos);
            while (!item.empty() && item.front() == ' ') item.erase(item.begin());
            if (item.rfind(prefix, 0) == 0) return item.substr(prefix.size());
            pos = comma + 1;
        }
    }
    return "";
}

std::string describe(const TransferOutcome& outcome) {
    if (outcome.status_code == 0) return outcome.message;
    return "HTTP " + std::to_string(outcome.status_code) + ": " + outcome.message;
}

}  // namespace

ObjectMetadata ObjectMetadata::from_json(const nlohmann::json& j) {
    ObjectMetadata meta;
    if (!j.is_object()) return meta;
    meta.bucket = json_string(j, "bucket");
    meta.name = json_string(j, "name");
    meta.size = json_uint64(j, "size");
    meta.generation = static_cast<int64_t>(json_uint64(j, "generation"));
    meta.etag = json_string(j, "etag");
    meta.content_type = json_string(j, "contentType");
    meta.crc32c = json_string(j, "crc32c");
    meta.md5_hash = json_string(j, "md5Hash");
    meta.raw = j;
    return meta;
}

ObjectClient::ObjectClient(ObjectClientOptions options,
                           std::shared_ptr<net::HttpTransport> transport,
                           std::shared_ptr<net::Authenticator> auth)
    : options_(std::move(options))
    , transport_(std::move(transport))
    , auth_(std::move(auth))
    , retry_policy_(options_.retry) {
    if (!transport_) {
        throw std::invalid_argument("ObjectClient requires an HTTP transport");
    }
    while (!options_.api_endpoint.empty() && options_.api_endpoint.back() == '/') {
        options_.api_endpoint.pop_back();
    }
}

std::string ObjectClient::object_url(const std::string& bucket, const std::string& object) const {
    return options_.api_endpoint + "/storage/v1/b/" + net::url_encode(bucket) + "/o/" +
           net::url_encode(object);
}

std::string ObjectClient::append_user_project(std::string url) const {
    if (options_.user_project.empty()) return url;
    url += url.find('?') == std::string::npos ? '?' : '&';
    url += "userProject=" + net::url_encode(options_.user_project);
    return url;
}

net::HttpResponse ObjectClient::execute(net::HttpRequest request, const RequestContext& context,
                                        const std::string& what, bool allow_not_found) {
    auto state = retry_policy_.begin();
    request.total_timeout = options_.request_timeout;
    if (auth_) auth_->authorize(request);

    for (;;) {
        net::HttpResponse response;
        if (options_.metrics) {
            ScopedTimer timer(options_.metrics->request_duration());
            response = transport_->execute(request);
        } else {
            response = transport_->execute(request);
        }

        if (response.cancelled) {
            throw TransferError(ErrorKind::Cancelled, what + " cancelled", 0, state.attempt + 1);
        }
        if (response.ok() || (allow_not_found && response.status_code == 404)) {
            return response;
        }

        auto outcome = TransferOutcome::from_response(response);
        if (!retry_policy_.should_retry(outcome, context)) {
            ErrorKind kind = net::is_client_error_status(outcome.status_code) &&
                             outcome.status_code != 408 && outcome.status_code != 429
                ? ErrorKind::FatalCaller : ErrorKind::Transient;
            throw TransferError(kind, what + " failed: " + describe(outcome),
                                outcome.status_code, state.attempt + 1);
        }

        auto delay = retry_policy_.next_delay(state, outcome);
        log_warn("%s failed (%s), retry %d in %lld ms", what.c_str(), describe(outcome).c_str(),
                 state.attempt, static_cast<long long>(delay.count()));
        if (options_.metrics) options_.metrics->retries_total().Increment();

        if (!retry_policy_.wait(delay, request.cancel_token.get())) {
            throw TransferError(ErrorKind::Cancelled, what + " cancelled", 0, state.attempt);
        }
    }
}

std::optional<ObjectMetadata> ObjectClient::get_metadata(const std::string& bucket,
                                                         const std::string& object) {
    auto request = net::HttpRequest::get(append_user_project(object_url(bucket, object)));

    RequestContext context;
    context.method = net::HttpMethod::GET;
    auto response = execute(std::move(request), context,
                            "Metadata request for gs://" + bucket + "/" + object, true);
    if (response.status_code == 404) {
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(response.body_string(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw TransferError(ErrorKind::Transient,
                            "Malformed metadata response for gs://" + bucket + "/" + object,
                            response.status_code);
    }
    return ObjectMetadata::from_json(j);
}

uint64_t ObjectClient::download(const std::string& bucket, const std::string& object,
                                const net::HttpBodySink& sink, const DownloadOptions& options) {
    std::string url = object_url(bucket, object) + "?alt=media";
    if (options.generation) {
        url += "&generation=" + std::to_string(*options.generation);
    }
    url = append_user_project(url);

    bool whole_object = !options.range_start && !options.range_end;
    uint64_t start = options.range_start.value_or(0);
    uint64_t received = 0;
    Crc32c crc;
    std::vector<std::string> hash_headers;

    auto state = retry_policy_.begin();
    RequestContext context;
    context.method = net::HttpMethod::GET;
    std::string what = "Download of gs://" + bucket + "/" + object;

    std::optional<ScopedTimer> timer;
    if (options_.metrics) timer.emplace(options_.metrics->download_duration());

    for (;;) {
        auto request = net::HttpRequest::get(url);
        request.total_timeout = options_.request_timeout;
        request.cancel_token = options.cancel_token;
        if (auth_) auth_->authorize(request);

        // Resume after the last byte handed to the sink
        uint64_t from = start + received;
        if (options.range_end) {
            if (from > *options.range_end) break;
            request.byte_range = std::make_pair(from, *options.range_end);
        } else if (from > 0) {
            request.headers.set("Range", "bytes=" + std::to_string(from) + "-");
        }

        request.body_sink = [&](const uint8_t* data, size_t size) {
            crc.update(std::span<const uint8_t>(data, size));
            received += size;
            return sink(data, size);
        };

        auto response = transport_->execute(request);
        if (response.cancelled) {
            if (options_.metrics) options_.metrics->downloads_failure().Increment();
            throw TransferError(ErrorKind::Cancelled, what + " cancelled", 0, state.attempt + 1);
        }
        if (response.ok()) {
            hash_headers = response.headers.get_all("x-goog-hash");
            break;
        }
        // 416 once every byte of an open-ended resume has arrived
        if (response.status_code == 416 && received > 0) {
            break;
        }

        auto outcome = TransferOutcome::from_response(response);
        if (!retry_policy_.should_retry(outcome, context)) {
            if (options_.metrics) options_.metrics->downloads_failure().Increment();
            ErrorKind kind = response.status_code >= 400 && response.status_code < 500 &&
                             response.status_code != 408 && response.status_code != 429
                ? ErrorKind::FatalCaller : ErrorKind::Transient;
            throw TransferError(kind, what + " failed: " + describe(outcome),
                                outcome.status_code, state.attempt + 1);
        }

        std::chrono::milliseconds delay;
        try {
            delay = retry_policy_.next_delay(state, outcome);
        } catch (const RetryLimitExceeded&) {
            if (options_.metrics) options_.metrics->downloads_failure().Increment();
            throw;
        }
        log_warn("%s interrupted after %llu bytes (%s), retry %d in %lld ms", what.c_str(),
                 static_cast<unsigned long long>(received), describe(outcome).c_str(),
                 state.attempt, static_cast<long long>(delay.count()));
        if (options_.metrics) options_.metrics->retries_total().Increment();

        if (!retry_policy_.wait(delay, options.cancel_token.get())) {
            throw TransferError(ErrorKind::Cancelled, what + " cancelled", 0, state.attempt);
        }
    }

    if (whole_object && options.validate_crc32c) {
        auto server_crc = hash_from_header(hash_headers, "crc32c");
        if (!server_crc.empty() && !crc.validate(std::string_view(server_crc))) {
            if (options_.metrics) options_.metrics->downloads_failure().Increment();
            throw TransferError(ErrorKind::Integrity,
                "CONTENT_DOWNLOAD_MISMATCH: the downloaded content of gs://" + bucket + "/" + object +
                    " does not match the server checksum. Client calculated: " + crc.to_string() +
                    ", Server returned: " + server_crc);
        }
    }

    if (options_.metrics) {
        options_.metrics->downloads_success().Increment();
        options_.metrics->download_bytes_total().Increment(static_cast<double>(received));
    }
    log_debug("%s: %llu bytes", what.c_str(), static_cast<unsigned long long>(received));
    return received;
}

std::vector<uint8_t> ObjectClient::download_to_memory(const std::string& bucket,
                                                      const std::string& object,
                                                      const DownloadOptions& options) {
    std::vector<uint8_t> out;
    download(bucket, object, [&out](const uint8_t* data, size_t size) {
        out.insert(out.end(), data, data + size);
        return true;
    }, options);
    return out;
}

ObjectMetadata ObjectClient::upload_media(const std::string& bucket, const std::string& object,
                                          std::span<const uint8_t> data,
                                          const MediaUploadOptions& options) {
    std::string url = options_.api_endpoint + "/upload/storage/v1/b/" + net::url_encode(bucket) +
                      "/o?uploadType=media&name=" + net::url_encode(object);
    if (options.if_generation_match) {
        url += "&ifGenerationMatch=" + std::to_string(*options.if_generation_match);
    }
    if (!options.predefined_acl.empty()) {
        url += "&predefinedAcl=" + net::url_encode(options.predefined_acl);
    }
    if (!options.kms_key_name.empty()) {
        url += "&kmsKeyName=" + net::url_encode(options.kms_key_name);
    }
    url = append_user_project(url);

    auto request = net::HttpRequest::post(url, std::vector<uint8_t>(data.begin(), data.end()));
    request.headers.set_content_type(options.content_type);

    Crc32c crc;
    crc.update(data);
    request.headers.set("X-Goog-Hash", "crc32c=" + crc.to_string());

    RequestContext context;
    context.method = net::HttpMethod::POST;
    context.has_precondition = options.if_generation_match.has_value();

    std::optional<ScopedTimer> timer;
    if (options_.metrics) timer.emplace(options_.metrics->upload_duration());

    net::HttpResponse response;
    try {
        response = execute(std::move(request), context,
                           "Upload of gs://" + bucket + "/" + object, false);
    } catch (const TransferError&) {
        if (options_.metrics) options_.metrics->uploads_failure().Increment();
        throw;
    }

    auto j = nlohmann::json::parse(response.body_string(), nullptr, false);
    auto meta = ObjectMetadata::from_json(j.is_discarded() ? nlohmann::json::object() : j);
    if (!meta.crc32c.empty() && !crc.validate(std::string_view(meta.crc32c))) {
        if (options_.metrics) options_.metrics->uploads_failure().Increment();
        throw TransferError(ErrorKind::Integrity,
            "Upload mismatch: CRC32C checksum mismatch. Client calculated: " + crc.to_string() +
                ", Server returned: " + meta.crc32c,
            response.status_code);
    }

    if (options_.metrics) {
        options_.metrics->uploads_success().Increment();
        options_.metrics->upload_bytes_total().Increment(static_cast<double>(data.size()));
    }
    return meta;
}

std::unique_ptr<ResumableUpload> ObjectClient::create_resumable_upload(ResumableUploadConfig config) const {
    config.api_endpoint = options_.api_endpoint;
    config.retry = options_.retry;
    config.request_timeout = options_.request_timeout;
    if (config.user_project.empty()) config.user_project = options_.user_project;
    if (!config.metrics) config.metrics = options_.metrics;
    return std::make_unique<ResumableUpload>(std::move(config), transport_, auth_);
}

}  // namespace objxfer
