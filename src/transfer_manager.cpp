#include "objxfer/transfer_manager.hpp"
#include "objxfer/crc32c.hpp"
#include "objxfer/log.hpp"
#include "objxfer/metrics.hpp"
#include "objxfer/thread_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <future>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace objxfer {

namespace fs = std::filesystem;

// ============================================================================
// XML parsing helpers for multipart responses
// ============================================================================

namespace xml {

// Value between <tag>value</tag>, empty if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }

    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '&': result += "&amp;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

}  // namespace xml

namespace {

std::string describe(const TransferOutcome& outcome) {
    if (outcome.status_code == 0) return outcome.message;
    return "HTTP " + std::to_string(outcome.status_code) + ": " + outcome.message;
}

// Object names keep '/' between segments
std::string encode_object_path(const std::string& object) {
    std::string result;
    size_t pos = 0;
    while (true) {
        size_t slash = object.find('/', pos);
        result += net::url_encode(object.substr(pos, slash - pos));
        if (slash == std::string::npos) break;
        result += '/';
        pos = slash + 1;
    }
    return result;
}

std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

std::vector<uint8_t> read_range(const fs::path& path, uint64_t offset, size_t size) {
    std::vector<uint8_t> data(size);
    if (size == 0) return data;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + path.string());
    }
    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (static_cast<size_t>(file.gcount()) != size) {
        throw std::runtime_error("Short read from " + path.string() + " at offset " +
                                 std::to_string(offset));
    }
    return data;
}

std::vector<uint8_t> read_whole_file(const fs::path& path) {
    return read_range(path, 0, static_cast<size_t>(fs::file_size(path)));
}

// A failed abort must not mask the error that triggered it
void abort_after_failure(MultipartUploader& uploader, const std::string& upload_id) {
    try {
        uploader.abort_upload(upload_id);
    } catch (const TransferError& e) {
        log_warn("Failed to abort multipart upload %s: %s", upload_id.c_str(), e.what());
    }
}

bool has_prefix(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

// ============================================================================
// Parallel batch execution
// ============================================================================

const char* job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::InFlight: return "in-flight";
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::Failed: return "failed";
        case JobStatus::Skipped: return "skipped";
    }
    return "unknown";
}

void BatchResult::throw_if_failed() const {
    if (failed.empty()) return;

    size_t total = succeeded.size() + failed.size() + skipped.size();
    std::ostringstream msg;
    msg << failed.size() << " of " << total << " transfers failed";
    if (!skipped.empty()) {
        msg << " (" << skipped.size() << " not started)";
    }
    msg << ": " << failed.front().job.source << ": " << failed.front().message;
    throw TransferError(ErrorKind::PartialBatch, msg.str());
}

BatchResult run_many(std::vector<TransferJob> jobs, const JobWorker& worker,
                     const BatchOptions& options) {
    BatchResult result;
    if (jobs.empty()) return result;

    size_t limit = options.concurrency_limit ? options.concurrency_limit : DEFAULT_CONCURRENCY_LIMIT;
    std::vector<ErrorKind> kinds(jobs.size(), ErrorKind::Transient);
    std::atomic<bool> stop_dispatch{false};

    {
        ThreadPool pool(std::min(limit, jobs.size()));
        std::vector<std::future<void>> futures;
        futures.reserve(jobs.size());

        for (size_t i = 0; i < jobs.size(); ++i) {
            futures.push_back(pool.submit([&, i] {
                TransferJob& job = jobs[i];
                if (options.fail_fast && stop_dispatch.load()) {
                    job.status = JobStatus::Skipped;
                    return;
                }

                job.status = JobStatus::InFlight;
                if (options.metrics) options.metrics->jobs_in_flight().Increment();

                try {
                    worker(job);
                    job.status = JobStatus::Succeeded;
                } catch (const TransferError& e) {
                    job.status = JobStatus::Failed;
                    job.error = e.what();
                    kinds[i] = e.kind();
                    stop_dispatch = true;
                } catch (const std::exception& e) {
                    job.status = JobStatus::Failed;
                    job.error = e.what();
                    stop_dispatch = true;
                } catch (...) {
                    job.status = JobStatus::Failed;
                    job.error = "unknown error";
                    stop_dispatch = true;
                }

                if (options.metrics) options.metrics->jobs_in_flight().Decrement();
            }));
        }

        for (auto& fut : futures) {
            fut.get();
        }
    }

    for (size_t i = 0; i < jobs.size(); ++i) {
        auto& job = jobs[i];
        switch (job.status) {
            case JobStatus::Succeeded:
                result.succeeded.push_back(job);
                break;
            case JobStatus::Failed:
                log_warn("Transfer failed: %s -> %s: %s", job.source.c_str(),
                         job.destination.c_str(), job.error.c_str());
                result.failed.push_back({job, job.error, kinds[i]});
                break;
            default:
                job.status = JobStatus::Skipped;
                result.skipped.push_back(job);
                break;
        }
    }

    if (options.metrics) {
        options.metrics->jobs_succeeded().Increment(static_cast<double>(result.succeeded.size()));
        options.metrics->jobs_failed().Increment(static_cast<double>(result.failed.size()));
        options.metrics->jobs_skipped().Increment(static_cast<double>(result.skipped.size()));
    }

    log_info("Batch complete: %zu succeeded, %zu failed, %zu skipped",
             result.succeeded.size(), result.failed.size(), result.skipped.size());
    return result;
}

// ============================================================================
// XmlMultipartUploader
// ============================================================================

XmlMultipartUploader::XmlMultipartUploader(XmlMultipartConfig config,
                                           std::shared_ptr<net::HttpTransport> transport,
                                           std::shared_ptr<net::Authenticator> auth)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , auth_(std::move(auth))
    , retry_policy_(config_.retry) {
    if (!transport_) {
        throw std::invalid_argument("XmlMultipartUploader requires an HTTP transport");
    }
    if (config_.bucket.empty() || config_.object.empty()) {
        throw std::invalid_argument("A bucket and object name are required");
    }

    std::string endpoint = config_.xml_endpoint;
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    if (endpoint.empty()) {
        object_url_ = "https://" + config_.bucket + ".storage.googleapis.com/" +
                      encode_object_path(config_.object);
    } else {
        object_url_ = endpoint + "/" + net::url_encode(config_.bucket) + "/" +
                      encode_object_path(config_.object);
    }
}

net::HttpResponse XmlMultipartUploader::execute(net::HttpRequest request,
                                                const RequestContext& context,
                                                const std::string& what) {
    auto state = retry_policy_.begin();
    request.total_timeout = config_.request_timeout;
    if (auth_) auth_->authorize(request);

    for (;;) {
        net::HttpResponse response;
        if (config_.metrics) {
            ScopedTimer timer(config_.metrics->request_duration());
            response = transport_->execute(request);
        } else {
            response = transport_->execute(request);
        }

        if (response.cancelled) {
            throw TransferError(ErrorKind::Cancelled, what + " cancelled", 0, state.attempt + 1);
        }
        if (response.ok()) {
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
        if (config_.metrics) config_.metrics->retries_total().Increment();
        if (!retry_policy_.wait(delay, request.cancel_token.get())) {
            throw TransferError(ErrorKind::Cancelled, what + " cancelled", 0, state.attempt);
        }
    }
}

std::string XmlMultipartUploader::initiate_upload() {
    auto request = net::HttpRequest::post(object_url_ + "?uploads", std::vector<uint8_t>{});
    if (!config_.content_type.empty()) {
        request.headers.set_content_type(config_.content_type);
    }
    for (const auto& [name, value] : config_.headers) {
        request.headers.set(name, value);
    }

    RequestContext context;
    context.method = net::HttpMethod::POST;
    context.creates_no_object = true;

    auto response = execute(std::move(request), context, "Multipart initiation");
    std::string upload_id = xml::decode_entities(xml::get_element(response.body_string(), "UploadId"));
    if (upload_id.empty()) {
        throw TransferError(ErrorKind::Transient,
                            "Multipart initiation returned no UploadId", response.status_code);
    }

    log_info("Initiated multipart upload for %s", config_.object.c_str());
    log_debug("Upload id: %s", upload_id.c_str());
    return upload_id;
}

std::string XmlMultipartUploader::upload_part(const std::string& upload_id, int part_number,
                                              std::span<const uint8_t> data) {
    std::string url = object_url_ + "?partNumber=" + std::to_string(part_number) +
                      "&uploadId=" + net::url_encode(upload_id);
    auto request = net::HttpRequest::put(url, std::vector<uint8_t>(data.begin(), data.end()));

    // Re-sending a part replaces it
    RequestContext context;
    context.method = net::HttpMethod::PUT;
    context.creates_no_object = true;

    auto response = execute(std::move(request), context,
                            "Part " + std::to_string(part_number) + " upload");

    // ETag comes quoted; the quotes are kept for CompleteMultipartUpload
    std::string etag = ensure_etag_quotes(response.headers.get("ETag").value_or(""));
    if (etag.empty()) {
        throw TransferError(ErrorKind::Transient,
                            "Part " + std::to_string(part_number) + " upload returned no ETag",
                            response.status_code);
    }
    log_debug("Uploaded part %d (%zu bytes)", part_number, data.size());
    return etag;
}

std::string build_complete_multipart_xml(const std::map<int, std::string>& parts_map) {
    std::ostringstream body;
    body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    body << "<CompleteMultipartUpload>\n";
    // std::map iterates in ascending part number
    for (const auto& [part_number, etag] : parts_map) {
        body << "  <Part>\n";
        body << "    <PartNumber>" << part_number << "</PartNumber>\n";
        body << "    <ETag>" << xml::escape(etag) << "</ETag>\n";
        body << "  </Part>\n";
    }
    body << "</CompleteMultipartUpload>";
    return body.str();
}

nlohmann::json XmlMultipartUploader::complete_upload(const MultipartState& state) {
    std::string url = object_url_ + "?uploadId=" + net::url_encode(state.upload_id);
    auto request = net::HttpRequest::post(url, build_complete_multipart_xml(state.parts_map));
    request.headers.set_content_type("application/xml");

    RequestContext context;
    context.method = net::HttpMethod::POST;

    auto response = execute(std::move(request), context, "Multipart completion");
    std::string body = response.body_string();

    // Completion can report an error inside a 200 response
    std::string error_code = xml::get_element(body, "Code");
    if (body.find("<Error>") != std::string::npos) {
        throw TransferError(ErrorKind::Transient,
                            "Multipart completion failed: " + error_code + ": " +
                                xml::decode_entities(xml::get_element(body, "Message")),
                            response.status_code);
    }

    nlohmann::json metadata = nlohmann::json::object();
    metadata["bucket"] = config_.bucket;
    metadata["name"] = config_.object;
    std::string etag = xml::decode_entities(xml::get_element(body, "ETag"));
    if (!etag.empty()) metadata["etag"] = ensure_etag_quotes(etag);
    std::string location = xml::decode_entities(xml::get_element(body, "Location"));
    if (!location.empty()) metadata["location"] = location;

    log_info("Completed multipart upload of %s (%zu parts)",
             config_.object.c_str(), state.parts_map.size());
    return metadata;
}

void XmlMultipartUploader::abort_upload(const std::string& upload_id) {
    auto request = net::HttpRequest::del(object_url_ + "?uploadId=" + net::url_encode(upload_id));

    RequestContext context;
    context.method = net::HttpMethod::DELETE;
    context.creates_no_object = true;

    execute(std::move(request), context, "Multipart abort");
    log_info("Aborted multipart upload of %s", config_.object.c_str());
}

// ============================================================================
// upload_file_in_chunks
// ============================================================================

ChunkedUploadResult upload_file_in_chunks(MultipartUploader& uploader,
                                          const fs::path& path,
                                          const ChunkedUploadOptions& options) {
    ChunkedUploadResult result;

    if (options.abort_existing) {
        if (options.upload_id.empty()) {
            throw std::invalid_argument("abort_existing requires an upload_id");
        }
        uploader.abort_upload(options.upload_id);
        result.state.upload_id = options.upload_id;
        result.aborted = true;
        return result;
    }

    if (options.chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be greater than zero");
    }

    uint64_t file_size = fs::file_size(path);
    result.size = file_size;

    // 1. Initiate, unless resuming
    MultipartState& state = result.state;
    state.parts_map = options.parts_map;
    if (options.upload_id.empty()) {
        state.upload_id = uploader.initiate_upload();
    } else {
        state.upload_id = options.upload_id;
        log_info("Resuming multipart upload of %s with %zu parts already uploaded",
                 path.c_str(), state.parts_map.size());
    }

    // 2. Build part list
    struct PartRange { int number = 0; uint64_t offset = 0; size_t size = 0; };
    std::vector<PartRange> parts;
    uint64_t off = 0;
    int pn = 1;
    do {
        size_t part_size = static_cast<size_t>(
            std::min<uint64_t>(options.chunk_size, file_size - off));
        parts.push_back({pn++, off, part_size});
        off += part_size;
    } while (off < file_size);

    // 3. Checksum every part; upload only the missing ones
    std::vector<Crc32c> part_crcs(parts.size());
    std::mutex state_mutex;
    std::atomic<size_t> uploaded{0};
    std::string first_error;
    ErrorKind first_kind = ErrorKind::Transient;

    {
        size_t limit = options.concurrency_limit ? options.concurrency_limit : DEFAULT_CONCURRENCY_LIMIT;
        ThreadPool pool(std::min(limit, parts.size()));
        std::vector<std::future<void>> futures;

        for (size_t i = 0; i < parts.size(); ++i) {
            futures.push_back(pool.submit([&, i] {
                const auto& part = parts[i];
                bool resumed;
                {
                    std::lock_guard lock(state_mutex);
                    resumed = state.parts_map.count(part.number) > 0;
                }

                try {
                    auto data = read_range(path, part.offset, part.size);
                    part_crcs[i].update(std::span<const uint8_t>(data));
                    if (resumed) return;

                    std::string etag = uploader.upload_part(state.upload_id, part.number, data);
                    std::lock_guard lock(state_mutex);
                    state.parts_map[part.number] = etag;
                    ++uploaded;
                    if (options.metrics) options.metrics->parts_uploaded().Increment();
                } catch (const TransferError& e) {
                    std::lock_guard lock(state_mutex);
                    if (first_error.empty()) {
                        first_error = "Part " + std::to_string(part.number) + ": " + e.what();
                        first_kind = e.kind();
                    }
                } catch (const std::exception& e) {
                    std::lock_guard lock(state_mutex);
                    if (first_error.empty()) {
                        first_error = "Part " + std::to_string(part.number) + ": " + e.what();
                    }
                }
            }));
        }

        for (auto& fut : futures) {
            fut.get();
        }
    }

    result.parts_uploaded = uploaded.load();
    result.parts_resumed = parts.size() - result.parts_uploaded;
    if (options.metrics && !first_error.empty()) {
        options.metrics->uploads_failure().Increment();
    }

    if (!first_error.empty()) {
        std::string msg = "Multipart upload of " + path.string() + " failed: " + first_error;
        if (options.auto_abort_failure) {
            abort_after_failure(uploader, state.upload_id);
            throw TransferError(first_kind, msg + " (upload aborted)");
        }
        throw MultipartUploadError(msg, state.upload_id, state.parts_map);
    }
    if (options.metrics) {
        size_t resumed_parts = parts.size() - result.parts_uploaded;
        if (resumed_parts) options.metrics->parts_resumed().Increment(static_cast<double>(resumed_parts));
    }

    // 4. Complete
    try {
        result.metadata = uploader.complete_upload(state);
    } catch (const TransferError& e) {
        if (options.metrics) options.metrics->uploads_failure().Increment();
        if (options.auto_abort_failure) {
            abort_after_failure(uploader, state.upload_id);
            throw;
        }
        throw MultipartUploadError(std::string("Multipart completion failed: ") + e.what(),
                                   state.upload_id, state.parts_map);
    }

    Crc32c combined;
    for (size_t i = 0; i < parts.size(); ++i) {
        combined = Crc32c::combine(combined, part_crcs[i], parts[i].size);
    }
    result.crc32c = combined.to_string();

    if (options.metrics) {
        options.metrics->uploads_success().Increment();
        options.metrics->upload_bytes_total().Increment(static_cast<double>(file_size));
    }
    return result;
}

// ============================================================================
// TransferManager
// ============================================================================

TransferManager::TransferManager(std::string bucket, ObjectClient& client, std::string xml_endpoint)
    : bucket_(std::move(bucket))
    , client_(client)
    , xml_endpoint_(std::move(xml_endpoint)) {
    if (bucket_.empty()) {
        throw std::invalid_argument("TransferManager requires a bucket");
    }
}

std::string TransferManager::object_name_for(const fs::path& path, const std::string& prefix) {
    std::string name = path.lexically_normal().generic_string();
    while (!name.empty() && name.front() == '/') {
        name.erase(name.begin());
    }
    std::replace(name.begin(), name.end(), '\\', '/');

    if (prefix.empty()) return name;

    std::string joined = prefix;
    while (!joined.empty() && joined.back() == '/') {
        joined.pop_back();
    }
    return joined.empty() ? name : joined + "/" + name;
}

fs::path TransferManager::local_path_for(const std::string& object,
                                         const DownloadManyOptions& options) {
    std::string name = object;
    if (!options.strip_prefix.empty() && has_prefix(name, options.strip_prefix)) {
        name = name.substr(options.strip_prefix.size());
    }

    fs::path relative = options.prefix.empty() ? fs::path(name) : fs::path(options.prefix) / name;
    relative = relative.lexically_normal();
    if (relative.is_absolute() || (!relative.empty() && *relative.begin() == "..")) {
        throw TransferError(ErrorKind::FatalCaller,
                            "Object " + object + " maps outside the destination directory");
    }
    return options.destination_dir / relative;
}

BatchResult TransferManager::upload_many_files(const std::vector<fs::path>& paths,
                                               const UploadManyOptions& options) {
    std::vector<TransferJob> jobs;
    auto add_job = [&](const fs::path& file) {
        TransferJob job;
        job.source = file.string();
        job.destination = options.destination_builder ? options.destination_builder(file)
                                                      : object_name_for(file, options.prefix);
        std::error_code ec;
        auto size = fs::file_size(file, ec);
        job.size_bytes = ec ? 0 : size;
        jobs.push_back(std::move(job));
    };

    for (const auto& path : paths) {
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            std::vector<fs::path> files;
            for (const auto& entry : fs::recursive_directory_iterator(path)) {
                if (entry.is_regular_file()) files.push_back(entry.path());
            }
            std::sort(files.begin(), files.end());
            for (const auto& file : files) add_job(file);
        } else {
            add_job(path);
        }
    }

    log_info("Uploading %zu files to gs://%s", jobs.size(), bucket_.c_str());

    auto worker = [&](TransferJob& job) {
        if (!fs::is_regular_file(job.source)) {
            throw TransferError(ErrorKind::FatalCaller, "Not a regular file: " + job.source);
        }

        try {
            if (job.size_bytes < options.resumable_threshold) {
                MediaUploadOptions media;
                media.content_type = options.content_type;
                if (options.skip_if_exists) media.if_generation_match = 0;
                auto data = read_whole_file(job.source);
                client_.upload_media(bucket_, job.destination, data, media);
            } else {
                ResumableUploadConfig config;
                config.bucket = bucket_;
                config.object = job.destination;
                config.content_type = options.content_type;
                config.content_length = job.size_bytes;
                config.chunk_size = options.resumable_chunk_size;
                config.config_store = options.config_store;
                if (options.skip_if_exists) config.generation = 0;

                auto upload = client_.create_resumable_upload(std::move(config));
                std::ifstream in(job.source, std::ios::binary);
                if (!in) {
                    throw std::runtime_error("Failed to open " + job.source);
                }
                upload->upload_stream(in);
            }
        } catch (const TransferError& e) {
            if (options.skip_if_exists && e.status_code() == 412) {
                log_info("Skipping %s: gs://%s/%s already exists", job.source.c_str(),
                         bucket_.c_str(), job.destination.c_str());
                return;
            }
            throw;
        }
        log_debug("Uploaded %s -> gs://%s/%s", job.source.c_str(), bucket_.c_str(),
                  job.destination.c_str());
    };

    BatchOptions batch;
    batch.concurrency_limit = options.concurrency_limit;
    batch.fail_fast = options.fail_fast;
    batch.metrics = client_.options().metrics;
    return run_many(std::move(jobs), worker, batch);
}

BatchResult TransferManager::download_many_files(const std::vector<std::string>& objects,
                                                 const DownloadManyOptions& options) {
    std::vector<TransferJob> jobs;
    jobs.reserve(objects.size());
    for (const auto& object : objects) {
        TransferJob job;
        job.source = object;
        jobs.push_back(std::move(job));
    }

    log_info("Downloading %zu objects from gs://%s", jobs.size(), bucket_.c_str());

    auto worker = [&](TransferJob& job) {
        fs::path local = local_path_for(job.source, options);
        job.destination = local.string();

        // Directory placeholder object
        if (!job.source.empty() && job.source.back() == '/') {
            fs::create_directories(local);
            return;
        }

        if (local.has_parent_path()) {
            fs::create_directories(local.parent_path());
        }

        fs::path temp_path = local;
        temp_path += ".objxfer.tmp";
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("Failed to create " + temp_path.string());
            }

            DownloadOptions download;
            download.validate_crc32c = options.validate_crc32c;
            try {
                job.size_bytes = client_.download(bucket_, job.source,
                    [&out](const uint8_t* data, size_t size) {
                        out.write(reinterpret_cast<const char*>(data),
                                  static_cast<std::streamsize>(size));
                        return static_cast<bool>(out);
                    }, download);
            } catch (const TransferError&) {
                out.close();
                std::error_code ec;
                fs::remove(temp_path, ec);
                throw;
            }
        }

        fs::rename(temp_path, local);
    };

    BatchOptions batch;
    batch.concurrency_limit = options.concurrency_limit;
    batch.fail_fast = options.fail_fast;
    batch.metrics = client_.options().metrics;
    return run_many(std::move(jobs), worker, batch);
}

ChunkedDownloadResult TransferManager::download_file_in_chunks(const std::string& object,
                                                               const fs::path& destination,
                                                               const ChunkedDownloadOptions& options) {
    auto metadata = client_.get_metadata(bucket_, object);
    if (!metadata) {
        throw TransferError(ErrorKind::FatalCaller,
                            "No such object: gs://" + bucket_ + "/" + object, 404);
    }

    ChunkedDownloadResult result;
    result.size = metadata->size;

    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path());
    }
    {
        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to create " + destination.string());
        }
    }
    fs::resize_file(destination, result.size);

    size_t chunk_size = options.chunk_size ? options.chunk_size : DEFAULT_CHUNK_SIZE;
    struct ChunkRange { uint64_t start = 0; uint64_t length = 0; };
    std::vector<ChunkRange> chunks;
    for (uint64_t start = 0; start < result.size; start += chunk_size) {
        chunks.push_back({start, std::min<uint64_t>(chunk_size, result.size - start)});
    }
    result.chunks = chunks.size();

    std::vector<Crc32c> chunk_crcs(chunks.size());
    if (!chunks.empty()) {
        size_t limit = options.concurrency_limit ? options.concurrency_limit : DEFAULT_CONCURRENCY_LIMIT;
        ThreadPool pool(std::min(limit, chunks.size()));
        std::vector<std::future<void>> futures;

        for (size_t i = 0; i < chunks.size(); ++i) {
            futures.push_back(pool.submit([&, i] {
                const auto& chunk = chunks[i];
                std::fstream out(destination, std::ios::binary | std::ios::in | std::ios::out);
                if (!out) {
                    throw std::runtime_error("Failed to open " + destination.string());
                }
                out.seekp(static_cast<std::streamoff>(chunk.start));

                DownloadOptions download;
                download.range_start = chunk.start;
                download.range_end = chunk.start + chunk.length - 1;
                download.generation = metadata->generation ? std::optional<int64_t>(metadata->generation)
                                                           : std::nullopt;
                download.validate_crc32c = false;

                uint64_t received = client_.download(bucket_, object,
                    [&](const uint8_t* data, size_t size) {
                        chunk_crcs[i].update(std::span<const uint8_t>(data, size));
                        out.write(reinterpret_cast<const char*>(data),
                                  static_cast<std::streamsize>(size));
                        return static_cast<bool>(out);
                    }, download);

                if (received != chunk.length) {
                    throw TransferError(ErrorKind::Transient,
                        "Short ranged read of gs://" + bucket_ + "/" + object + " at offset " +
                            std::to_string(chunk.start) + ": expected " +
                            std::to_string(chunk.length) + " bytes, got " + std::to_string(received));
                }
            }));
        }

        // Wait for every chunk before surfacing the first failure
        std::exception_ptr first_error;
        for (auto& fut : futures) {
            try {
                fut.get();
            } catch (const std::exception&) {
                if (!first_error) first_error = std::current_exception();
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

    Crc32c combined;
    for (size_t i = 0; i < chunks.size(); ++i) {
        combined = Crc32c::combine(combined, chunk_crcs[i], chunks[i].length);
    }
    result.crc32c = combined.to_string();

    if (options.validate_crc32c && !metadata->crc32c.empty() &&
        !combined.validate(std::string_view(metadata->crc32c))) {
        throw TransferError(ErrorKind::Integrity,
            "CONTENT_DOWNLOAD_MISMATCH: the downloaded content of gs://" + bucket_ + "/" + object +
                " does not match the server checksum. Client calculated: " + result.crc32c +
                ", Server returned: " + metadata->crc32c);
    }

    log_info("Downloaded gs://%s/%s in %zu chunks (%llu bytes)", bucket_.c_str(), object.c_str(),
             result.chunks, static_cast<unsigned long long>(result.size));
    return result;
}

ChunkedUploadResult TransferManager::upload_file_in_chunks(const fs::path& path,
                                                           const std::string& object,
                                                           const ChunkedUploadOptions& options,
                                                           const std::map<std::string, std::string>& headers) {
    XmlMultipartConfig config;
    config.xml_endpoint = xml_endpoint_;
    config.bucket = bucket_;
    config.object = object;
    config.headers = headers;
    config.retry = client_.options().retry;
    config.request_timeout = client_.options().request_timeout;
    config.metrics = client_.options().metrics;

    XmlMultipartUploader uploader(std::move(config), client_.transport(), client_.authenticator());

    ChunkedUploadOptions effective = options;
    if (!effective.metrics) effective.metrics = client_.options().metrics;
    return objxfer::upload_file_in_chunks(uploader, path, effective);
}

}  // namespace objxfer
