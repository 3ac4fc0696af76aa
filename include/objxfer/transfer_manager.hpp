#pragma once

#include "objxfer/config_store.hpp"
#include "objxfer/errors.hpp"
#include "objxfer/net/http.hpp"
#include "objxfer/object_client.hpp"
#include "objxfer/retry_policy.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace objxfer {

class MetricsExporter;

constexpr size_t DEFAULT_CONCURRENCY_LIMIT = 10;
constexpr size_t DEFAULT_CHUNK_SIZE = 32 * 1024 * 1024;

// ============================================================================
// Parallel batch execution
// ============================================================================

enum class JobStatus { Pending, InFlight, Succeeded, Failed, Skipped };

const char* job_status_to_string(JobStatus status);

/// One independent unit of work in a batch.
struct TransferJob {
    std::string source;
    std::string destination;
    uint64_t size_bytes = 0;
    JobStatus status = JobStatus::Pending;
    std::string error;
};

struct BatchOptions {
    size_t concurrency_limit = DEFAULT_CONCURRENCY_LIMIT;

    // Stop dispatching new jobs after the first failure
    bool fail_fast = false;

    MetricsExporter* metrics = nullptr;
};

struct JobFailure {
    TransferJob job;
    std::string message;
    ErrorKind kind = ErrorKind::Transient;
};

/// Outcome of a batch. Jobs appear in submission order within each list.
struct BatchResult {
    std::vector<TransferJob> succeeded;
    std::vector<JobFailure> failed;
    std::vector<TransferJob> skipped;  // never started because of fail_fast

    bool ok() const { return failed.empty() && skipped.empty(); }

    /// Raise a PartialBatch TransferError summarizing the failures, if any.
    void throw_if_failed() const;
};

/// Per-job work. Throwing marks the job failed; returning marks it succeeded.
using JobWorker = std::function<void(TransferJob&)>;

/// Run `jobs` with at most `concurrency_limit` in flight. A job failing does
/// not abort the batch (unless fail_fast); the result lists every outcome.
BatchResult run_many(std::vector<TransferJob> jobs, const JobWorker& worker,
                     const BatchOptions& options = {});

// ============================================================================
// Multipart upload
// ============================================================================

/// Resume point of a multipart upload: part number -> ETag.
struct MultipartState {
    std::string upload_id;
    std::map<int, std::string> parts_map;
};

/// Part-level operations of a multipart upload protocol.
class MultipartUploader {
public:
    virtual ~MultipartUploader() = default;

    virtual std::string initiate_upload() = 0;
    virtual std::string upload_part(const std::string& upload_id, int part_number,
                                    std::span<const uint8_t> data) = 0;

    /// Assemble the parts in ascending part-number order.
    virtual nlohmann::json complete_upload(const MultipartState& state) = 0;
    virtual void abort_upload(const std::string& upload_id) = 0;
};

struct XmlMultipartConfig {
    // Empty selects https://{bucket}.storage.googleapis.com; otherwise
    // path-style {xml_endpoint}/{bucket}
    std::string xml_endpoint;
    std::string bucket;
    std::string object;
    std::string content_type;

    // Extra headers sent with the initiation request (x-goog-meta-*, ...)
    std::map<std::string, std::string> headers;

    RetryOptions retry;
    std::chrono::milliseconds request_timeout{300000};
    MetricsExporter* metrics = nullptr;
};

/// Multipart uploads over the XML API:
///   POST   {object}?uploads               -> <UploadId>
///   PUT    {object}?partNumber=N&uploadId= -> ETag header
///   POST   {object}?uploadId=              <CompleteMultipartUpload>
///   DELETE {object}?uploadId=
class XmlMultipartUploader : public MultipartUploader {
public:
    XmlMultipartUploader(XmlMultipartConfig config,
                         std::shared_ptr<net::HttpTransport> transport,
                         std::shared_ptr<net::Authenticator> auth = nullptr);

    std::string initiate_upload() override;
    std::string upload_part(const std::string& upload_id, int part_number,
                            std::span<const uint8_t> data) override;
    nlohmann::json complete_upload(const MultipartState& state) override;
    void abort_upload(const std::string& upload_id) override;

    const std::string& object_url() const { return object_url_; }

private:
    net::HttpResponse execute(net::HttpRequest request, const RequestContext& context,
                              const std::string& what);

    XmlMultipartConfig config_;
    std::shared_ptr<net::HttpTransport> transport_;
    std::shared_ptr<net::Authenticator> auth_;
    RetryPolicy retry_policy_;
    std::string object_url_;
};

/// Build the CompleteMultipartUpload request body.
std::string build_complete_multipart_xml(const std::map<int, std::string>& parts_map);

struct ChunkedUploadOptions {
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    size_t concurrency_limit = DEFAULT_CONCURRENCY_LIMIT;

    // Resume a previous upload; parts already in parts_map are not re-sent
    std::string upload_id;
    std::map<int, std::string> parts_map;

    // Abort `upload_id` and do nothing else
    bool abort_existing = false;

    // Abort on failure; when false the failure carries the resume state
    bool auto_abort_failure = true;

    MetricsExporter* metrics = nullptr;
};

struct ChunkedUploadResult {
    nlohmann::json metadata;
    MultipartState state;
    uint64_t size = 0;
    std::string crc32c;  // combined over all parts, base64
    size_t parts_uploaded = 0;
    size_t parts_resumed = 0;
    bool aborted = false;
};

/// Split `path` into parts and push them through `uploader`.
/// Throws MultipartUploadError when parts fail and auto_abort_failure is off.
ChunkedUploadResult upload_file_in_chunks(MultipartUploader& uploader,
                                          const std::filesystem::path& path,
                                          const ChunkedUploadOptions& options = {});

// ============================================================================
// Transfer manager
// ============================================================================

struct UploadManyOptions {
    size_t concurrency_limit = DEFAULT_CONCURRENCY_LIMIT;
    bool fail_fast = false;

    // Prepended to every object name, joined with '/'
    std::string prefix;

    // Upload with ifGenerationMatch=0 so existing objects are left alone
    bool skip_if_exists = false;

    // Overrides the object name built from the local path and prefix
    std::function<std::string(const std::filesystem::path&)> destination_builder;

    // Files at least this large use a resumable upload
    uint64_t resumable_threshold = 8 * 1024 * 1024;
    size_t resumable_chunk_size = 0;

    // Persists session URIs of resumable uploads; may be null
    std::shared_ptr<ConfigStore> config_store;

    std::string content_type = "application/octet-stream";
};

struct DownloadManyOptions {
    size_t concurrency_limit = DEFAULT_CONCURRENCY_LIMIT;
    bool fail_fast = false;

    // Local directory files are written under
    std::filesystem::path destination_dir = ".";

    // Joined in front of the local path
    std::string prefix;

    // Removed from the front of each object name
    std::string strip_prefix;

    bool validate_crc32c = true;
};

struct ChunkedDownloadOptions {
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    size_t concurrency_limit = DEFAULT_CONCURRENCY_LIMIT;
    bool validate_crc32c = false;
};

struct ChunkedDownloadResult {
    uint64_t size = 0;
    std::string crc32c;
    size_t chunks = 0;
};

/// Bulk and chunked transfers for one bucket on top of ObjectClient.
class TransferManager {
public:
    TransferManager(std::string bucket, ObjectClient& client, std::string xml_endpoint = "");

    /// Directories are expanded recursively. Object names use '/' separators.
    BatchResult upload_many_files(const std::vector<std::filesystem::path>& paths,
                                  const UploadManyOptions& options = {});

    /// Object names ending in '/' create local directories.
    BatchResult download_many_files(const std::vector<std::string>& objects,
                                    const DownloadManyOptions& options = {});

    /// Parallel ranged GETs written at their offsets in `destination`.
    ChunkedDownloadResult download_file_in_chunks(const std::string& object,
                                                  const std::filesystem::path& destination,
                                                  const ChunkedDownloadOptions& options = {});

    ChunkedUploadResult upload_file_in_chunks(const std::filesystem::path& path,
                                              const std::string& object,
                                              const ChunkedUploadOptions& options = {},
                                              const std::map<std::string, std::string>& headers = {});

    /// Object name for a local path under upload_many_files rules.
    static std::string object_name_for(const std::filesystem::path& path, const std::string& prefix);

    /// Local path for an object under download_many_files rules.
    static std::filesystem::path local_path_for(const std::string& object,
                                                const DownloadManyOptions& options);

    const std::string& bucket() const { return bucket_; }

private:
    std::string bucket_;
    ObjectClient& client_;
    std::string xml_endpoint_;
};

}  // namespace objxfer
