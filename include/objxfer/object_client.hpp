#pragma once

#include "objxfer/net/http.hpp"
#include "objxfer/resumable_upload.hpp"
#include "objxfer/retry_policy.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace objxfer {

class CancellationToken;
class MetricsExporter;

/// Subset of the object resource the transfer engine relies on.
struct ObjectMetadata {
    std::string bucket;
    std::string name;
    uint64_t size = 0;
    int64_t generation = 0;
    std::string etag;
    std::string content_type;
    std::string crc32c;    // base64, empty when not reported
    std::string md5_hash;  // base64, empty for composite objects
    nlohmann::json raw;

    static ObjectMetadata from_json(const nlohmann::json& j);
};

struct ObjectClientOptions {
    std::string api_endpoint = "https://storage.googleapis.com";
    std::string user_project;
    RetryOptions retry;
    std::chrono::milliseconds request_timeout{300000};
    MetricsExporter* metrics = nullptr;
};

struct DownloadOptions {
    // Inclusive byte range; unset means the whole object
    std::optional<uint64_t> range_start;
    std::optional<uint64_t> range_end;
    std::optional<int64_t> generation;

    // Check the x-goog-hash crc32c of a whole-object download
    bool validate_crc32c = true;

    std::shared_ptr<CancellationToken> cancel_token;
};

struct MediaUploadOptions {
    std::string content_type = "application/octet-stream";
    std::optional<int64_t> if_generation_match;
    std::string predefined_acl;
    std::string kms_key_name;
};

/// Object plumbing on top of the generic transport: metadata GET, media
/// download and single-request media upload, each with the retry policy.
/// Also the factory for resumable uploads sharing its settings.
class ObjectClient {
public:
    ObjectClient(ObjectClientOptions options,
                 std::shared_ptr<net::HttpTransport> transport,
                 std::shared_ptr<net::Authenticator> auth = nullptr);

    /// nullopt if the object does not exist.
    std::optional<ObjectMetadata> get_metadata(const std::string& bucket,
                                               const std::string& object);

    /// Stream object bytes into `sink`. Interrupted transfers are resumed
    /// from the last received byte. Returns the number of bytes delivered.
    uint64_t download(const std::string& bucket, const std::string& object,
                      const net::HttpBodySink& sink, const DownloadOptions& options = {});

    std::vector<uint8_t> download_to_memory(const std::string& bucket, const std::string& object,
                                            const DownloadOptions& options = {});

    ObjectMetadata upload_media(const std::string& bucket, const std::string& object,
                                std::span<const uint8_t> data,
                                const MediaUploadOptions& options = {});

    /// Fill in endpoint, retry, metrics and user project, then build the upload.
    std::unique_ptr<ResumableUpload> create_resumable_upload(ResumableUploadConfig config) const;

    const ObjectClientOptions& options() const { return options_; }
    const std::shared_ptr<net::HttpTransport>& transport() const { return transport_; }
    const std::shared_ptr<net::Authenticator>& authenticator() const { return auth_; }

private:
    std::string object_url(const std::string& bucket, const std::string& object) const;
    std::string append_user_project(std::string url) const;
    net::HttpResponse execute(net::HttpRequest request, const RequestContext& context,
                              const std::string& what, bool allow_not_found);

    ObjectClientOptions options_;
    std::shared_ptr<net::HttpTransport> transport_;
    std::shared_ptr<net::Authenticator> auth_;
    RetryPolicy retry_policy_;
};

}  // namespace objxfer
