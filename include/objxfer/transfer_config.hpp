#pragma once

#include "objxfer/retry_policy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

/// Parse "always", "conditional" or "never". nullopt on anything else.
std::optional<IdempotencyStrategy> parse_idempotency(const std::string& value);
const char* idempotency_to_string(IdempotencyStrategy strategy);

/// Configuration for the objxfer command line tool.
///
/// Usage: objxfer <command> [options] <args...>
/// Commands: upload, download, upload-many, download-many, upload-chunks,
/// download-chunks, sessions.
struct TransferConfig {
    std::string command;
    std::vector<std::string> args;  // positional arguments after the command

    // Service
    std::string api_endpoint = "https://storage.googleapis.com";
    std::string xml_endpoint;  // empty: https://{bucket}.storage.googleapis.com
    std::string bucket;
    std::string user_project;
    std::string access_token;  // or OBJXFER_ACCESS_TOKEN

    // Session store
    std::filesystem::path state_db;  // Default: $HOME/.objxfer/sessions.db
    bool persist_sessions = true;

    // Parallelism and chunking
    size_t concurrency_limit = 10;
    size_t chunk_size = 32 * 1024 * 1024;  // parts and ranged downloads
    size_t resumable_chunk_size = 0;       // 0 = single request

    // Resumable upload resume point
    std::string session_uri;
    std::optional<uint64_t> offset;

    // Multipart resume point
    std::string upload_id;
    std::map<int, std::string> parts_map;
    bool abort_existing = false;
    bool auto_abort_failure = true;

    // Batch behavior
    std::string prefix;
    std::string strip_prefix;
    std::filesystem::path destination_dir = ".";
    bool skip_if_exists = false;
    bool fail_fast = false;
    std::string content_type = "application/octet-stream";

    bool validate_crc32c = true;

    // Retry
    int max_retries = 5;
    double retry_delay_multiplier = 2.0;
    size_t max_retry_delay_secs = 64;
    size_t total_timeout_secs = 600;
    IdempotencyStrategy idempotency = IdempotencyStrategy::RetryConditional;

    // HTTP
    size_t request_timeout_secs = 300;
    bool verify_ssl = true;
    std::string ca_bundle;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    bool verbose = false;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<TransferConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in the state database path and the token from the environment.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// Retry options built from the retry fields.
    RetryOptions retry_options() const;
};

}  // namespace objxfer
