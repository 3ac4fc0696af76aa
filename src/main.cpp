#include "objxfer/cancellation.hpp"
#include "objxfer/config_store.hpp"
#include "objxfer/errors.hpp"
#include "objxfer/log.hpp"
#include "objxfer/metrics.hpp"
#include "objxfer/net/http.hpp"
#include "objxfer/object_client.hpp"
#include "objxfer/transfer_config.hpp"
#include "objxfer/transfer_manager.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

// Cancels the running transfer once a shutdown signal arrives. The signal
// handler only sets a flag; the cancel itself runs on this thread.
class ShutdownWatcher {
public:
    ShutdownWatcher() : thread_([this] { run(); }) {}

    ~ShutdownWatcher() {
        done_ = true;
        thread_.join();
    }

    void set_cancel(std::function<void()> cancel) {
        std::lock_guard lock(mutex_);
        cancel_ = std::move(cancel);
    }

private:
    void run() {
        while (!done_) {
            if (g_shutdown_requested) {
                std::lock_guard lock(mutex_);
                if (cancel_) {
                    objxfer::log_warn("Shutdown requested, cancelling transfer");
                    cancel_();
                    cancel_ = nullptr;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    std::atomic<bool> done_{false};
    std::mutex mutex_;
    std::function<void()> cancel_;
    std::thread thread_;
};

// Registers a cancel callback for the lifetime of one transfer
class CancelScope {
public:
    CancelScope(ShutdownWatcher& watcher, std::function<void()> cancel) : watcher_(watcher) {
        watcher_.set_cancel(std::move(cancel));
    }
    ~CancelScope() { watcher_.set_cancel(nullptr); }

    CancelScope(const CancelScope&) = delete;
    CancelScope& operator=(const CancelScope&) = delete;

private:
    ShutdownWatcher& watcher_;
};

std::string mask(const std::string& secret) {
    return secret.empty() ? "(none)" : "****";
}

std::string format_time(int64_t epoch_secs) {
    std::time_t t = static_cast<std::time_t>(epoch_secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::shared_ptr<objxfer::ConfigStore> open_store(const objxfer::TransferConfig& config) {
    if (!config.persist_sessions) return nullptr;
    return std::make_shared<objxfer::SqliteConfigStore>(config.state_db);
}

int print_batch(const objxfer::BatchResult& result) {
    for (const auto& failure : result.failed) {
        std::cerr << "FAILED " << failure.job.source << ": " << failure.message << "\n";
    }
    for (const auto& job : result.skipped) {
        std::cerr << "SKIPPED " << job.source << "\n";
    }
    std::cout << result.succeeded.size() << " succeeded, " << result.failed.size()
              << " failed, " << result.skipped.size() << " skipped" << std::endl;
    return result.ok() ? 0 : 1;
}

int run_sessions(const objxfer::TransferConfig& config) {
    objxfer::SqliteConfigStore store(config.state_db);
    if (config.args[0] == "clear") {
        size_t removed = store.clear();
        std::cout << "Removed " << removed << " session record(s)" << std::endl;
        return 0;
    }

    auto records = store.list();
    if (records.empty()) {
        std::cout << "No persisted sessions in " << config.state_db << std::endl;
        return 0;
    }
    for (const auto& [key, record] : records) {
        std::cout << key << "\n"
                  << "  uri: " << record.uri << "\n"
                  << "  updated: " << format_time(record.updated_at) << "\n";
    }
    return 0;
}

int run_upload(const objxfer::TransferConfig& config, objxfer::ObjectClient& client,
               ShutdownWatcher& watcher) {
    const std::string& file = config.args[0];
    const std::string& object = config.args[1];

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        objxfer::log_error("cannot open %s", file.c_str());
        return 1;
    }

    objxfer::ResumableUploadConfig upload_config;
    upload_config.bucket = config.bucket;
    upload_config.object = object;
    upload_config.content_type = config.content_type;
    upload_config.content_length = std::filesystem::file_size(file);
    upload_config.chunk_size = config.resumable_chunk_size;
    upload_config.validate_crc32c = config.validate_crc32c;
    upload_config.config_store = open_store(config);
    if (config.skip_if_exists) upload_config.generation = 0;
    if (!config.session_uri.empty()) {
        upload_config.uri = config.session_uri;
        upload_config.offset = config.offset;
    }
    upload_config.on_uri = [](const std::string& uri) {
        std::cout << "Session URI: " << uri << std::endl;
    };
    upload_config.on_progress = [](const objxfer::UploadProgress& progress) {
        objxfer::log_debug("uploaded %llu bytes",
                           static_cast<unsigned long long>(progress.bytes_written));
    };

    // The stream handed to a resumed session starts at its offset
    if (config.offset) {
        in.seekg(static_cast<std::streamoff>(*config.offset));
    }

    auto upload = client.create_resumable_upload(std::move(upload_config));
    CancelScope scope(watcher, [&upload] { upload->cancel(); });
    auto result = upload->upload_stream(in);

    std::cout << "Uploaded " << file << " -> gs://" << config.bucket << "/" << object
              << " (" << result.size << " bytes)" << std::endl;
    return 0;
}

int run_download(const objxfer::TransferConfig& config, objxfer::ObjectClient& client,
                 ShutdownWatcher& watcher) {
    const std::string& object = config.args[0];
    std::filesystem::path destination = config.args[1];

    auto token = std::make_shared<objxfer::CancellationToken>();
    CancelScope scope(watcher, [token] { token->cancel(); });

    std::filesystem::path temp_path = destination;
    temp_path += ".objxfer.tmp";
    uint64_t received = 0;
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            objxfer::log_error("cannot create %s", temp_path.c_str());
            return 1;
        }

        objxfer::DownloadOptions options;
        options.validate_crc32c = config.validate_crc32c;
        options.cancel_token = token;
        try {
            received = client.download(config.bucket, object,
                [&out](const uint8_t* data, size_t size) {
                    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
                    return static_cast<bool>(out);
                }, options);
        } catch (const objxfer::TransferError&) {
            out.close();
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            throw;
        }
    }
    std::filesystem::rename(temp_path, destination);

    std::cout << "Downloaded gs://" << config.bucket << "/" << object << " -> " << destination
              << " (" << received << " bytes)" << std::endl;
    return 0;
}

int run_upload_chunks(const objxfer::TransferConfig& config, objxfer::TransferManager& manager) {
    objxfer::ChunkedUploadOptions options;
    options.chunk_size = config.chunk_size;
    options.concurrency_limit = config.concurrency_limit;
    options.upload_id = config.upload_id;
    options.parts_map = config.parts_map;
    options.abort_existing = config.abort_existing;
    options.auto_abort_failure = config.auto_abort_failure;

    std::map<std::string, std::string> headers;
    if (!config.content_type.empty()) headers["Content-Type"] = config.content_type;

    try {
        auto result = manager.upload_file_in_chunks(config.args[0], config.args[1], options, headers);
        if (result.aborted) {
            std::cout << "Aborted multipart upload " << result.state.upload_id << std::endl;
            return 0;
        }
        std::cout << "Uploaded " << config.args[0] << " -> gs://" << config.bucket << "/"
                  << config.args[1] << " (" << result.size << " bytes, "
                  << result.parts_uploaded << " parts uploaded, " << result.parts_resumed
                  << " resumed, crc32c " << result.crc32c << ")" << std::endl;
        return 0;
    } catch (const objxfer::MultipartUploadError& e) {
        objxfer::log_error("%s", e.what());
        std::cerr << "Resume with: --upload-id " << e.upload_id();
        for (const auto& [number, etag] : e.parts_map()) {
            std::cerr << " --part '" << number << "=" << etag << "'";
        }
        std::cerr << "\n";
        return 1;
    }
}

int run_download_chunks(const objxfer::TransferConfig& config, objxfer::TransferManager& manager) {
    objxfer::ChunkedDownloadOptions options;
    options.chunk_size = config.chunk_size;
    options.concurrency_limit = config.concurrency_limit;
    options.validate_crc32c = config.validate_crc32c;

    auto result = manager.download_file_in_chunks(config.args[0], config.args[1], options);
    std::cout << "Downloaded gs://" << config.bucket << "/" << config.args[0] << " -> "
              << config.args[1] << " (" << result.size << " bytes in " << result.chunks
              << " chunks, crc32c " << result.crc32c << ")" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = objxfer::TransferConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    objxfer::set_verbose(config.verbose);

    objxfer::log_debug("objxfer %s", config.command.c_str());
    objxfer::log_debug("  bucket: %s", config.bucket.c_str());
    objxfer::log_debug("  api-endpoint: %s", config.api_endpoint.c_str());
    objxfer::log_debug("  access-token: %s", mask(config.access_token).c_str());
    objxfer::log_debug("  state-db: %s", config.persist_sessions ? config.state_db.c_str() : "(disabled)");
    objxfer::log_debug("  concurrency: %zu", config.concurrency_limit);
    objxfer::log_debug("  chunk-size: %zu", config.chunk_size);
    objxfer::log_debug("  retry: max %d, multiplier %.1f, max delay %zus, budget %zus, idempotency %s",
                       config.max_retries, config.retry_delay_multiplier,
                       config.max_retry_delay_secs, config.total_timeout_secs,
                       objxfer::idempotency_to_string(config.idempotency));

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::unique_ptr<objxfer::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<objxfer::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"command", config.command}});
        metrics->start();
    }

    int rc = 1;
    try {
        if (config.command == "sessions") {
            rc = run_sessions(config);
        } else {
            objxfer::net::HttpClientConfig http_config;
            http_config.verify_ssl = config.verify_ssl;
            http_config.ca_bundle = config.ca_bundle;
            auto transport = std::make_shared<objxfer::net::HttpClient>(http_config);
            auto auth = std::make_shared<objxfer::net::BearerTokenAuthenticator>(config.access_token);

            objxfer::ObjectClientOptions client_options;
            client_options.api_endpoint = config.api_endpoint;
            client_options.user_project = config.user_project;
            client_options.retry = config.retry_options();
            client_options.request_timeout = std::chrono::seconds(config.request_timeout_secs);
            client_options.metrics = metrics.get();
            objxfer::ObjectClient client(client_options, transport, auth);
            objxfer::TransferManager manager(config.bucket, client, config.xml_endpoint);

            ShutdownWatcher watcher;

            if (config.command == "upload") {
                rc = run_upload(config, client, watcher);
            } else if (config.command == "download") {
                rc = run_download(config, client, watcher);
            } else if (config.command == "upload-many") {
                objxfer::UploadManyOptions options;
                options.concurrency_limit = config.concurrency_limit;
                options.fail_fast = config.fail_fast;
                options.prefix = config.prefix;
                options.skip_if_exists = config.skip_if_exists;
                options.resumable_chunk_size = config.resumable_chunk_size;
                options.content_type = config.content_type;
                options.config_store = open_store(config);

                std::vector<std::filesystem::path> paths(config.args.begin(), config.args.end());
                rc = print_batch(manager.upload_many_files(paths, options));
            } else if (config.command == "download-many") {
                objxfer::DownloadManyOptions options;
                options.concurrency_limit = config.concurrency_limit;
                options.fail_fast = config.fail_fast;
                options.destination_dir = config.destination_dir;
                options.prefix = config.prefix;
                options.strip_prefix = config.strip_prefix;
                options.validate_crc32c = config.validate_crc32c;
                rc = print_batch(manager.download_many_files(config.args, options));
            } else if (config.command == "upload-chunks") {
                rc = run_upload_chunks(config, manager);
            } else if (config.command == "download-chunks") {
                rc = run_download_chunks(config, manager);
            }
        }
    } catch (const objxfer::TransferError& e) {
        objxfer::log_error("%s [%s, status %d, %d attempt(s)]", e.what(),
                           objxfer::error_kind_to_string(e.kind()), e.status_code(), e.attempts());
        rc = 1;
    } catch (const std::exception& e) {
        objxfer::log_error("%s", e.what());
        rc = 1;
    }

    if (metrics) {
        metrics->stop();
    }
    return rc;
}
