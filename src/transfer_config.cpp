#include "objxfer/transfer_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <set>

namespace objxfer {

namespace {

const std::set<std::string> kCommands = {
    "upload", "download", "upload-many", "download-many",
    "upload-chunks", "download-chunks", "sessions",
};

void print_usage() {
    std::cerr <<
        "Usage: objxfer <command> --bucket <name> [options] <args...>\n"
        "\n"
        "Commands:\n"
        "  upload <file> <object>           Resumable upload of one file\n"
        "  download <object> <file>         Download one object\n"
        "  upload-many <path>...            Upload files and directories in parallel\n"
        "  download-many <object>...        Download objects in parallel\n"
        "  upload-chunks <file> <object>    Multipart upload with parallel parts\n"
        "  download-chunks <object> <file>  Parallel ranged download\n"
        "  sessions <list|clear>            Show or drop persisted upload sessions\n"
        "\n"
        "Service:\n"
        "  --bucket <name>                  Bucket name\n"
        "  --api-endpoint <url>             JSON API endpoint (default: https://storage.googleapis.com)\n"
        "  --xml-endpoint <url>             XML API endpoint for multipart uploads\n"
        "  --user-project <id>              Project billed for requester-pays buckets\n"
        "  --access-token <token>           OAuth2 token (or OBJXFER_ACCESS_TOKEN env)\n"
        "  --config <path>                  JSON config file\n"
        "\n"
        "Transfers:\n"
        "  --concurrency <N>                Jobs or parts in flight (default: 10)\n"
        "  --chunk-size <bytes>             Part / range size (default: 33554432)\n"
        "  --resumable-chunk-size <bytes>   Resumable request size, multiple of 262144 (default: single request)\n"
        "  --content-type <type>            Content type (default: application/octet-stream)\n"
        "  --prefix <prefix>                Prefix joined to object names or local paths\n"
        "  --strip-prefix <prefix>          Prefix removed from object names on download\n"
        "  --destination <dir>              Local directory for download-many (default: .)\n"
        "  --skip-if-exists                 Do not overwrite existing objects\n"
        "  --fail-fast                      Stop starting jobs after the first failure\n"
        "  --no-validate                    Skip crc32c validation\n"
        "\n"
        "Resume:\n"
        "  --uri <session-uri>              Resume a resumable session\n"
        "  --offset <bytes>                 Bytes the session already holds (requires --uri)\n"
        "  --upload-id <id>                 Resume or abort a multipart upload\n"
        "  --part <N>=<etag>                Part already uploaded (repeatable)\n"
        "  --abort-existing                 Abort --upload-id and exit\n"
        "  --no-auto-abort                  Keep a failed multipart upload for resuming\n"
        "  --state-db <path>                Session database (default: ~/.objxfer/sessions.db)\n"
        "  --no-state                       Do not persist session URIs\n"
        "\n"
        "Retry:\n"
        "  --max-retries <N>                Retry attempts (default: 5)\n"
        "  --retry-multiplier <X>           Backoff multiplier (default: 2.0)\n"
        "  --max-retry-delay <secs>         Backoff cap (default: 64)\n"
        "  --total-timeout <secs>           Retry time budget (default: 600)\n"
        "  --idempotency <mode>             always, conditional or never (default: conditional)\n"
        "\n"
        "HTTP and output:\n"
        "  --request-timeout <secs>         Per-request timeout (default: 300)\n"
        "  --ca-bundle <path>               CA bundle for SSL\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --verbose                        Verbose output\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<IdempotencyStrategy> parse_idempotency(const std::string& value) {
    if (value == "always") return IdempotencyStrategy::RetryAlways;
    if (value == "conditional") return IdempotencyStrategy::RetryConditional;
    if (value == "never") return IdempotencyStrategy::RetryNever;
    return std::nullopt;
}

const char* idempotency_to_string(IdempotencyStrategy strategy) {
    switch (strategy) {
        case IdempotencyStrategy::RetryAlways: return "always";
        case IdempotencyStrategy::RetryConditional: return "conditional";
        case IdempotencyStrategy::RetryNever: return "never";
    }
    return "unknown";
}

std::optional<TransferConfig> TransferConfig::from_args(int argc, char* argv[]) {
    TransferConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--bucket") {
                auto* v = next_arg(i, "--bucket");
                if (!v) return std::nullopt;
                config.bucket = v;
            } else if (arg == "--api-endpoint") {
                auto* v = next_arg(i, "--api-endpoint");
                if (!v) return std::nullopt;
                config.api_endpoint = v;
            } else if (arg == "--xml-endpoint") {
                auto* v = next_arg(i, "--xml-endpoint");
                if (!v) return std::nullopt;
                config.xml_endpoint = v;
            } else if (arg == "--user-project") {
                auto* v = next_arg(i, "--user-project");
                if (!v) return std::nullopt;
                config.user_project = v;
            } else if (arg == "--access-token") {
                auto* v = next_arg(i, "--access-token");
                if (!v) return std::nullopt;
                config.access_token = v;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--concurrency") {
                auto* v = next_arg(i, "--concurrency");
                if (!v) return std::nullopt;
                config.concurrency_limit = std::stoull(v);
            } else if (arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoull(v);
            } else if (arg == "--resumable-chunk-size") {
                auto* v = next_arg(i, "--resumable-chunk-size");
                if (!v) return std::nullopt;
                config.resumable_chunk_size = std::stoull(v);
            } else if (arg == "--content-type") {
                auto* v = next_arg(i, "--content-type");
                if (!v) return std::nullopt;
                config.content_type = v;
            } else if (arg == "--prefix") {
                auto* v = next_arg(i, "--prefix");
                if (!v) return std::nullopt;
                config.prefix = v;
            } else if (arg == "--strip-prefix") {
                auto* v = next_arg(i, "--strip-prefix");
                if (!v) return std::nullopt;
                config.strip_prefix = v;
            } else if (arg == "--destination") {
                auto* v = next_arg(i, "--destination");
                if (!v) return std::nullopt;
                config.destination_dir = v;
            } else if (arg == "--skip-if-exists") {
                config.skip_if_exists = true;
            } else if (arg == "--fail-fast") {
                config.fail_fast = true;
            } else if (arg == "--no-validate") {
                config.validate_crc32c = false;
            } else if (arg == "--uri") {
                auto* v = next_arg(i, "--uri");
                if (!v) return std::nullopt;
                config.session_uri = v;
            } else if (arg == "--offset") {
                auto* v = next_arg(i, "--offset");
                if (!v) return std::nullopt;
                config.offset = std::stoull(v);
            } else if (arg == "--upload-id") {
                auto* v = next_arg(i, "--upload-id");
                if (!v) return std::nullopt;
                config.upload_id = v;
            } else if (arg == "--part") {
                auto* v = next_arg(i, "--part");
                if (!v) return std::nullopt;
                std::string part = v;
                auto eq = part.find('=');
                if (eq == std::string::npos || eq == 0 || eq + 1 == part.size()) {
                    std::cerr << "Error: --part expects <N>=<etag>, got: " << part << "\n";
                    return std::nullopt;
                }
                config.parts_map[std::stoi(part.substr(0, eq))] = part.substr(eq + 1);
            } else if (arg == "--abort-existing") {
                config.abort_existing = true;
            } else if (arg == "--no-auto-abort") {
                config.auto_abort_failure = false;
            } else if (arg == "--state-db") {
                auto* v = next_arg(i, "--state-db");
                if (!v) return std::nullopt;
                config.state_db = v;
            } else if (arg == "--no-state") {
                config.persist_sessions = false;
            } else if (arg == "--max-retries") {
                auto* v = next_arg(i, "--max-retries");
                if (!v) return std::nullopt;
                config.max_retries = std::stoi(v);
            } else if (arg == "--retry-multiplier") {
                auto* v = next_arg(i, "--retry-multiplier");
                if (!v) return std::nullopt;
                config.retry_delay_multiplier = std::stod(v);
            } else if (arg == "--max-retry-delay") {
                auto* v = next_arg(i, "--max-retry-delay");
                if (!v) return std::nullopt;
                config.max_retry_delay_secs = std::stoull(v);
            } else if (arg == "--total-timeout") {
                auto* v = next_arg(i, "--total-timeout");
                if (!v) return std::nullopt;
                config.total_timeout_secs = std::stoull(v);
            } else if (arg == "--idempotency") {
                auto* v = next_arg(i, "--idempotency");
                if (!v) return std::nullopt;
                auto strategy = parse_idempotency(v);
                if (!strategy) {
                    std::cerr << "Error: --idempotency must be always, conditional or never\n";
                    return std::nullopt;
                }
                config.idempotency = *strategy;
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout_secs = std::stoull(v);
            } else if (arg == "--ca-bundle") {
                auto* v = next_arg(i, "--ca-bundle");
                if (!v) return std::nullopt;
                config.ca_bundle = v;
            } else if (arg == "--no-verify-ssl") {
                config.verify_ssl = false;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (arg.compare(0, 2, "--") == 0) {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else if (config.command.empty()) {
                if (kCommands.count(arg) == 0) {
                    std::cerr << "Error: unknown command: " << arg << "\n";
                    print_usage();
                    return std::nullopt;
                }
                config.command = arg;
            } else {
                config.args.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        // std::stoull / std::stoi on a malformed number
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    if (config.command.empty()) {
        print_usage();
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool TransferConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("api_endpoint")) api_endpoint = j["api_endpoint"].get<std::string>();
        if (j.contains("xml_endpoint")) xml_endpoint = j["xml_endpoint"].get<std::string>();
        if (j.contains("bucket")) bucket = j["bucket"].get<std::string>();
        if (j.contains("user_project")) user_project = j["user_project"].get<std::string>();
        if (j.contains("access_token")) access_token = j["access_token"].get<std::string>();
        if (j.contains("state_db")) state_db = j["state_db"].get<std::string>();
        if (j.contains("persist_sessions")) persist_sessions = j["persist_sessions"].get<bool>();
        if (j.contains("concurrency_limit")) concurrency_limit = j["concurrency_limit"].get<size_t>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<size_t>();
        if (j.contains("resumable_chunk_size"))
            resumable_chunk_size = j["resumable_chunk_size"].get<size_t>();
        if (j.contains("content_type")) content_type = j["content_type"].get<std::string>();
        if (j.contains("prefix")) prefix = j["prefix"].get<std::string>();
        if (j.contains("strip_prefix")) strip_prefix = j["strip_prefix"].get<std::string>();
        if (j.contains("destination")) destination_dir = j["destination"].get<std::string>();
        if (j.contains("skip_if_exists")) skip_if_exists = j["skip_if_exists"].get<bool>();
        if (j.contains("fail_fast")) fail_fast = j["fail_fast"].get<bool>();
        if (j.contains("validate_crc32c")) validate_crc32c = j["validate_crc32c"].get<bool>();
        if (j.contains("auto_abort_failure")) auto_abort_failure = j["auto_abort_failure"].get<bool>();
        if (j.contains("request_timeout")) request_timeout_secs = j["request_timeout"].get<size_t>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("ca_bundle")) ca_bundle = j["ca_bundle"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        if (j.contains("retry") && j["retry"].is_object()) {
            auto& jr = j["retry"];
            if (jr.contains("max_retries")) max_retries = jr["max_retries"].get<int>();
            if (jr.contains("retry_delay_multiplier"))
                retry_delay_multiplier = jr["retry_delay_multiplier"].get<double>();
            if (jr.contains("max_retry_delay")) max_retry_delay_secs = jr["max_retry_delay"].get<size_t>();
            if (jr.contains("total_timeout")) total_timeout_secs = jr["total_timeout"].get<size_t>();
            if (jr.contains("idempotency")) {
                auto value = jr["idempotency"].get<std::string>();
                auto strategy = parse_idempotency(value);
                if (!strategy) {
                    std::cerr << "Error: unknown retry.idempotency: " << value << "\n";
                    return false;
                }
                idempotency = *strategy;
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void TransferConfig::apply_defaults() {
    if (access_token.empty()) {
        if (const char* v = std::getenv("OBJXFER_ACCESS_TOKEN")) {
            access_token = v;
        }
    }

    if (state_db.empty()) {
        if (const char* home = std::getenv("HOME")) {
            state_db = std::filesystem::path(home) / ".objxfer" / "sessions.db";
        } else {
            state_db = std::filesystem::path(".objxfer") / "sessions.db";
        }
    }

    while (api_endpoint.size() > 1 && api_endpoint.back() == '/') {
        api_endpoint.pop_back();
    }
}

std::string TransferConfig::validate() const {
    if (command.empty()) return "a command is required";

    if (command == "sessions") {
        if (args.size() != 1 || (args[0] != "list" && args[0] != "clear"))
            return "sessions expects 'list' or 'clear'";
        if (state_db.empty()) return "state_db is required (--state-db)";
        return {};
    }

    if (bucket.empty()) return "bucket is required (--bucket)";

    if (command == "upload" || command == "download" ||
        command == "upload-chunks" || command == "download-chunks") {
        if (args.size() != 2) return command + " expects exactly two arguments";
    } else if (command == "upload-many" || command == "download-many") {
        if (args.empty()) return command + " expects at least one argument";
    }

    if (command == "upload-chunks" && abort_existing && upload_id.empty())
        return "--abort-existing requires --upload-id";
    if (!parts_map.empty() && upload_id.empty()) return "--part requires --upload-id";
    if (offset && session_uri.empty()) return "--offset requires --uri";

    if (concurrency_limit == 0) return "concurrency_limit must be > 0";
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (resumable_chunk_size % (256 * 1024) != 0)
        return "resumable_chunk_size must be a multiple of 262144 bytes";
    if (max_retries < 0) return "max_retries must be >= 0";
    if (retry_delay_multiplier < 1.0) return "retry_delay_multiplier must be >= 1.0";
    if (total_timeout_secs == 0) return "total_timeout must be > 0";
    if (request_timeout_secs == 0) return "request_timeout must be > 0";
    return {};
}

RetryOptions TransferConfig::retry_options() const {
    RetryOptions options;
    options.max_retries = max_retries;
    options.retry_delay_multiplier = retry_delay_multiplier;
    options.max_retry_delay = std::chrono::seconds(max_retry_delay_secs);
    options.total_timeout = std::chrono::seconds(total_timeout_secs);
    options.idempotency = idempotency;
    options.auto_retry = max_retries > 0;
    return options;
}

}  // namespace objxfer
