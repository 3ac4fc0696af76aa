#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace objxfer {
class CancellationToken;
}

namespace objxfer::net {

enum class HttpMethod { GET, POST, PUT, DELETE, HEAD, OPTIONS };

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_client_error_status(int status);
bool is_server_error_status(int status);

/// Header map with case-insensitive names. A name may repeat.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has(const std::string& name) const;

    /// Every (lowercase name, value) pair.
    std::vector<std::pair<std::string, std::string>> all() const;

    void set_content_type(const std::string& content_type);
    void set_content_length(size_t length);
    void set_bearer_token(const std::string& token);

    std::optional<std::string> content_type() const;

private:
    static std::string key(const std::string& name);

    std::map<std::string, std::vector<std::string>> values_;
};

/// Receives a 2xx response body as it arrives. Return false to abort.
using HttpBodySink = std::function<bool(const uint8_t* data, size_t size)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};

    // When set, a successful body bypasses HttpResponse::body
    HttpBodySink body_sink;

    // Aborts the call when cancelled
    std::shared_ptr<CancellationToken> cancel_token;

    bool verify_ssl = true;
    std::string ca_bundle_path;  // empty: system default

    // Inclusive first/last byte
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;  // 0 when no response arrived
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::chrono::milliseconds total_time{0};

    std::string error;
    bool is_network_error = false;  // failed below HTTP
    bool cancelled = false;         // aborted through the cancel token

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;
};

/// Settings of the libcurl transport.
/// OBJXFER_CONNECTION_POOL_SIZE and OBJXFER_REQUEST_TIMEOUT (seconds)
/// override the idle pool size and every request's total timeout.
struct HttpClientConfig {
    size_t idle_connections = 10;
    size_t max_connections = 256;

    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    // Cap on buffered (non-sink) bodies, 0 = unlimited
    size_t max_response_size = 100 * 1024 * 1024;

    bool verify_ssl = true;
    std::string ca_bundle;

    std::string user_agent = "objxfer/1.0";
    bool curl_verbose = false;
};

/// Executes one request. Implementations are called from many threads.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

/// libcurl transport reusing easy handles across requests.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Adds credentials to outgoing requests. Token acquisition is the
/// caller's concern.
class Authenticator {
public:
    virtual ~Authenticator() = default;

    virtual void authorize(HttpRequest& request) = 0;
};

/// Attaches a fixed OAuth2 bearer token.
class BearerTokenAuthenticator : public Authenticator {
public:
    explicit BearerTokenAuthenticator(std::string token) : token_(std::move(token)) {}

    void authorize(HttpRequest& request) override {
        if (!token_.empty()) request.headers.set_bearer_token(token_);
    }

private:
    std::string token_;
};

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& str);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);
std::vector<uint8_t> base64_decode(const std::string& encoded);

}  // namespace objxfer::net
