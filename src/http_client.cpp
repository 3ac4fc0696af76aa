#include "objxfer/net/http.hpp"
#include "objxfer/cancellation.hpp"
#include "objxfer/log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace objxfer::net {

// ============================================================================
// Environment overrides
// ============================================================================

// Unsigned value of `name` within [lo, hi], or nullopt (with a warning)
static std::optional<unsigned long> env_in_range(const char* name, unsigned long lo,
                                                 unsigned long hi) {
    const char* env = std::getenv(name);
    if (!env) return std::nullopt;
    try {
        unsigned long v = std::stoul(env);
        if (v >= lo && v <= hi) return v;
        log_warn("%s=%s out of range [%lu,%lu], using default", name, env, lo, hi);
    } catch (const std::exception&) {
        log_warn("invalid %s=%s, using default", name, env);
    }
    return std::nullopt;
}

// ============================================================================
// Status, encoding helpers
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
    }
    return "UNKNOWN";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_client_error_status(int status) {
    return status >= 400 && status < 500;
}

bool is_server_error_status(int status) {
    return status >= 500 && status < 600;
}

std::string url_encode(const std::string& str) {
    std::ostringstream out;
    out << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return out.str();
}

static constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    for (size_t i = 0; i < data.size(); i += 3) {
        size_t n = std::min<size_t>(3, data.size() - i);
        uint32_t group = static_cast<uint32_t>(data[i]) << 16;
        if (n > 1) group |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (n > 2) group |= data[i + 2];

        out += kBase64Alphabet[(group >> 18) & 0x3F];
        out += kBase64Alphabet[(group >> 12) & 0x3F];
        out += n > 1 ? kBase64Alphabet[(group >> 6) & 0x3F] : '=';
        out += n > 2 ? kBase64Alphabet[group & 0x3F] : '=';
    }
    return out;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 64; ++i) {
            t[static_cast<unsigned char>(kBase64Alphabet[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();

    std::vector<uint8_t> out;
    out.reserve(encoded.size() * 3 / 4);

    uint32_t acc = 0;
    int bits = 0;
    for (unsigned char c : encoded) {
        int v = table[c];
        if (v < 0) continue;  // padding, whitespace
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::key(const std::string& name) {
    std::string k = name;
    std::transform(k.begin(), k.end(), k.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return k;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    values_[key(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    values_[key(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = values_.find(key(name));
    if (it == values_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

std::vector<std::string> HttpHeaders::get_all(const std::string& name) const {
    auto it = values_.find(key(name));
    return it == values_.end() ? std::vector<std::string>{} : it->second;
}

bool HttpHeaders::has(const std::string& name) const {
    return values_.count(key(name)) > 0;
}

std::vector<std::pair<std::string, std::string>> HttpHeaders::all() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [name, list] : values_) {
        for (const auto& value : list) out.emplace_back(name, value);
    }
    return out;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_content_length(size_t length) {
    set("Content-Length", std::to_string(length));
}

void HttpHeaders::set_bearer_token(const std::string& token) {
    set("Authorization", "Bearer " + token);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

static HttpRequest make_request(HttpMethod method, const std::string& url,
                                std::vector<uint8_t> body = {}) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::get(const std::string& url) {
    return make_request(HttpMethod::GET, url);
}

HttpRequest HttpRequest::post(const std::string& url, const std::vector<uint8_t>& body) {
    return make_request(HttpMethod::POST, url, body);
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    return make_request(HttpMethod::POST, url, std::vector<uint8_t>(body.begin(), body.end()));
}

HttpRequest HttpRequest::put(const std::string& url, const std::vector<uint8_t>& body) {
    return make_request(HttpMethod::PUT, url, body);
}

HttpRequest HttpRequest::del(const std::string& url) {
    return make_request(HttpMethod::DELETE, url);
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// curl callbacks
// ============================================================================

namespace {

// Success bodies go to the caller's sink when there is one; everything
// else is buffered up to max_size
struct BodyWriter {
    CURL* curl = nullptr;
    const HttpBodySink* sink = nullptr;
    std::vector<uint8_t> buffer;
    size_t max_size = 0;
    bool too_large = false;
    bool sink_refused = false;
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* w = static_cast<BodyWriter*>(userdata);
    size_t bytes = size * nmemb;

    long code = 0;
    curl_easy_getinfo(w->curl, CURLINFO_RESPONSE_CODE, &code);

    if (w->sink && *w->sink && is_success_status(static_cast<int>(code))) {
        if (!(*w->sink)(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
            w->sink_refused = true;
            return 0;
        }
        return bytes;
    }

    if (w->max_size > 0 && w->buffer.size() + bytes > w->max_size) {
        w->too_large = true;
        return 0;
    }
    w->buffer.insert(w->buffer.end(), ptr, ptr + bytes);
    return bytes;
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    // A new status line starts a new header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        auto value_start = line.find_first_not_of(" \t", colon + 1);
        headers->add(line.substr(0, colon),
                     value_start == std::string::npos ? "" : line.substr(value_start));
    }
    return bytes;
}

struct BodyReader {
    const uint8_t* data;
    size_t size;
    size_t pos;
};

size_t on_read(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* r = static_cast<BodyReader*>(userdata);
    size_t n = std::min(size * nitems, r->size - r->pos);
    if (n > 0) {
        std::memcpy(buffer, r->data + r->pos, n);
        r->pos += n;
    }
    return n;
}

// Non-zero aborts the transfer
int on_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* token = static_cast<CancellationToken*>(clientp);
    return token && token->cancelled() ? 1 : 0;
}

void set_method(CURL* curl, HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            break;
        case HttpMethod::PUT:
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            break;
        case HttpMethod::HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::DELETE:
        case HttpMethod::OPTIONS:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, http_method_to_string(method));
            break;
    }
}

}  // namespace

// ============================================================================
// HttpClient
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag curl_init;
        std::call_once(curl_init, [] { curl_global_init(CURL_GLOBAL_ALL); });

        if (auto pool = env_in_range("OBJXFER_CONNECTION_POOL_SIZE", 1, 1000)) {
            config_.idle_connections = *pool;
        }
        if (auto secs = env_in_range("OBJXFER_REQUEST_TIMEOUT", 5, 3600)) {
            timeout_override_ = std::chrono::seconds(*secs);
        }
    }

    ~Impl() {
        std::lock_guard lock(pool_mutex_);
        for (CURL* handle : idle_) curl_easy_cleanup(handle);
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        if (request.cancel_token && request.cancel_token->cancelled()) {
            response.error = "Request cancelled";
            response.cancelled = true;
            return response;
        }

        CURL* curl = acquire();
        if (!curl) {
            response.error = "No free connection (limit " +
                             std::to_string(config_.max_connections) + ")";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        set_method(curl, request.method);

        struct curl_slist* header_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            // curl derives Content-Length from the body
            if (name == "content-length") continue;
            header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
        }
        // No "Expect: 100-continue" round trip before chunk PUTs
        header_list = curl_slist_append(header_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        BodyReader reader{request.body.data(), request.body.size(), 0};
        if (request.method == HttpMethod::PUT) {
            // An empty PUT still carries Content-Length: 0 (offset probes)
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_read);
            curl_easy_setopt(curl, CURLOPT_READDATA, &reader);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        } else if (request.method == HttpMethod::POST) {
            // Null POSTFIELDS would make curl read from stdin
            const void* fields = request.body.empty()
                ? static_cast<const void*>("")
                : static_cast<const void*>(request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, fields);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        BodyWriter writer;
        writer.curl = curl;
        writer.sink = &request.body_sink;
        writer.max_size = config_.max_response_size;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &writer);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        if (request.cancel_token) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, on_progress);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, request.cancel_token.get());
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        auto timeout = timeout_override_.count() > 0
            ? std::chrono::duration_cast<std::chrono::milliseconds>(timeout_override_)
            : request.total_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                             static_cast<long>(config_.tcp_keepalive_idle.count()));
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                             static_cast<long>(config_.tcp_keepalive_interval.count()));
        }

        bool verify = request.verify_ssl && config_.verify_ssl;
        if (!verify) {
            static std::once_flag warned;
            std::call_once(warned, [] {
                log_warn("TLS certificate verification is disabled");
            });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

        const std::string& ca = request.ca_bundle_path.empty() ? config_.ca_bundle
                                                               : request.ca_bundle_path;
        if (!ca.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, ca.c_str());
        }

        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }

        // 308 is "resume incomplete" for upload sessions, not a redirect
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        if (config_.curl_verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        auto started = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (res == CURLE_OK) {
            long code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
            response.status_code = static_cast<int>(code);
            response.body = std::move(writer.buffer);
        } else if (res == CURLE_WRITE_ERROR && writer.too_large) {
            response.error = "Response body larger than " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else if (res == CURLE_WRITE_ERROR && writer.sink_refused) {
            response.error = "Response sink rejected data";
        } else if (res == CURLE_ABORTED_BY_CALLBACK &&
                   request.cancel_token && request.cancel_token->cancelled()) {
            response.error = "Request cancelled";
            response.cancelled = true;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        log_debug("%s %s -> %d (%lld ms)", http_method_to_string(request.method),
                  request.url.c_str(), response.status_code,
                  static_cast<long long>(response.total_time.count()));

        curl_slist_free_all(header_list);
        release(curl);
        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    CURL* acquire() {
        std::lock_guard lock(pool_mutex_);
        if (!idle_.empty()) {
            CURL* handle = idle_.back();
            idle_.pop_back();
            ++in_use_;
            return handle;
        }
        if (in_use_ >= config_.max_connections) return nullptr;
        CURL* handle = curl_easy_init();
        if (handle) ++in_use_;
        return handle;
    }

    void release(CURL* handle) {
        std::lock_guard lock(pool_mutex_);
        --in_use_;
        if (idle_.size() < config_.idle_connections) {
            curl_easy_reset(handle);
            idle_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::chrono::seconds timeout_override_{0};

    std::mutex pool_mutex_;
    std::vector<CURL*> idle_;
    size_t in_use_ = 0;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

}  // namespace objxfer::net
