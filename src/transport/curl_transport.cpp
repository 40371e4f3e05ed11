/*
 * curl_transport.cpp
 *
 * Notes
 * - ITransport on the libcurl easy API, one easy handle per request so a single instance can be
 *   shared across threads.
 * - Cancellation is cooperative: the transfer-info callback polls the caller's stop_token and
 *   aborts the transfer, which surfaces as TransportFailure::Cancelled.
 * - Redirects are not followed; the sidecar never issues them for the APIs we call.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <sidecar/transport/transport.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <memory>
#include <mutex>
#include <string_view>

namespace sidecar::transport {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode (plus the OS errno of the failed connect) to TransportError
static TransportError makeCurlError(CURLcode code, long osErrno, std::string_view where) {
    TransportError err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.kind = TransportFailure::None;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.kind = TransportFailure::Cancelled;
            break;
        case CURLE_COULDNT_CONNECT:
            err.kind = osErrno == ECONNREFUSED ? TransportFailure::ConnectionRefused
                                               : TransportFailure::Network;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            err.kind = TransportFailure::Resolve;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.kind = TransportFailure::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.kind = TransportFailure::Tls;
            break;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            err.kind = TransportFailure::Network;
            break;
        default:
            err.kind = TransportFailure::Unknown;
            break;
    }
    return err;
}

// Per-request response accumulator
struct ResponseContext {
    HttpResponse response;
    std::stop_token stop;
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<ResponseContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // A new status line (e.g. after "100 Continue") starts a fresh header block
    if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
        ctx->response.headers.clear();
        ctx->response.contentLength.reset();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    Header h{trim(line.substr(0, colon)), trim(line.substr(colon + 1))};
    if (to_lower(h.name) == "content-length") {
        std::uint64_t tmp{0};
        const char* first = h.value.data();
        const char* last = h.value.data() + h.value.size();
        auto res = std::from_chars(first, last, tmp);
        if (res.ec == std::errc()) {
            ctx->response.contentLength = tmp;
        }
    }
    ctx->response.headers.push_back(std::move(h));
    return total;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<ResponseContext*>(userdata);
    if (ctx->stop.stop_requested())
        return 0; // CURLE_WRITE_ERROR; remapped to Cancelled below

    ctx->response.body.append(ptr, total);
    return total;
}

// CURL transfer-info callback: non-zero return aborts the transfer
static int xferinfo_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<ResponseContext*>(clientp);
    return (ctx != nullptr && ctx->stop.stop_requested()) ? 1 : 0;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const HttpRequest& request) {
    curl_slist* list = nullptr;
    if (request.body) {
        std::string ct = "Content-Type: " + request.contentType;
        list = curl_slist_append(list, ct.c_str());
    }
    // Disable "Expect: 100-continue" round trips on larger bodies
    list = curl_slist_append(list, "Expect:");
    for (const auto& h : request.headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

static void ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

class CurlTransport final : public ITransport {
public:
    explicit CurlTransport(TransportOptions options) : options_(std::move(options)) {
        ensure_global_init();
    }
    ~CurlTransport() override = default;

    Expected<HttpResponse> send(const HttpRequest& request, std::stop_token stop) override {
        if (stop.stop_requested()) {
            return TransportError{TransportFailure::Cancelled, "cancelled before send"};
        }

        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                                 &curl_easy_cleanup);
        if (!curl) {
            return TransportError{TransportFailure::Unknown, "curl_easy_init failed"};
        }
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> list(
            build_header_list(request), &curl_slist_free_all);

        ResponseContext ctx;
        ctx.stop = stop;

        CURL* h = curl.get();
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(h, CURLOPT_USERAGENT, options_.userAgent.c_str());

        // Method and body
        if (request.method == "GET" && !request.body) {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        } else if (request.method == "HEAD") {
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        } else {
            if (request.method != "POST") {
                curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
            if (request.body) {
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body->size()));
                curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body->data());
            } else if (request.method == "POST" || request.method == "PUT" ||
                       request.method == "PATCH") {
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
                curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
            }
        }

        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);

        // Timeouts
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options_.connectTimeout.count()));
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);

        spdlog::debug("{} {}", request.method, request.url);
        CURLcode rc = curl_easy_perform(h);

        if (stop.stop_requested() &&
            (rc == CURLE_ABORTED_BY_CALLBACK || rc == CURLE_WRITE_ERROR)) {
            return TransportError{TransportFailure::Cancelled, "request cancelled"};
        }
        if (rc != CURLE_OK) {
            long osErrno = 0;
            curl_easy_getinfo(h, CURLINFO_OS_ERRNO, &osErrno);
            auto err = makeCurlError(rc, osErrno, request.method + " " + request.url);
            spdlog::debug("transport failure ({}): {}", transportFailureName(err.kind),
                          err.message);
            return err;
        }

        long status = 0;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
        ctx.response.status = static_cast<int>(status);
        spdlog::debug("{} {} -> {} ({} bytes)", request.method, request.url, status,
                      ctx.response.body.size());
        return std::move(ctx.response);
    }

private:
    TransportOptions options_;
};

std::shared_ptr<ITransport> makeCurlTransport(const TransportOptions& options) {
    return std::make_shared<CurlTransport>(options);
}

} // namespace sidecar::transport
