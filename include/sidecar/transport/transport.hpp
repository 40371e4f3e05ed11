#pragma once

/*
 * Sidecar transport - HTTP request/response types and the transport interface.
 *
 * The client never talks to libcurl directly; it goes through ITransport so that hosts can
 * supply their own HTTP stack and tests can substitute a mock. Implementations must be
 * thread-safe: a single instance is shared by every call a client makes.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sidecar::transport {

/**
 * Transport-level failure categories (no HTTP response was obtained).
 */
enum class TransportFailure {
    None = 0,
    ConnectionRefused,
    Resolve,
    Timeout,
    Tls,
    Network,
    Cancelled,
    Unknown
};

const char* transportFailureName(TransportFailure failure) noexcept;

struct TransportError {
    TransportFailure kind{TransportFailure::None};
    std::string message;
};

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<Header> headers;
    std::optional<std::string> body; // nullopt = no content at all
    std::string contentType{"application/json"};
};

struct HttpResponse {
    int status{0};
    std::vector<Header> headers;
    std::string body;
    // Declared Content-Length, when the server sent one
    std::optional<std::uint64_t> contentLength;

    [[nodiscard]] bool isSuccess() const noexcept { return status >= 200 && status < 300; }

    // First header with this name (case-insensitive)
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    // ETag with surrounding quotes and a weak "W/" prefix removed
    [[nodiscard]] std::optional<std::string> etag() const;
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for the transport seam.
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const TransportError& e) : _ok(false), _error(e) {}
    Expected(TransportError&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const TransportError& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    TransportError _error{};
};

struct TransportOptions {
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds connectTimeout{10000};
    std::string userAgent{"sidecar-client"};
};

/**
 * HTTP transport abstraction (libcurl-based implementation satisfies this).
 * A response with any status code is a successful send; only failures to obtain a response
 * are reported as TransportError. A stop request while the call is outstanding must abort it
 * and report TransportFailure::Cancelled.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual Expected<HttpResponse> send(const HttpRequest& request, std::stop_token stop) = 0;
};

/**
 * Factory for the default libcurl transport.
 */
std::shared_ptr<ITransport> makeCurlTransport(const TransportOptions& options = {});

// Percent-encode a single URL path segment
std::string escapePathSegment(std::string_view segment);

} // namespace sidecar::transport
