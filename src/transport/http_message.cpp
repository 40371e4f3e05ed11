#include <sidecar/transport/transport.hpp>

#include <cctype>

namespace sidecar::transport {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

const char* transportFailureName(TransportFailure failure) noexcept {
    switch (failure) {
        case TransportFailure::None:
            return "none";
        case TransportFailure::ConnectionRefused:
            return "connection refused";
        case TransportFailure::Resolve:
            return "name resolution failed";
        case TransportFailure::Timeout:
            return "timed out";
        case TransportFailure::Tls:
            return "TLS failure";
        case TransportFailure::Network:
            return "network failure";
        case TransportFailure::Cancelled:
            return "cancelled";
        case TransportFailure::Unknown:
            return "unknown failure";
    }
    return "unknown failure";
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    for (const auto& h : headers) {
        if (iequals(h.name, name)) {
            return h.value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> HttpResponse::etag() const {
    auto raw = header("etag");
    if (!raw || raw->empty()) {
        return std::nullopt;
    }
    std::string_view v(*raw);
    if (v.size() >= 2 && (v[0] == 'W' || v[0] == 'w') && v[1] == '/') {
        v.remove_prefix(2);
    }
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        v = v.substr(1, v.size() - 2);
    }
    if (v.empty()) {
        return std::nullopt;
    }
    return std::string(v);
}

std::string escapePathSegment(std::string_view segment) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        // RFC 3986 unreserved characters pass through
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace sidecar::transport
