#include <sidecar/client/error_normalizer.hpp>
#include <sidecar/client/sidecar_client.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace sidecar::client {

using nlohmann::json;
using transport::escapePathSegment;
using transport::HttpRequest;
using transport::HttpResponse;

namespace {

Error invalidArgument(std::string_view name) {
    return Error{ErrorCode::InvalidArgument, std::string(name) + " must not be empty"};
}

// RFC 9110 token characters
bool isMethodToken(std::string_view verb) {
    static constexpr std::string_view kSpecials = "!#$%&'*+-.^_`|~";
    if (verb.empty())
        return false;
    return std::all_of(verb.begin(), verb.end(), [](unsigned char c) {
        return std::isalnum(c) || kSpecials.find(static_cast<char>(c)) != std::string_view::npos;
    });
}

// Request bodies travel as JSON text, so every string in them must be valid UTF-8
Result<std::string> serializeBody(const json& value, std::string_view what) {
    try {
        return value.dump();
    } catch (const json::type_error& e) {
        Error err{ErrorCode::InvalidArgument, std::string(what) + " cannot be sent as JSON text"};
        err.cause = e.what();
        return err;
    }
}

std::string toUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // namespace

SidecarClient::SidecarClient(std::shared_ptr<transport::ITransport> transport,
                             config::SidecarConfig config)
    : transport_(std::move(transport)), config_(std::move(config)),
      defaultAddress_(config::stripTrailingSlash(config_.baseAddress.empty()
                                                     ? config::defaultAddressForPort(std::nullopt)
                                                     : config_.baseAddress)) {
    if (!transport_) {
        throw std::invalid_argument("SidecarClient requires a transport");
    }
    spdlog::debug("Sidecar client using default address {}", defaultAddress_);
}

SidecarClient::SidecarClient(config::SidecarConfig config)
    : SidecarClient(transport::makeCurlTransport(transport::TransportOptions{
                        config.timeout, config.connectTimeout, config.userAgent}),
                    config) {}

std::string SidecarClient::resolveAddress(const std::optional<std::string>& address) const {
    if (address && !address->empty()) {
        return config::stripTrailingSlash(*address);
    }
    return defaultAddress_;
}

Result<HttpResponse> SidecarClient::call(HttpRequest request, std::stop_token stop) {
    return performCall(*transport_, request, stop);
}

Result<void> SidecarClient::saveState(const std::optional<std::string>& address,
                                      std::string_view stateStore,
                                      const std::vector<StateRecord>& values,
                                      std::stop_token stop) {
    if (stateStore.empty()) {
        return invalidArgument("stateStore");
    }

    auto body = serializeBody(json(values), "state value");
    if (!body) {
        return body.error();
    }

    HttpRequest req;
    req.method = "POST";
    req.url = resolveAddress(address) + "/v1.0/state/" + escapePathSegment(stateStore);
    req.body = std::move(body).value();

    auto res = call(std::move(req), stop);
    if (!res) {
        return res.error();
    }
    spdlog::debug("Saved {} record(s) to state store '{}'", values.size(), stateStore);
    return {};
}

Result<StateRecord> SidecarClient::getState(const std::optional<std::string>& address,
                                            std::string_view stateStore, std::string_view key,
                                            std::stop_token stop) {
    if (stateStore.empty()) {
        return invalidArgument("stateStore");
    }
    if (key.empty()) {
        return invalidArgument("key");
    }

    HttpRequest req;
    req.method = "GET";
    req.url = resolveAddress(address) + "/v1.0/state/" + escapePathSegment(stateStore) + "/" +
              escapePathSegment(key);

    auto res = call(std::move(req), stop);
    if (!res) {
        return res.error();
    }

    auto response = std::move(res).value();
    StateRecord record(std::string(key), std::move(response.body), response.etag());
    return record;
}

Result<void> SidecarClient::deleteState(const std::optional<std::string>& address,
                                        std::string_view stateStore, std::string_view key,
                                        const std::optional<std::string>& etag,
                                        std::stop_token stop) {
    if (stateStore.empty()) {
        return invalidArgument("stateStore");
    }
    if (key.empty()) {
        return invalidArgument("key");
    }

    HttpRequest req;
    req.method = "DELETE";
    req.url = resolveAddress(address) + "/v1.0/state/" + escapePathSegment(stateStore) + "/" +
              escapePathSegment(key);
    if (etag && !etag->empty()) {
        req.headers.push_back({"If-Match", *etag});
    }

    auto res = call(std::move(req), stop);
    if (!res) {
        return res.error();
    }
    return {};
}

Result<void> SidecarClient::invokeMethod(const std::optional<std::string>& address,
                                         std::string_view appId, std::string_view methodName,
                                         std::string_view httpVerb,
                                         const std::optional<json>& body, std::stop_token stop) {
    if (appId.empty()) {
        return invalidArgument("appId");
    }
    if (methodName.empty()) {
        return invalidArgument("methodName");
    }
    if (!isMethodToken(httpVerb)) {
        return Error{ErrorCode::InvalidArgument,
                     "httpVerb is not a valid HTTP method: '" + std::string(httpVerb) + "'"};
    }

    HttpRequest req;
    req.method = toUpper(httpVerb);
    // Method names may address nested routes ("orders/123"), so they are not escaped
    req.url = resolveAddress(address) + "/v1.0/invoke/" + escapePathSegment(appId) + "/method/" +
              std::string(methodName);
    if (body) {
        auto text = serializeBody(*body, "invocation body");
        if (!text) {
            return text.error();
        }
        req.body = std::move(text).value();
    }

    auto res = call(std::move(req), stop);
    if (!res) {
        return res.error();
    }
    return {};
}

Result<void> SidecarClient::sendToBinding(const std::optional<std::string>& address,
                                          const BindingMessage& message, std::stop_token stop) {
    if (message.bindingName.empty()) {
        return invalidArgument("bindingName");
    }

    auto body = serializeBody(json(message), "binding data");
    if (!body) {
        return body.error();
    }

    HttpRequest req;
    req.method = "POST";
    req.url = resolveAddress(address) + "/v1.0/bindings/" + escapePathSegment(message.bindingName);
    req.body = std::move(body).value();

    auto res = call(std::move(req), stop);
    if (!res) {
        return res.error();
    }
    return {};
}

Result<void> SidecarClient::publishEvent(const std::optional<std::string>& address,
                                         std::string_view pubSubName, std::string_view topic,
                                         const std::optional<std::string>& payload,
                                         std::stop_token stop) {
    if (pubSubName.empty()) {
        return invalidArgument("pubSubName");
    }
    if (topic.empty()) {
        return invalidArgument("topic");
    }

    HttpRequest req;
    req.method = "POST";
    req.url = resolveAddress(address) + "/v1.0/publish/" + escapePathSegment(pubSubName) + "/" +
              escapePathSegment(topic);
    if (payload) {
        req.body = *payload;
    }

    auto res = call(std::move(req), stop);
    if (!res) {
        return res.error();
    }
    return {};
}

Result<json> SidecarClient::getSecret(const std::optional<std::string>& address,
                                      std::string_view secretStore, std::string_view key,
                                      const std::optional<std::string>& metadata,
                                      std::stop_token stop) {
    if (secretStore.empty()) {
        return invalidArgument("secretStore");
    }
    if (key.empty()) {
        return invalidArgument("key");
    }

    std::string metadataQuery;
    if (metadata && !metadata->empty()) {
        metadataQuery = metadata->front() == '?' ? *metadata : "?" + *metadata;
    }

    HttpRequest req;
    req.method = "GET";
    req.url = resolveAddress(address) + "/v1.0/secrets/" + escapePathSegment(secretStore) + "/" +
              escapePathSegment(key) + metadataQuery;

    auto res = call(std::move(req), stop);
    if (!res) {
        return res.error();
    }

    const auto& response = res.value();
    if (response.body.empty()) {
        return json::object();
    }
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, response.status, error_codes::kInvalidJson,
                     "secret payload is not valid JSON", std::string(e.what())};
    }
}

} // namespace sidecar::client
