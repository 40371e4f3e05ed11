#pragma once

/*
 * SidecarClient - typed access to the sidecar HTTP API (state, invoke, bindings, pub/sub,
 * secrets).
 *
 * Every operation:
 * - validates its required arguments locally (InvalidArgument, no network traffic),
 * - resolves the sidecar address (per-call override or the configured default),
 * - issues exactly one HTTP request through the shared transport,
 * - returns the typed result or a normalized Error (see error_normalizer.hpp).
 *
 * Operations are cancellable through the std::stop_token they take; cancellation yields
 * ErrorCode::OperationCancelled. The client holds no mutable state and may be used from many
 * threads at once.
 */

#include <sidecar/client/models.hpp>
#include <sidecar/config/sidecar_config.h>
#include <sidecar/core/types.h>
#include <sidecar/transport/transport.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sidecar::client {

class SidecarClient {
public:
    SidecarClient(std::shared_ptr<transport::ITransport> transport, config::SidecarConfig config);

    // Default transport (libcurl) configured from config's timeouts
    explicit SidecarClient(config::SidecarConfig config);

    SidecarClient(const SidecarClient&) = delete;
    SidecarClient& operator=(const SidecarClient&) = delete;

    /**
     * Per-call address override or the configured default, with one trailing '/' removed.
     */
    [[nodiscard]] std::string resolveAddress(const std::optional<std::string>& address) const;

    [[nodiscard]] const std::string& defaultAddress() const noexcept { return defaultAddress_; }

    // POST /v1.0/state/{store}
    Result<void> saveState(const std::optional<std::string>& address, std::string_view stateStore,
                           const std::vector<StateRecord>& values, std::stop_token stop = {});

    // GET /v1.0/state/{store}/{key}; the ETag header becomes the record's etag
    Result<StateRecord> getState(const std::optional<std::string>& address,
                                 std::string_view stateStore, std::string_view key,
                                 std::stop_token stop = {});

    // DELETE /v1.0/state/{store}/{key}; sends If-Match when etag is given
    Result<void> deleteState(const std::optional<std::string>& address,
                             std::string_view stateStore, std::string_view key,
                             const std::optional<std::string>& etag = std::nullopt,
                             std::stop_token stop = {});

    // {verb} /v1.0/invoke/{app}/method/{method}; body is JSON-serialized when present
    Result<void> invokeMethod(const std::optional<std::string>& address, std::string_view appId,
                              std::string_view methodName, std::string_view httpVerb,
                              const std::optional<nlohmann::json>& body,
                              std::stop_token stop = {});

    // POST /v1.0/bindings/{bindingName}
    Result<void> sendToBinding(const std::optional<std::string>& address,
                               const BindingMessage& message, std::stop_token stop = {});

    // POST /v1.0/publish/{pubsub}/{topic}; payload is raw JSON text sent byte-for-byte
    Result<void> publishEvent(const std::optional<std::string>& address, std::string_view pubSubName,
                              std::string_view topic, const std::optional<std::string>& payload,
                              std::stop_token stop = {});

    // GET /v1.0/secrets/{store}/{key}[?metadata]; the body must be a JSON document
    Result<nlohmann::json> getSecret(const std::optional<std::string>& address,
                                     std::string_view secretStore, std::string_view key,
                                     const std::optional<std::string>& metadata = std::nullopt,
                                     std::stop_token stop = {});

private:
    Result<transport::HttpResponse> call(transport::HttpRequest request, std::stop_token stop);

    std::shared_ptr<transport::ITransport> transport_;
    config::SidecarConfig config_;
    const std::string defaultAddress_;
};

} // namespace sidecar::client
