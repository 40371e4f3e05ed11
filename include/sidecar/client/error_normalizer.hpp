#pragma once

#include <sidecar/core/types.h>
#include <sidecar/transport/transport.hpp>

#include <stop_token>

namespace sidecar::client {

inline constexpr const char* kSidecarNotPresentMessage =
    "Sidecar is not present. Please follow this link "
    "(https://docs.dapr.io/operations/troubleshooting/common_issues/) to debug the issue "
    "with the sidecar.";
inline constexpr const char* kInvalidJsonErrorBodyMessage = "returned error body is not valid JSON";
inline constexpr const char* kNotConfiguredMessage = "requested resource is not configured";
inline constexpr const char* kNoMeaningfulMessage = "no meaningful error message returned";

/**
 * Map a failure to obtain any response onto the error taxonomy:
 *   ConnectionRefused -> SidecarNotPresent (503, ERR_SIDECAR_DOES_NOT_EXIST)
 *   Cancelled         -> OperationCancelled
 *   anything else     -> SidecarError (500, ERR_REQUEST_FAILED, message = transport text)
 */
Error normalizeTransportError(const transport::TransportError& error);

/**
 * Build the normalized error for a non-2xx response. The sidecar's own errorCode/message
 * win; defaults only fill what the sidecar left empty. A body that is present but not JSON
 * yields ERR_UNKNOWN with the response's real status.
 */
Error interpretErrorResponse(const transport::HttpResponse& response);

/**
 * Execute one request: 2xx responses are returned unchanged, everything else becomes a
 * normalized Error. Single attempt, no retries.
 */
Result<transport::HttpResponse> performCall(transport::ITransport& transport,
                                            const transport::HttpRequest& request,
                                            std::stop_token stop);

} // namespace sidecar::client
