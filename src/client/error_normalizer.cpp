#include <sidecar/client/error_normalizer.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace sidecar::client {

namespace {

// String members are taken verbatim; any other JSON value is rendered as text
std::string readField(const nlohmann::json& obj, const char* name) {
    auto it = obj.find(name);
    if (it == obj.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

} // namespace

Error normalizeTransportError(const transport::TransportError& error) {
    using transport::TransportFailure;
    switch (error.kind) {
        case TransportFailure::ConnectionRefused:
            return Error{ErrorCode::SidecarNotPresent, 503, error_codes::kSidecarDoesNotExist,
                         kSidecarNotPresentMessage, error.message};
        case TransportFailure::Cancelled:
            return Error{ErrorCode::OperationCancelled,
                         error.message.empty() ? "operation cancelled" : error.message};
        default:
            return Error{ErrorCode::SidecarError, 500, error_codes::kRequestFailed, error.message,
                         std::string(transport::transportFailureName(error.kind))};
    }
}

Error interpretErrorResponse(const transport::HttpResponse& response) {
    std::string errorCode;
    std::string errorMessage;

    const bool declaredEmpty = response.contentLength && *response.contentLength == 0;
    if (!declaredEmpty && !response.body.empty()) {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(response.body);
        } catch (const nlohmann::json::parse_error& e) {
            return Error{ErrorCode::SidecarError, response.status, error_codes::kUnknown,
                         kInvalidJsonErrorBodyMessage, std::string(e.what())};
        }

        if (body.is_object()) {
            errorMessage = readField(body, "message");
            errorCode = readField(body, "errorCode");
        }
    }

    // A sidecar-specific 404 (e.g. actor state lookups) must not be masked by the default
    if (response.status == 404) {
        return Error{ErrorCode::SidecarError, response.status,
                     errorCode.empty() ? error_codes::kDoesNotExist : errorCode,
                     errorMessage.empty() ? kNotConfiguredMessage : errorMessage};
    }

    return Error{ErrorCode::SidecarError, response.status,
                 errorCode.empty() ? error_codes::kUnknown : errorCode,
                 errorMessage.empty() ? kNoMeaningfulMessage : errorMessage};
}

Result<transport::HttpResponse> performCall(transport::ITransport& transport,
                                            const transport::HttpRequest& request,
                                            std::stop_token stop) {
    auto sent = transport.send(request, stop);
    if (!sent.ok()) {
        auto err = normalizeTransportError(sent.error());
        if (err.code == ErrorCode::OperationCancelled) {
            spdlog::debug("{} {} cancelled", request.method, request.url);
        } else {
            spdlog::error("{} {} failed: {}", request.method, request.url, err.describe());
        }
        return err;
    }

    auto response = std::move(sent).value();
    if (response.isSuccess()) {
        return response;
    }

    auto err = interpretErrorResponse(response);
    spdlog::warn("{} {} returned {}", request.method, request.url, err.describe());
    return err;
}

} // namespace sidecar::client
