#include <sidecar/client/models.hpp>

namespace sidecar::client {

using nlohmann::json;

void to_json(json& j, const StateOptions& options) {
    j = json::object();
    if (options.concurrency)
        j["concurrency"] = *options.concurrency;
    if (options.consistency)
        j["consistency"] = *options.consistency;
}

void to_json(json& j, const StateRecord& record) {
    j = json::object();
    j["key"] = record.key;

    // Values that already are JSON go through untouched; others are stored as strings
    auto parsed = json::parse(record.value, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        j["value"] = record.value;
    } else {
        j["value"] = std::move(parsed);
    }

    if (record.etag && !record.etag->empty())
        j["etag"] = *record.etag;
    if (record.options)
        j["options"] = *record.options;
    if (!record.metadata.empty())
        j["metadata"] = record.metadata;
}

void to_json(json& j, const BindingMessage& message) {
    j = json::object();
    j["data"] = message.data;
    if (!message.operation.empty())
        j["operation"] = message.operation;
    if (!message.metadata.empty())
        j["metadata"] = message.metadata;
}

} // namespace sidecar::client
