#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sidecar::client {

/**
 * Optimistic-concurrency and consistency hints for a state write.
 * concurrency: "first-write" | "last-write"; consistency: "eventual" | "strong".
 */
struct StateOptions {
    std::optional<std::string> concurrency;
    std::optional<std::string> consistency;
};

/**
 * One key/value entry of a state store. value holds the raw bytes as the sidecar returns them;
 * etag absent means "no concurrency check".
 */
struct StateRecord {
    std::string key;
    std::string value;
    std::optional<std::string> etag;
    std::optional<StateOptions> options;
    std::map<std::string, std::string> metadata;

    StateRecord() = default;
    StateRecord(std::string k, std::string v, std::optional<std::string> e = std::nullopt)
        : key(std::move(k)), value(std::move(v)), etag(std::move(e)) {}
};

/**
 * Message delivered to an output binding. bindingName selects the endpoint and is not part
 * of the request body.
 */
struct BindingMessage {
    std::string bindingName;
    nlohmann::json data;
    std::string operation{"create"};
    std::map<std::string, std::string> metadata;
};

// Records are written as {"key", "value", ["etag"], ["options"], ["metadata"]}; a value whose
// bytes parse as JSON is embedded as JSON, anything else as a JSON string.
void to_json(nlohmann::json& j, const StateOptions& options);
void to_json(nlohmann::json& j, const StateRecord& record);
void to_json(nlohmann::json& j, const BindingMessage& message);

} // namespace sidecar::client
