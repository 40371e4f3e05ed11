#pragma once

#include <sidecar/core/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sidecar::config {

inline constexpr const char* kHttpPortVariable = "DAPR_HTTP_PORT";
inline constexpr int kDefaultHttpPort = 3500;

/**
 * Resolves a setting name (e.g. "DAPR_HTTP_PORT") to its value.
 * Hosts plug their own lookup in here; the default reads the process environment.
 */
class INameResolver {
public:
    virtual ~INameResolver() = default;
    virtual std::optional<std::string> resolve(std::string_view name) const = 0;
};

class EnvironmentNameResolver final : public INameResolver {
public:
    std::optional<std::string> resolve(std::string_view name) const override;
};

// Fixed lookup table, used by hosts that already hold their settings and by tests
class MapNameResolver final : public INameResolver {
public:
    MapNameResolver() = default;
    explicit MapNameResolver(std::unordered_map<std::string, std::string> values)
        : values_(std::move(values)) {}

    std::optional<std::string> resolve(std::string_view name) const override;

private:
    std::unordered_map<std::string, std::string> values_;
};

/**
 * Immutable client configuration. baseAddress is the default sidecar address used when a
 * call does not pass its own; it never carries a trailing slash.
 */
struct SidecarConfig {
    std::string baseAddress{"http://localhost:3500"};
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds connectTimeout{10000};
    std::string userAgent{"sidecar-client"};

    // http://localhost:<DAPR_HTTP_PORT>, falling back to 3500 when unset or unparseable
    static SidecarConfig fromEnvironment(const INameResolver& resolver);
    static SidecarConfig fromEnvironment();
};

// Default sidecar address for a port value as read from the environment
std::string defaultAddressForPort(const std::optional<std::string>& portValue);

// Strip a single trailing '/'
std::string stripTrailingSlash(std::string address);

/**
 * Build configuration from a config.toml [sidecar] section overlaid with the environment:
 *   [sidecar]
 *   address = "http://localhost:3500"   # full base address, wins over http_port
 *   http_port = 3500
 *   timeout_ms = 60000
 *   connect_timeout_ms = 10000
 * DAPR_HTTP_PORT from the resolver overrides both address and http_port. A missing file is not
 * an error; unparseable timeouts are.
 */
Result<SidecarConfig> loadSidecarConfig(const std::filesystem::path& configPath,
                                        const INameResolver& resolver);

} // namespace sidecar::config
