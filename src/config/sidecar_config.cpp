#include <sidecar/config/config_helpers.h>
#include <sidecar/config/sidecar_config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>

namespace sidecar::config {

namespace {

std::optional<int> parsePort(const std::optional<std::string>& value) {
    if (!value) {
        return std::nullopt;
    }
    auto parsed = parse_int(*value);
    if (!parsed || *parsed < 0 || *parsed > 65535) {
        return std::nullopt;
    }
    return static_cast<int>(*parsed);
}

} // namespace

std::optional<std::string> EnvironmentNameResolver::resolve(std::string_view name) const {
    if (const char* env = std::getenv(std::string(name).c_str()); env) {
        return std::string(env);
    }
    return std::nullopt;
}

std::optional<std::string> MapNameResolver::resolve(std::string_view name) const {
    auto it = values_.find(std::string(name));
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string stripTrailingSlash(std::string address) {
    if (!address.empty() && address.back() == '/') {
        address.pop_back();
    }
    return address;
}

std::string defaultAddressForPort(const std::optional<std::string>& portValue) {
    auto port = parsePort(portValue).value_or(kDefaultHttpPort);
    return "http://localhost:" + std::to_string(port);
}

SidecarConfig SidecarConfig::fromEnvironment(const INameResolver& resolver) {
    SidecarConfig cfg;
    auto portValue = resolver.resolve(kHttpPortVariable);
    if (portValue && !parsePort(portValue)) {
        spdlog::warn("{}='{}' is not a valid port; using {}", kHttpPortVariable, *portValue,
                     kDefaultHttpPort);
    }
    cfg.baseAddress = defaultAddressForPort(portValue);
    return cfg;
}

SidecarConfig SidecarConfig::fromEnvironment() {
    EnvironmentNameResolver resolver;
    return fromEnvironment(resolver);
}

Result<SidecarConfig> loadSidecarConfig(const std::filesystem::path& configPath,
                                        const INameResolver& resolver) {
    SidecarConfig cfg;

    std::error_code ec;
    const bool haveFile = !configPath.empty() && std::filesystem::exists(configPath, ec);
    if (haveFile) {
        spdlog::debug("Reading sidecar configuration from {}", configPath.string());

        if (auto address = parse_config_value(configPath, "sidecar", "address");
            !address.empty()) {
            cfg.baseAddress = stripTrailingSlash(address);
        } else if (auto port = parse_config_value(configPath, "sidecar", "http_port");
                   !port.empty()) {
            if (!parsePort(port)) {
                return Error{ErrorCode::InvalidArgument,
                             "Invalid sidecar.http_port in " + configPath.string() + ": " + port};
            }
            cfg.baseAddress = defaultAddressForPort(port);
        }

        if (auto raw = parse_config_value(configPath, "sidecar", "timeout_ms"); !raw.empty()) {
            auto ms = parse_ms(raw);
            if (!ms) {
                return Error{ErrorCode::InvalidArgument,
                             "Invalid sidecar.timeout_ms in " + configPath.string() + ": " + raw};
            }
            cfg.timeout = *ms;
        }
        if (auto raw = parse_config_value(configPath, "sidecar", "connect_timeout_ms");
            !raw.empty()) {
            auto ms = parse_ms(raw);
            if (!ms) {
                return Error{ErrorCode::InvalidArgument, "Invalid sidecar.connect_timeout_ms in " +
                                                             configPath.string() + ": " + raw};
            }
            cfg.connectTimeout = *ms;
        }
    }

    // Environment wins over the file
    if (auto portValue = resolver.resolve(kHttpPortVariable); portValue) {
        if (parsePort(portValue)) {
            cfg.baseAddress = defaultAddressForPort(portValue);
        } else if (!haveFile) {
            spdlog::warn("{}='{}' is not a valid port; using {}", kHttpPortVariable, *portValue,
                         kDefaultHttpPort);
        }
    }

    return cfg;
}

} // namespace sidecar::config
