#include <charconv>
#include <fstream>
#include <sidecar/config/config_helpers.h>

namespace sidecar::config {

std::optional<long> parse_int(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty()) {
        return std::nullopt;
    }
    long out = 0;
    const char* first = v.data();
    const char* last = v.data() + v.size();
    auto res = std::from_chars(first, last, out);
    if (res.ec != std::errc() || res.ptr != last) {
        return std::nullopt;
    }
    return out;
}

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    auto v = parse_int(s);
    if (!v || *v < 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(*v);
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quotes
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        } else {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "sidecar.http_port" and "[sidecar] http_port"
        if (k == section + "." + key ||
            ((section.empty() || currentSection == section) && k == key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* env = std::getenv("SIDECAR_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "sidecar" / "config.toml";
    }

    return configHome / "sidecar" / "config.toml";
}

} // namespace sidecar::config
