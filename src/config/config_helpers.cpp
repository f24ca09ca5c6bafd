#include <dlkit/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>

namespace dlkit::config {

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

        // Remove inline comments (outside of quotes)
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

        // Support both "downloader.buffer_size" and "[downloader] buffer_size"
        const bool inSection = section.empty() || currentSection == section;
        if ((inSection && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    if (const char* cfg_env = std::getenv("DLKIT_CONFIG"); cfg_env && *cfg_env) {
        return expand_tilde(cfg_env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "dlkit" / "config.toml";
    }

    return configHome / "dlkit" / "config.toml";
}

std::string resolve_value(const char* env_name, const std::string& section,
                          const std::string& key) {
    if (env_name) {
        if (const char* env = std::getenv(env_name); env && *env) {
            return env;
        }
    }
    auto path = get_config_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return "";
    }
    return parse_config_value(path, section, key);
}

std::optional<long long> parse_integer(std::string_view s) {
    std::string v(s);
    trim(v);
    long long out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc() || ptr != v.data() + v.size()) {
        return std::nullopt;
    }
    return out;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return false;
    }
    return std::nullopt;
}

bool apply_log_level(std::string_view level) {
    std::string v(level);
    trim(v);
    if (v.empty()) {
        return false;
    }
    auto lvl = spdlog::level::from_str(v);
    // from_str maps unknown names to off; only accept "off" when it was asked for.
    if (lvl == spdlog::level::off && v != "off") {
        spdlog::warn("unknown log level '{}', keeping {}", v,
                     spdlog::level::to_string_view(spdlog::get_level()));
        return false;
    }
    spdlog::set_level(lvl);
    return true;
}

} // namespace dlkit::config
