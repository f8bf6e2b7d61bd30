#include <charconv>
#include <fstream>
#include <modelflux/config/config_helpers.h>

namespace modelflux::config {

std::optional<long long> parse_int(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    long long out = 0;
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

std::optional<double> parse_double(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    char* end = nullptr;
    double out = std::strtod(v.c_str(), &end);
    if (end != v.c_str() + v.size())
        return std::nullopt;
    return out;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();
    const std::string dotted = section.empty() ? key : section + "." + key;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments (outside quotes)
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        if ((in_target_section && k == key) || (currentSection.empty() && k == dotted)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "modelflux";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "modelflux";
    }
    return std::filesystem::path("~/.config") / "modelflux";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "modelflux";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "modelflux";
    }
    return std::filesystem::current_path() / "modelflux_data";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path resolve_config_path() {
    if (const char* cfg_env = std::getenv("MODELFLUX_CONFIG"); cfg_env && *cfg_env) {
        return expand_tilde(cfg_env);
    }
    return get_config_path();
}

std::filesystem::path resolve_data_dir_from_config() {
    // 1) MODELFLUX_DATA_DIR env
    if (const char* env = std::getenv("MODELFLUX_DATA_DIR"); env && *env) {
        return expand_tilde(env);
    }

    // 2) config.toml core.data_dir
    auto config_path = resolve_config_path();
    if (!config_path.empty()) {
        if (auto v = parse_config_value(config_path, "core", "data_dir"); !v.empty()) {
            return expand_tilde(v);
        }
    }

    // 3) XDG/HOME defaults
    return get_data_dir();
}

} // namespace modelflux::config
