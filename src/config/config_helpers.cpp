#include <quarry/config/config_helpers.h>

namespace quarry::config {

std::optional<bool> parse_bool(std::string_view raw) {
    std::string v(raw);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    return std::nullopt;
}

std::filesystem::path get_config_dir() {
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "quarry";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".config" / "quarry";
    }
    return std::filesystem::current_path() / ".quarry";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("QUARRY_CONFIG")) {
        return expand_tilde(*env);
    }
    return get_config_dir() / "quarry.json";
}

std::filesystem::path get_cache_dir() {
    if (auto env = env_value("QUARRY_CACHE_DIR")) {
        return expand_tilde(*env);
    }
    if (auto xdg = env_value("XDG_CACHE_HOME")) {
        return std::filesystem::path(*xdg) / "quarry";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".cache" / "quarry";
    }
    return std::filesystem::temp_directory_path() / "quarry-cache";
}

} // namespace quarry::config
