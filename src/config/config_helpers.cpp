#include <fstream>
#include <prompter/config/config_helpers.h>

namespace prompter::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

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
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments only outside of quoted values
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "session_cache.max_entries" and "[session_cache] max_entries"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("PROMPTER_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "prompter" / "config.toml";
    }

    return configHome / "prompter" / "config.toml";
}

std::filesystem::path get_state_dir() {
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "prompter";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "state" / "prompter";
    }
    return std::filesystem::current_path() / ".prompter";
}

std::filesystem::path resolve_sessions_dir_from_config() {
    // 1) PROMPTER_SESSION_DIR env
    if (const char* env = std::getenv("PROMPTER_SESSION_DIR"); env && *env) {
        return expand_tilde(env);
    }

    // 2) config.toml core.sessions_dir
    auto config_path = get_config_path();
    if (!config_path.empty() && std::filesystem::exists(config_path)) {
        if (auto value = parse_config_value(config_path, "core", "sessions_dir"); !value.empty()) {
            return expand_tilde(value);
        }
    }

    // 3) XDG/HOME defaults
    return get_state_dir() / "sessions";
}

} // namespace prompter::config
