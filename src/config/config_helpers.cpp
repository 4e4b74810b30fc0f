#include <fstream>
#include <scriptor/config/config_helpers.h>

namespace scriptor::config {

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
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        bool sectionMatch = section.empty() ? currentSection.empty() : currentSection == section;
        if ((sectionMatch && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("SCRIPTOR_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_config_dir() {
#ifdef _WIN32
    if (const char* appData = std::getenv("APPDATA")) {
        return std::filesystem::path(appData) / "scriptor";
    }
    return std::filesystem::path("scriptor");
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "scriptor";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "scriptor";
    }
    return std::filesystem::path("~/.config") / "scriptor";
#endif
}

std::filesystem::path get_data_dir() {
#ifdef _WIN32
    if (const char* localAppData = std::getenv("LOCALAPPDATA")) {
        return std::filesystem::path(localAppData) / "scriptor";
    }
    return std::filesystem::current_path() / "scriptor_data";
#else
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "scriptor";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "scriptor";
    }
    return std::filesystem::current_path() / "scriptor_data";
#endif
}

} // namespace scriptor::config
