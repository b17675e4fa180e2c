#include <evistore/config/config_helpers.h>

#include <fstream>

namespace evistore::config {

namespace {

// Strip a trailing comment, ignoring '#' inside quotes
std::string strip_comment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    const std::string dottedKey = section.empty() ? key : section + "." + key;

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
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = strip_comment(line.substr(eq + 1));
        trim(k);

        if ((currentSection == section && k == key) ||
            (currentSection.empty() && k == dottedKey)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("EVISTORE_CONFIG")) {
        return expand_tilde(*env);
    }

    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "evistore" / "config.toml";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".config" / "evistore" / "config.toml";
    }
    return std::filesystem::path("~/.config") / "evistore" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (auto xdg = env_value("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg) / "evistore";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".local" / "share" / "evistore";
    }
    return std::filesystem::current_path() / "evistore_data";
}

} // namespace evistore::config
