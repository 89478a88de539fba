#include <beacon/config/config_helpers.h>
#include <fstream>

namespace beacon::config {

namespace {

// Calls fn(key, value) for each pair in the requested section.
template <typename Fn>
void for_each_entry(const std::filesystem::path& config_path, const std::string& section, Fn&& fn) {
    std::ifstream file(config_path);
    if (!file) {
        return;
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

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        if (!in_target_section) {
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
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (v.size() > 1) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        }

        if (!fn(k, unquote(v))) {
            return;
        }
    }
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::string found;
    for_each_entry(config_path, section, [&](const std::string& k, std::string v) {
        if (k == key) {
            found = std::move(v);
            return false;
        }
        return true;
    });
    return found;
}

std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section) {
    std::map<std::string, std::string> values;
    for_each_entry(config_path, section, [&](const std::string& k, std::string v) {
        values[k] = std::move(v);
        return true;
    });
    return values;
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "beacon";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "beacon";
    }
    return std::filesystem::path("~/.config") / "beacon";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("BEACON_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace beacon::config
