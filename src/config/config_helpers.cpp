#include <fstream>
#include <map>
#include <rangeget/config/config_helpers.h>

namespace rangeget::config {

namespace {

// Strip a trailing "# comment" that is not inside quotes.
void strip_inline_comment(std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
}

} // namespace

std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section) {
    std::map<std::string, std::string> out;
    std::ifstream file(config_path);
    if (!file) {
        return out;
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
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        strip_inline_comment(v);

        if (currentSection == section) {
            out[k] = unquote(v);
        } else if (currentSection.empty() && k.size() > section.size() + 1 &&
                   k.compare(0, section.size(), section) == 0 && k[section.size()] == '.') {
            // Support both "network.proxy" and "[network] proxy"
            out.emplace(k.substr(section.size() + 1), unquote(v));
        }
    }
    return out;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_section(config_path, section);
    auto it = values.find(key);
    return it == values.end() ? std::string{} : it->second;
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "rangeget";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "rangeget";
    }
    return std::filesystem::path("~/.config") / "rangeget";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

} // namespace rangeget::config
