#include <procd/config/config_helpers.h>

#include <fstream>
#include <sstream>

#include <unistd.h>

namespace procd::config {

namespace {

// Drops a trailing comment, ignoring '#' inside quotes
std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::map<std::string, std::string> parse_stream(std::istream& in) {
    std::map<std::string, std::string> config;
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        line = strip_comment(line);
        trim(line);
        if (line.empty())
            continue;

        if (line.front() == '[' && line.back() == ']') {
            currentSection = line.substr(1, line.size() - 2);
            trim(currentSection);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = line.substr(0, eq);
        trim(key);
        std::string value = unquote(line.substr(eq + 1));
        if (key.empty())
            continue;

        if (!currentSection.empty()) {
            config[currentSection + "." + key] = value;
        } else {
            config[key] = value;
        }
    }
    return config;
}

} // namespace

std::map<std::string, std::string> parseSimpleTomlFlat(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file)
        return {};
    return parse_stream(file);
}

std::map<std::string, std::string> parseSimpleTomlFlatString(std::string_view text) {
    std::istringstream in{std::string(text)};
    return parse_stream(in);
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "procd";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "procd";
    }
    return std::filesystem::path("~/.config") / "procd";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_runtime_dir() {
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "procd";
    }
    return std::filesystem::temp_directory_path() /
           ("procd-" + std::to_string(static_cast<unsigned long>(::getuid())));
}

} // namespace procd::config
