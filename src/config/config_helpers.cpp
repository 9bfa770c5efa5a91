#include <chartfetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>

namespace chartfetch::config {

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::string text(s);
    trim(text);
    if (text.empty())
        return std::nullopt;
    std::uint64_t out{0};
    auto res = std::from_chars(text.data(), text.data() + text.size(), out);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size())
        return std::nullopt;
    return out;
}

std::optional<double> parse_double(std::string_view s) {
    std::string text(s);
    trim(text);
    if (text.empty())
        return std::nullopt;
    try {
        std::size_t consumed = 0;
        double v = std::stod(text, &consumed);
        if (consumed != text.size())
            return std::nullopt;
        return v;
    } catch (...) {
        return std::nullopt;
    }
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

        // Remove inline comments outside of quoted values
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        if (k == key) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("CHARTFETCH_CONFIG"); env && *env) {
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
        return std::filesystem::path("~/.config") / "chartfetch" / "config.toml";
    }

    return configHome / "chartfetch" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "chartfetch";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "chartfetch";
    }
    return std::filesystem::current_path() / "chartfetch_data";
}

bool apply_log_level(std::string_view level) {
    std::string name(level);
    trim(name);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "warning")
        name = "warn";

    // from_string maps unknown names to "off"; only accept explicit "off"
    auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off") {
        spdlog::warn("Ignoring unknown log level '{}'", name);
        return false;
    }
    spdlog::set_level(lvl);
    return true;
}

} // namespace chartfetch::config
