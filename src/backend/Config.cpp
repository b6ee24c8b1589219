#include "backend/Config.hpp"
#include "backend/Errors.hpp"
#include "backend/FilterParser.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>

namespace strata::backend {

namespace {
    std::string trim(const std::string& str) {
        auto start = str.find_first_not_of(" \t\r");
        if (start == std::string::npos) return "";
        auto end = str.find_last_not_of(" \t\r");
        return str.substr(start, end - start + 1);
    }

    std::vector<std::string> split(const std::string& value, char separator) {
        std::vector<std::string> parts;
        std::string part;
        std::istringstream stream(value);
        while (std::getline(stream, part, separator)) {
            part = trim(part);
            if (!part.empty()) parts.push_back(part);
        }
        return parts;
    }

    std::filesystem::path expand_path(const std::string& value) {
        if (value == "~" || value.starts_with("~/")) {
            if (const char* home = std::getenv("HOME")) {
                return std::filesystem::path(home) / value.substr(value.size() > 1 ? 2 : 1);
            }
        }
        return value;
    }

    // Keys of one [category.<code>] section, kept until the section can be
    // classified as primary (basedir) or secondary (inherits)
    struct CategorySection {
        std::string code;
        int line = 0;
        std::map<std::string, std::string> values;
    };
}

std::vector<model::KeySpec> ConfigLoader::parse_taxonomy(const std::string& value) {
    std::vector<model::KeySpec> levels;
    for (const auto& level : split(value, ',')) {
        model::KeySpec spec;
        spec.alternatives = split(level, '|');
        if (!spec.alternatives.empty()) levels.push_back(std::move(spec));
    }
    return levels;
}

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }
    util::Logger::info("Config: No config file at " + config_file.string() + ", using defaults");
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot read config file " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path.string());
}

Config ConfigLoader::parse(const std::string& text, const std::string& origin) {
    Config cfg = create_default_config();
    std::vector<CategorySection> sections;

    auto fail = [&](int line, const std::string& what) -> ConfigError {
        return ConfigError(origin + ":" + std::to_string(line) + ": " + what);
    };

    auto parse_bool = [&](int line, const std::string& key, const std::string& value) {
        if (value == "true") return true;
        if (value == "false") return false;
        throw fail(line, key + " must be true or false, got '" + value + "'");
    };

    std::istringstream stream(text);
    std::string line, current_section;
    int line_no = 0;
    while (std::getline(stream, line)) {
        ++line_no;
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[') {
            if (line.back() != ']') throw fail(line_no, "unterminated section header");
            current_section = trim(line.substr(1, line.length() - 2));
            if (current_section.starts_with("category.")) {
                std::string code = current_section.substr(9);
                if (code.empty()) throw fail(line_no, "category section without a code");
                for (const auto& s : sections) {
                    if (s.code == code) throw fail(line_no, "duplicate category '" + code + "'");
                }
                sections.push_back({code, line_no, {}});
            }
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) throw fail(line_no, "expected key = value");
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "paths") {
            if (key == "music_directory") cfg.music_directory = expand_path(value);
            else if (key == "cache_directory") cfg.cache_directory = expand_path(value);
            else util::Logger::debug("Config: Ignoring paths." + key);
        }
        else if (current_section == "scan") {
            if (key == "workers") {
                bool digits = std::all_of(value.begin(), value.end(),
                                          [](unsigned char c) { return std::isdigit(c) != 0; });
                if (value.empty() || !digits || value.size() > 6) {
                    throw fail(line_no, "workers must be a non-negative integer, got '" + value + "'");
                }
                cfg.workers = static_cast<size_t>(std::stoul(value));
            }
            else if (key == "force_refresh") cfg.force_refresh = parse_bool(line_no, key, value);
            else util::Logger::debug("Config: Ignoring scan." + key);
        }
        else if (current_section == "logging") {
            if (key == "level") {
                bool ok = false;
                util::Logger::parse_level(value, &ok);
                if (!ok) throw fail(line_no, "unknown log level '" + value + "'");
                cfg.log_level = value;
            }
            else if (key == "file") cfg.log_file = expand_path(value);
            else util::Logger::debug("Config: Ignoring logging." + key);
        }
        else if (current_section == "playlists") {
            if (key == "enabled") cfg.playlists.enabled = parse_bool(line_no, key, value);
            else if (key == "winamp_directory") cfg.playlists.winamp_directory = expand_path(value);
            else if (key == "win32_base_dir") cfg.playlists.win32_base_dir = value;
            else if (key == "title_prefix") cfg.playlists.title_prefix = value;
            else util::Logger::debug("Config: Ignoring playlists." + key);
        }
        else if (current_section.starts_with("category.")) {
            sections.back().values[key] = value;
        }
        else {
            util::Logger::debug("Config: Ignoring " + current_section + "." + key);
        }
    }

    for (auto& section : sections) {
        auto& v = section.values;
        bool primary = v.contains("basedir");
        bool secondary = v.contains("inherits");
        if (primary == secondary) {
            throw fail(section.line, "category '" + section.code + "' needs exactly one of basedir or inherits");
        }

        auto get = [&](const char* key) -> std::optional<std::string> {
            auto it = v.find(key);
            if (it == v.end()) return std::nullopt;
            return it->second;
        };

        if (primary) {
            model::PrimaryCategory cat;
            cat.code = section.code;
            cat.name = get("name").value_or(section.code);
            cat.basedir = *get("basedir");
            if (cat.basedir.empty() || cat.basedir.find('/') != std::string::npos) {
                throw fail(section.line, "basedir of '" + section.code + "' must be a single directory name");
            }
            cat.taxonomy = parse_taxonomy(get("taxonomy").value_or(""));
            cat.sort = get("sort");
            cat.extra_tags = split(get("extra_tags").value_or(""), ',');
            cfg.categories.primary.push_back(std::move(cat));
        } else {
            model::SecondaryCategory cat;
            cat.code = section.code;
            cat.name = get("name").value_or("");
            cat.inherits = *get("inherits");
            cat.filter = get("filter").value_or("");
            if (cat.filter.empty()) {
                throw fail(section.line, "category '" + section.code + "' needs a filter");
            }
            try {
                cat.predicate = FilterParser::compile(cat.filter);
            } catch (const ConfigError& e) {
                throw fail(section.line, "category '" + section.code + "': " + e.what());
            }
            if (auto taxonomy = get("taxonomy")) cat.taxonomy = parse_taxonomy(*taxonomy);
            cat.sort = get("sort");
            cfg.categories.secondary.push_back(std::move(cat));
        }
    }

    return cfg;
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    if (const char* home = std::getenv("HOME")) {
        cfg.music_directory = std::filesystem::path(home) / "Music";
    }
    cfg.cache_directory = util::Platform::get_cache_directory();
    return cfg;
}

}  // namespace strata::backend
