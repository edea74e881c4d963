#include <globstar/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdint>

namespace globstar {

// ---- Options ----

std::string Options::separator_set() const {
    std::string seps = "/";
    char sep = effective_separator();
    if (sep != '/') seps.push_back(sep);
    return seps;
}

Status Options::validate() const {
    if (separator != '\0' && separator != '/' && separator != '\\') {
        return GlobError{GlobError::Config,
            std::string("unsupported path separator '") + separator + "'",
            "use '/' or '\\'"};
    }
    if (norm_paths == NormPaths::Full && case_sensitive) {
        return GlobError{GlobError::Config,
            "norm-paths = \"full\" lowercases names and cannot be case-sensitive",
            "set case-sensitive = false, or use norm-paths = \"separators\""};
    }
    return ok_status();
}

// ---- Config ----

static void read_bool(const toml::table& tbl, const char* key, std::optional<bool>& out) {
    if (auto v = tbl[key].value<bool>()) out = *v;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return GlobError{GlobError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [glob] section
    if (auto glob = doc["glob"].as_table()) {
        read_bool(*glob, "with-matches", cfg.with_matches);
        read_bool(*glob, "include-hidden", cfg.include_hidden);
        read_bool(*glob, "follow-symlinks", cfg.follow_symlinks);
        read_bool(*glob, "case-sensitive", cfg.case_sensitive);

        if (auto s = (*glob)["separator"].value<std::string>()) {
            if (s->size() != 1) {
                return GlobError{GlobError::Config,
                    "separator must be a single character, got \"" + *s + "\""};
            }
            cfg.separator = (*s)[0];
        }
        if (auto s = (*glob)["norm-paths"].value<std::string>()) {
            NormPaths mode;
            if (!parse_norm_paths(*s, mode)) {
                return GlobError{GlobError::Config,
                    "unknown norm-paths value \"" + *s + "\"",
                    "expected \"full\", \"separators\" or \"none\""};
            }
            cfg.norm_paths = mode;
        }
    }

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["capacity"].value<int64_t>()) {
            if (*v < 1) {
                return GlobError{GlobError::Config,
                    "cache capacity must be at least 1, got " + std::to_string(*v)};
            }
            cfg.cache_capacity = static_cast<size_t>(*v);
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto s = (*lg)["level"].value<std::string>()) {
            log::Level lvl;
            if (!log::parse_level(*s, lvl)) {
                return GlobError{GlobError::Config,
                    "unknown log level \"" + *s + "\"",
                    "expected trace, debug, info, warn or error"};
            }
            cfg.log_level = lvl;
        }
        read_bool(*lg, "color", cfg.log_color);
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return GlobError{GlobError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) r.error().file = path;
    return r;
}

template<typename T>
static void override_with(std::optional<T>& dst, const std::optional<T>& src) {
    if (src.has_value()) dst = src;
}

void Config::merge(const Config& other) {
    override_with(with_matches, other.with_matches);
    override_with(include_hidden, other.include_hidden);
    override_with(follow_symlinks, other.follow_symlinks);
    override_with(case_sensitive, other.case_sensitive);
    override_with(separator, other.separator);
    override_with(norm_paths, other.norm_paths);
    override_with(cache_capacity, other.cache_capacity);
    override_with(log_level, other.log_level);
    override_with(log_color, other.log_color);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

Options Config::to_options() const {
    Options opts;
    opts.with_matches = with_matches.value_or(opts.with_matches);
    opts.include_hidden = include_hidden.value_or(opts.include_hidden);
    opts.follow_symlinks = follow_symlinks.value_or(opts.follow_symlinks);
    opts.case_sensitive = case_sensitive.value_or(opts.case_sensitive);
    opts.separator = separator.value_or(opts.separator);
    opts.norm_paths = norm_paths.value_or(opts.norm_paths);
    return opts;
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.globstar/config.toml";
}

} // namespace globstar
