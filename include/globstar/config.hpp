#pragma once

#include <globstar/result.hpp>
#include <globstar/log.hpp>
#include <globstar/pattern.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace globstar {

// Everything that is fixed for one resolution run.
struct Options {
    // Yield (path, captures) instead of bare paths.
    bool with_matches = false;
    // Let '*' and '?' match names starting with '.'.
    bool include_hidden = false;
    // Descend into symlinked directories while expanding '**'.
    bool follow_symlinks = false;
#ifdef _WIN32
    bool case_sensitive = false;
#else
    bool case_sensitive = true;
#endif
    // '\0' means native_separator().
    char separator = '\0';
    NormPaths norm_paths = NormPaths::Separators;

    // Separator used for joins and separator normalization.
    char effective_separator() const {
        return separator ? separator : native_separator();
    }

    // Characters split_path() treats as separators.
    std::string separator_set() const;

    // Rejects unsupported option combinations before any I/O happens.
    Status validate() const;
};

// Layered configuration loaded from TOML. Unset fields fall through to the
// layer below, then to the Options defaults.
//
//   [glob]
//   with-matches = false
//   include-hidden = false
//   follow-symlinks = false
//   case-sensitive = true
//   separator = "/"
//   norm-paths = "separators"    # "full" | "separators" | "none"
//
//   [cache]
//   capacity = 256
//
//   [log]
//   level = "info"
//   color = true
struct Config {
    std::optional<bool> with_matches;
    std::optional<bool> include_hidden;
    std::optional<bool> follow_symlinks;
    std::optional<bool> case_sensitive;
    std::optional<char> separator;
    std::optional<NormPaths> norm_paths;
    std::optional<size_t> cache_capacity;
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    Options to_options() const;

    // Push log level and color into globstar::log (only the fields that are set).
    void apply_logging() const;
};

// Discover the global config file path: ~/.globstar/config.toml
std::string global_config_path();

} // namespace globstar
