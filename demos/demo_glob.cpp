// demo_glob.cpp
//
// Expand glob patterns against the current directory and print the results.
//
//     ./demo_glob '**/*.cpp'                  # recursive search
//     ./demo_glob --matches 'src/*/*.hpp'     # show what each wildcard matched
//     ./demo_glob --hidden '*'                # include dot-files
//     ./demo_glob --norm full '*.TXT'         # error: full normalization is case-insensitive
//
// Settings are layered: ~/.globstar/config.toml, then --config FILE, then flags.

#include <globstar/config.hpp>
#include <globstar/glob.hpp>
#include <globstar/log.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace globstar;

struct Args {
    Config flags;
    std::optional<std::string> config_file;
    std::vector<std::string> patterns;
};

static const char* kUsage =
    "usage: demo_glob [--matches] [--hidden] [--follow] [--icase] [--sep C]\n"
    "                 [--norm full|separators|none] [--config FILE] [-v] PATTERN...";

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        auto need_value = [&](const char* flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return GlobError{GlobError::InvalidArg,
                    std::string("missing value for ") + flag, kUsage};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (a == "--matches") {
            args.flags.with_matches = true;
        } else if (a == "--hidden") {
            args.flags.include_hidden = true;
        } else if (a == "--follow") {
            args.flags.follow_symlinks = true;
        } else if (a == "--icase") {
            args.flags.case_sensitive = false;
        } else if (a == "-v") {
            args.flags.log_level = log::Debug;
        } else if (a == "--sep") {
            auto v = need_value("--sep");
            if (v.is_err()) return v.error();
            if (v.value().size() != 1) {
                return GlobError{GlobError::InvalidArg,
                    "--sep expects a single character", kUsage};
            }
            args.flags.separator = v.value()[0];
        } else if (a == "--norm") {
            auto v = need_value("--norm");
            if (v.is_err()) return v.error();
            NormPaths mode;
            if (!parse_norm_paths(v.value(), mode)) {
                return GlobError{GlobError::InvalidArg,
                    "unknown --norm mode: " + v.value(), kUsage};
            }
            args.flags.norm_paths = mode;
        } else if (a == "--config") {
            auto v = need_value("--config");
            if (v.is_err()) return v.error();
            args.config_file = v.value();
        } else if (a.size() > 1 && a[0] == '-' && a[1] == '-') {
            return GlobError{GlobError::InvalidArg, "unknown option: " + a, kUsage};
        } else {
            args.patterns.push_back(a);
        }
    }

    if (args.patterns.empty()) {
        return GlobError{GlobError::InvalidArg, "no pattern given", kUsage};
    }
    return Result<Args>::ok(std::move(args));
}

static Result<Config> load_layers(const Args& args) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && std::filesystem::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        if (g.is_err()) return g.error();
        global = std::move(g).value();
    }

    Config cfg = Config::effective(global, std::nullopt);
    if (args.config_file) {
        auto c = Config::load(*args.config_file);
        if (c.is_err()) return c.error();
        cfg.merge(c.value());
    }
    cfg.merge(args.flags);
    return Result<Config>::ok(std::move(cfg));
}

static std::string format_groups(const std::vector<std::string>& groups) {
    std::string out = "[";
    for (size_t i = 0; i < groups.size(); i++) {
        if (i) out += ", ";
        out += "\"" + groups[i] + "\"";
    }
    return out + "]";
}

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        log::error("%s", args.error().format().c_str());
        return 1;
    }

    auto cfg = load_layers(args.value());
    if (cfg.is_err()) {
        log::error("%s", cfg.error().format().c_str());
        return 1;
    }
    cfg.value().apply_logging();

    std::shared_ptr<MatcherCache> cache;
    if (cfg.value().cache_capacity) {
        cache = std::make_shared<MatcherCache>(*cfg.value().cache_capacity);
    }

    auto globber = Globber::create(cfg.value().to_options(), nullptr, cache);
    if (globber.is_err()) {
        log::error("%s", globber.error().format().c_str());
        return 1;
    }

    size_t total = 0;
    for (const auto& pattern : args.value().patterns) {
        log::debug("expanding '%s'", pattern.c_str());
        for (const auto& m : globber.value().iglob(pattern)) {
            if (globber.value().options().with_matches) {
                std::cout << m.path << " <- " << format_groups(m.groups) << "\n";
            } else {
                std::cout << m.path << "\n";
            }
            total++;
        }
    }

    log::debug("%zu match(es)", total);
    return total > 0 ? 0 : 2;
}
