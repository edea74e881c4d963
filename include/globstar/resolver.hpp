#pragma once

#include <globstar/config.hpp>
#include <globstar/filesystem.hpp>
#include <globstar/matcher_cache.hpp>
#include <memory>
#include <string>
#include <vector>

namespace globstar {

// One resolved path plus the text each wildcard matched, left to right
// across all path segments (directory captures before basename captures).
// `groups` stays empty unless Options::with_matches is set.
struct Match {
    std::string path;
    std::vector<std::string> groups;

    bool operator==(const Match& other) const {
        return path == other.path && groups == other.groups;
    }
    bool operator!=(const Match& other) const { return !(*this == other); }
    bool operator<(const Match& other) const {
        if (path != other.path) return path < other.path;
        return groups < other.groups;
    }
};

// Pull-based lazy sequence of matches. Filesystem work happens only inside
// next(); abandoning a stream leaves nothing open.
class MatchStream {
public:
    virtual ~MatchStream() = default;

    // Produces the next match into `out`; false once exhausted.
    virtual bool next(Match& out) = 0;
};

// Expands path patterns containing '*', '?', '[seq]' and '**' against a
// FileSystem. Cheap to copy; streams keep their own copy alive.
class Resolver {
public:
    // Fails with GlobError::Config when options.validate() does. Null `fs`
    // or `cache` select local_filesystem() and default_matcher_cache().
    static Result<Resolver> create(Options options,
                                   std::shared_ptr<const FileSystem> fs = nullptr,
                                   std::shared_ptr<MatcherCache> cache = nullptr);

    // Root-level resolution of a full pattern. Each call starts a fresh
    // sequence over the current filesystem state. With a separator
    // override, the yielded paths use it throughout.
    std::unique_ptr<MatchStream> resolve(const std::string& pattern) const;

    // Apply a single segment `pattern` to the literal directory `dirname`
    // ("" is the working directory). Yields names relative to `dirname`.
    //
    //   ""       -> "" iff dirname is a directory (trailing separator case)
    //   literal  -> the name iff join(dirname, pattern) exists
    //   "**"     -> every entry below dirname, depth-first pre-order, each
    //               captured as a single group; "" (dirname itself) only
    //               when globstar_with_root is set
    //   other    -> the matching direct entries of dirname
    std::unique_ptr<MatchStream> resolve_basename(const std::string& dirname,
                                                  const std::string& pattern,
                                                  bool globstar_with_root) const;

    // The subset of `names` matching `pattern`, with captures. Names and
    // pattern are normalized per Options::norm_paths before matching.
    std::vector<Match> filter(const std::vector<std::string>& names,
                              const std::string& pattern) const;

    // Match one name against a compiled segment, normalizing the name and
    // captures. `groups` may be null.
    bool match_name(const Matcher& matcher, const std::string& name,
                    std::vector<std::string>* groups) const;

    // Compile (or fetch) the matcher for a normalized pattern.
    std::shared_ptr<const Matcher> compile(const std::string& pattern) const;

    // Join with the native separator. Used for every path that is passed
    // back to the FileSystem.
    std::string join(const std::string& dir, const std::string& name) const;

    // Rewrite '/' and '\' to the separator override, if any.
    std::string present(std::string path) const;

    // Rewrite every separator the pattern may use ('/' and the override)
    // to the native one. Applied to literal pattern text before it reaches
    // the FileSystem.
    std::string to_native(std::string path) const;

    // Same filesystem, cache and options, with capture groups switched
    // on or off.
    Resolver with_matches(bool on) const {
        Options opts = options_;
        opts.with_matches = on;
        return Resolver(std::move(opts), fs_, cache_);
    }

    const Options& options() const { return options_; }
    const FileSystem& filesystem() const { return *fs_; }
    MatcherCache& cache() const { return *cache_; }

private:
    Resolver(Options options,
             std::shared_ptr<const FileSystem> fs,
             std::shared_ptr<MatcherCache> cache);

    std::unique_ptr<MatchStream> resolve_internal(const std::string& pattern,
                                                  bool root_call) const;

    Options options_;
    std::shared_ptr<const FileSystem> fs_;
    std::shared_ptr<MatcherCache> cache_;
};

} // namespace globstar
