#include <globstar/resolver.hpp>
#include <globstar/log.hpp>
#include <utility>

namespace globstar {

namespace {

// Yields a precomputed list. Used for literal candidates that need no
// listing.
class VectorStream : public MatchStream {
public:
    explicit VectorStream(std::vector<Match> items) : items_(std::move(items)) {}

    bool next(Match& out) override {
        if (pos_ >= items_.size()) return false;
        out = std::move(items_[pos_++]);
        return true;
    }

private:
    std::vector<Match> items_;
    size_t pos_ = 0;
};

// Wildcard-free pattern: a single existence check, deferred to the first pull.
class ExistsStream : public MatchStream {
public:
    ExistsStream(Resolver resolver, std::string path)
        : resolver_(std::move(resolver)), path_(std::move(path)) {}

    bool next(Match& out) override {
        if (done_) return false;
        done_ = true;
        if (!resolver_.filesystem().exists(path_)) return false;
        out.path = path_;
        out.groups.clear();
        return true;
    }

private:
    Resolver resolver_;
    std::string path_;
    bool done_ = false;
};

// Common filtering for candidate names: hidden-entry exclusion followed by
// the segment matcher.
class CandidateStream : public MatchStream {
public:
    CandidateStream(Resolver resolver, const std::string& pattern)
        : resolver_(std::move(resolver)),
          matcher_(resolver_.compile(pattern)),
          skip_hidden_(!resolver_.options().include_hidden && !is_hidden(pattern)) {}

    bool next(Match& out) override {
        std::string name;
        std::vector<std::string>* groups =
            resolver_.options().with_matches ? &out.groups : nullptr;

        while (next_candidate(name)) {
            // "" stands for the directory itself and is never hidden
            if (skip_hidden_ && is_hidden(name)) continue;
            if (!resolver_.match_name(*matcher_, name, groups)) continue;
            if (!groups) out.groups.clear();
            out.path = std::move(name);
            return true;
        }
        return false;
    }

protected:
    virtual bool next_candidate(std::string& name) = 0;

    // List a directory, treating failures as "no entries".
    bool try_list(const std::string& dir, std::vector<std::string>& names) const {
        auto r = resolver_.filesystem().list_dir(dir);
        if (r.is_err()) {
            log::debug("skipping directory: %s", r.error().message.c_str());
            return false;
        }
        names = std::move(r).value();
        return true;
    }

    Resolver resolver_;

private:
    std::shared_ptr<const Matcher> matcher_;
    bool skip_hidden_;
};

// Direct entries of one directory.
class ListingStream : public CandidateStream {
public:
    ListingStream(Resolver resolver, std::string dirname, const std::string& pattern)
        : CandidateStream(std::move(resolver), pattern),
          dirname_(dirname.empty() ? "." : std::move(dirname)) {}

protected:
    bool next_candidate(std::string& name) override {
        if (!listed_) {
            listed_ = true;
            try_list(dirname_, names_);
        }
        if (pos_ >= names_.size()) return false;
        name = names_[pos_++];
        return true;
    }

private:
    std::string dirname_;
    std::vector<std::string> names_;
    size_t pos_ = 0;
    bool listed_ = false;
};

// "**": every entry of dirname and of its descendant directories, as paths
// relative to dirname. A directory's entries are all produced before any of
// its subdirectories is entered (pre-order at directory granularity). The
// candidates are matched against "*" so each yields exactly one group.
class GlobstarStream : public CandidateStream {
public:
    GlobstarStream(Resolver resolver, std::string dirname, bool with_root)
        : CandidateStream(std::move(resolver), "*"),
          top_(std::move(dirname)),
          pending_root_(with_root) {}

protected:
    bool next_candidate(std::string& name) override {
        if (!started_) {
            started_ = true;
            Frame root;
            root.path = top_;
            if (try_list(top_.empty() ? "." : top_, root.entries)) {
                stack_.push_back(std::move(root));
            }
        }

        if (pending_root_) {
            pending_root_ = false;
            name.clear();
            return true;
        }

        while (!stack_.empty()) {
            Frame& f = stack_.back();

            if (f.emit < f.entries.size()) {
                name = resolver_.join(f.rel, f.entries[f.emit++]);
                return true;
            }

            if (f.descend < f.entries.size()) {
                const std::string& entry = f.entries[f.descend++];
                Frame child;
                child.path = resolver_.join(f.path, entry);
                child.rel = resolver_.join(f.rel, entry);
                if (!descendable(child.path)) continue;
                if (try_list(child.path, child.entries)) {
                    stack_.push_back(std::move(child));  // invalidates f
                }
                continue;
            }

            stack_.pop_back();
        }
        return false;
    }

private:
    struct Frame {
        std::string path;  // "" for the working directory
        std::string rel;   // relative to top_, "" for top_ itself
        std::vector<std::string> entries;
        size_t emit = 0;
        size_t descend = 0;
    };

    bool descendable(const std::string& path) const {
        const FileSystem& fs = resolver_.filesystem();
        if (!resolver_.options().follow_symlinks && fs.is_symlink(path)) return false;
        return fs.is_directory(path);
    }

    std::string top_;
    bool pending_root_;
    bool started_ = false;
    std::vector<Frame> stack_;
};

// Pattern with magic: resolve the directory part (recursively when it has
// magic itself), then the basename against each resolved directory.
class PatternStream : public MatchStream {
public:
    PatternStream(Resolver resolver, std::unique_ptr<MatchStream> dirs,
                  std::string basename, bool root_call)
        : resolver_(std::move(resolver)), dirs_(std::move(dirs)),
          basename_(std::move(basename)), root_call_(root_call) {}

    bool next(Match& out) override {
        Match name;
        for (;;) {
            if (names_ && names_->next(name)) {
                out.path = resolver_.join(dir_.path, name.path);
                out.groups = dir_.groups;
                out.groups.insert(out.groups.end(), name.groups.begin(), name.groups.end());
                return true;
            }
            names_.reset();
            if (!dirs_->next(dir_)) return false;
            names_ = resolver_.resolve_basename(dir_.path, basename_, !root_call_);
        }
    }

private:
    Resolver resolver_;
    std::unique_ptr<MatchStream> dirs_;
    std::string basename_;
    bool root_call_;
    Match dir_;
    std::unique_ptr<MatchStream> names_;
};

// Applies the separator override to root-level results.
class PresentStream : public MatchStream {
public:
    PresentStream(Resolver resolver, std::unique_ptr<MatchStream> inner)
        : resolver_(std::move(resolver)), inner_(std::move(inner)) {}

    bool next(Match& out) override {
        if (!inner_->next(out)) return false;
        out.path = resolver_.present(std::move(out.path));
        return true;
    }

private:
    Resolver resolver_;
    std::unique_ptr<MatchStream> inner_;
};

} // namespace

Result<Resolver> Resolver::create(Options options,
                                  std::shared_ptr<const FileSystem> fs,
                                  std::shared_ptr<MatcherCache> cache) {
    GLOBSTAR_TRY(options.validate());
    return Result<Resolver>::ok(Resolver(std::move(options), std::move(fs), std::move(cache)));
}

Resolver::Resolver(Options options,
                   std::shared_ptr<const FileSystem> fs,
                   std::shared_ptr<MatcherCache> cache)
    : options_(std::move(options)),
      fs_(fs ? std::move(fs) : local_filesystem()),
      cache_(cache ? std::move(cache) : default_matcher_cache()) {}

std::unique_ptr<MatchStream> Resolver::resolve(const std::string& pattern) const {
    auto stream = resolve_internal(pattern, true);
    if (!options_.separator) return stream;
    return std::make_unique<PresentStream>(*this, std::move(stream));
}

// `root_call` separates the caller's pattern from the recursive resolution
// of its directory part. "**" covers the directory it starts in, but that
// directory must never be returned itself: when "**" is the last segment of
// the caller's pattern ("b/**") the start directory is left out, when it
// resolves a directory part ("**/*.py") it is included so that files
// directly inside the start directory are found.
std::unique_ptr<MatchStream> Resolver::resolve_internal(const std::string& pattern,
                                                        bool root_call) const {
    if (!has_magic(pattern)) {
        return std::make_unique<ExistsStream>(*this, to_native(pattern));
    }

    auto [dirname, basename] = split_path(pattern, options_.separator_set());

    std::unique_ptr<MatchStream> dirs;
    // dirname == pattern only for drive/UNC roots; never recurse on those
    if (!dirname.empty() && dirname != pattern && has_magic(dirname)) {
        // May yield files; they produce no entries when used as directories
        dirs = resolve_internal(dirname, false);
    } else {
        dirs = std::make_unique<VectorStream>(
            std::vector<Match>{Match{to_native(dirname), {}}});
    }

    return std::make_unique<PatternStream>(*this, std::move(dirs),
                                           std::move(basename), root_call);
}

std::unique_ptr<MatchStream> Resolver::resolve_basename(const std::string& dirname,
                                                        const std::string& pattern,
                                                        bool globstar_with_root) const {
    if (!has_magic(pattern)) {
        std::vector<Match> found;
        if (pattern.empty()) {
            if (fs_->is_directory(dirname)) found.push_back(Match{"", {}});
        } else if (fs_->exists(join(dirname, pattern))) {
            found.push_back(Match{pattern, {}});
        }
        return std::make_unique<VectorStream>(std::move(found));
    }

    if (pattern == "**") {
        return std::make_unique<GlobstarStream>(*this, dirname, globstar_with_root);
    }

    return std::make_unique<ListingStream>(*this, dirname, pattern);
}

std::shared_ptr<const Matcher> Resolver::compile(const std::string& pattern) const {
    char sep = options_.effective_separator();
    return cache_->get(normalize(pattern, options_.norm_paths, sep), options_.case_sensitive);
}

bool Resolver::match_name(const Matcher& matcher, const std::string& name,
                          std::vector<std::string>* groups) const {
    char sep = options_.effective_separator();
    if (!matcher.match(normalize(name, options_.norm_paths, sep), groups)) return false;
    if (groups) {
        for (auto& g : *groups) g = normalize(g, options_.norm_paths, sep);
    }
    return true;
}

std::vector<Match> Resolver::filter(const std::vector<std::string>& names,
                                    const std::string& pattern) const {
    auto matcher = compile(pattern);
    std::vector<Match> result;
    std::vector<std::string> groups;
    for (const auto& name : names) {
        if (match_name(*matcher, name, &groups)) {
            result.push_back(Match{name, groups});
        }
    }
    return result;
}

std::string Resolver::join(const std::string& dir, const std::string& name) const {
    return join_path(dir, name, native_separator());
}

std::string Resolver::to_native(std::string path) const {
    const char native = native_separator();
    const std::string seps = options_.separator_set();
    for (char& c : path) {
        if (seps.find(c) != std::string::npos) c = native;
    }
    return path;
}

std::string Resolver::present(std::string path) const {
    if (options_.separator) {
        for (char& c : path) {
            if (c == '/' || c == '\\') c = options_.separator;
        }
    }
    return path;
}

} // namespace globstar
