#pragma once

#include <globstar/resolver.hpp>
#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace globstar {

// Single-pass range over a lazy match stream. Move-only; destroying it
// before exhaustion is safe and releases everything.
class GlobRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Match;
        using difference_type = std::ptrdiff_t;
        using pointer = const Match*;
        using reference = const Match&;

        iterator() = default;
        explicit iterator(GlobRange* range) : range_(range) {}

        reference operator*() const { return range_->current_; }
        pointer operator->() const { return &range_->current_; }

        iterator& operator++() {
            if (!range_->next(range_->current_)) range_ = nullptr;
            return *this;
        }

        bool operator==(const iterator& other) const { return range_ == other.range_; }
        bool operator!=(const iterator& other) const { return range_ != other.range_; }

    private:
        GlobRange* range_ = nullptr;
    };

    explicit GlobRange(std::unique_ptr<MatchStream> stream) : stream_(std::move(stream)) {}

    GlobRange(GlobRange&&) = default;
    GlobRange& operator=(GlobRange&&) = default;
    GlobRange(const GlobRange&) = delete;
    GlobRange& operator=(const GlobRange&) = delete;

    // Pull the next match; false once exhausted.
    bool next(Match& out);

    // begin() pulls the first match.
    iterator begin();
    iterator end() { return iterator(); }

    // Drain the remaining matches.
    std::vector<Match> collect();

private:
    std::unique_ptr<MatchStream> stream_;
    Match current_;
};

// A validated configuration bound to a filesystem and a matcher cache.
class Globber {
public:
    // Fails with GlobError::Config on unsupported options. Null `fs` or
    // `cache` select local_filesystem() and default_matcher_cache().
    static Result<Globber> create(Options options,
                                  std::shared_ptr<const FileSystem> fs = nullptr,
                                  std::shared_ptr<MatcherCache> cache = nullptr);

    // Lazily yield matches of `pattern`. Captures are filled only when
    // Options::with_matches is set.
    GlobRange iglob(const std::string& pattern) const;

    // Eager forms. glob_matches() always fills captures.
    std::vector<std::string> glob(const std::string& pattern) const;
    std::vector<Match> glob_matches(const std::string& pattern) const;

    // Names matching a single-segment pattern, with captures.
    std::vector<Match> filter(const std::vector<std::string>& names,
                              const std::string& pattern) const;

    // Normalizes both sides per Options::norm_paths, then matches.
    bool fnmatch(const std::string& name, const std::string& pattern) const;

    // Exact match; no normalization.
    bool fnmatchcase(const std::string& name, const std::string& pattern) const;

    const Options& options() const { return resolver_.options(); }
    const Resolver& resolver() const { return resolver_; }

private:
    explicit Globber(Resolver resolver) : resolver_(std::move(resolver)) {}

    Resolver resolver_;
};

// ---- Free functions (local filesystem, process-wide matcher cache) ----

Result<std::vector<std::string>> glob(const std::string& pattern,
                                      const Options& options = {});

Result<std::vector<Match>> glob_matches(const std::string& pattern,
                                        const Options& options = {});

Result<GlobRange> iterglob(const std::string& pattern, const Options& options = {});

Result<std::vector<Match>> match_filter(const std::vector<std::string>& names,
                                        const std::string& pattern,
                                        const Options& options = {});

Result<bool> match_exact(const std::string& name, const std::string& pattern,
                         const Options& options = {});

} // namespace globstar
