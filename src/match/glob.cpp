#include <globstar/glob.hpp>

namespace globstar {

// ---- GlobRange ----

bool GlobRange::next(Match& out) {
    if (!stream_) return false;
    if (stream_->next(out)) return true;
    stream_.reset();
    return false;
}

GlobRange::iterator GlobRange::begin() {
    if (!next(current_)) return end();
    return iterator(this);
}

std::vector<Match> GlobRange::collect() {
    std::vector<Match> out;
    Match m;
    while (next(m)) out.push_back(std::move(m));
    return out;
}

// ---- Globber ----

Result<Globber> Globber::create(Options options,
                                std::shared_ptr<const FileSystem> fs,
                                std::shared_ptr<MatcherCache> cache) {
    return Resolver::create(std::move(options), std::move(fs), std::move(cache))
        .map([](Resolver& r) { return Globber(std::move(r)); });
}

GlobRange Globber::iglob(const std::string& pattern) const {
    return GlobRange(resolver_.resolve(pattern));
}

std::vector<std::string> Globber::glob(const std::string& pattern) const {
    std::vector<std::string> paths;
    auto range = iglob(pattern);
    Match m;
    while (range.next(m)) paths.push_back(std::move(m.path));
    return paths;
}

std::vector<Match> Globber::glob_matches(const std::string& pattern) const {
    if (resolver_.options().with_matches) return iglob(pattern).collect();

    return GlobRange(resolver_.with_matches(true).resolve(pattern)).collect();
}

std::vector<Match> Globber::filter(const std::vector<std::string>& names,
                                   const std::string& pattern) const {
    return resolver_.filter(names, pattern);
}

bool Globber::fnmatch(const std::string& name, const std::string& pattern) const {
    return resolver_.match_name(*resolver_.compile(pattern), name, nullptr);
}

bool Globber::fnmatchcase(const std::string& name, const std::string& pattern) const {
    auto matcher = resolver_.cache().get(pattern, resolver_.options().case_sensitive);
    return matcher->match(name);
}

// ---- Free functions ----

Result<std::vector<std::string>> glob(const std::string& pattern, const Options& options) {
    return Globber::create(options).map([&](Globber& g) { return g.glob(pattern); });
}

Result<std::vector<Match>> glob_matches(const std::string& pattern, const Options& options) {
    return Globber::create(options).map([&](Globber& g) { return g.glob_matches(pattern); });
}

Result<GlobRange> iterglob(const std::string& pattern, const Options& options) {
    auto g = Globber::create(options);
    if (g.is_err()) return std::move(g).error();
    return Result<GlobRange>::ok(g.value().iglob(pattern));
}

Result<std::vector<Match>> match_filter(const std::vector<std::string>& names,
                                        const std::string& pattern,
                                        const Options& options) {
    return Globber::create(options).map([&](Globber& g) { return g.filter(names, pattern); });
}

Result<bool> match_exact(const std::string& name, const std::string& pattern,
                         const Options& options) {
    return Globber::create(options).map([&](Globber& g) { return g.fnmatchcase(name, pattern); });
}

} // namespace globstar
