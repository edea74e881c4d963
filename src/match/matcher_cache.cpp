#include <globstar/matcher_cache.hpp>
#include <globstar/log.hpp>

namespace globstar {

MatcherCache::MatcherCache(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

std::string MatcherCache::make_key(const std::string& segment, bool case_sensitive) {
    std::string key;
    key.reserve(segment.size() + 1);
    key.push_back(case_sensitive ? 'S' : 'I');
    key += segment;
    return key;
}

std::shared_ptr<const Matcher> MatcherCache::get(const std::string& segment,
                                                 bool case_sensitive) {
    std::string key = make_key(segment, case_sensitive);

    auto it = index_.find(key);
    if (it != index_.end()) {
        ++hits_;
        lru_.splice(lru_.begin(), lru_, it->second);
        return it->second->matcher;
    }

    ++misses_;
    if (log::enabled(log::Trace)) {
        log::trace("compiling segment '%s' (%s), %zu cached", segment.c_str(),
                   case_sensitive ? "case-sensitive" : "case-insensitive", lru_.size());
    }
    auto matcher = std::make_shared<const Matcher>(segment, case_sensitive);

    lru_.push_front(Entry{key, matcher});
    index_[key] = lru_.begin();
    while (lru_.size() > capacity_) {
        auto& back = lru_.back();
        log::trace("evicting segment '%s'", back.matcher->segment().c_str());
        index_.erase(back.key);
        lru_.pop_back();
        ++evictions_;
    }
    return matcher;
}

void MatcherCache::clear() {
    lru_.clear();
    index_.clear();
}

std::shared_ptr<MatcherCache> default_matcher_cache() {
    static auto cache = std::make_shared<MatcherCache>();
    return cache;
}

} // namespace globstar
