#pragma once

#include <globstar/pattern.hpp>
#include <cstddef>
#include <list>
#include <memory>
#include <string>
#include <unordered_map>

namespace globstar {

// Bounded LRU cache of compiled segment matchers, keyed by
// (segment, case_sensitive).
//
// Not thread-safe. Share one instance per thread, or guard it externally.
class MatcherCache {
public:
    static constexpr size_t kDefaultCapacity = 256;

    explicit MatcherCache(size_t capacity = kDefaultCapacity);

    // Returns the cached matcher, compiling it on a miss. The returned
    // pointer stays valid after eviction.
    std::shared_ptr<const Matcher> get(const std::string& segment, bool case_sensitive);

    void clear();

    size_t size() const { return lru_.size(); }
    size_t capacity() const { return capacity_; }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }
    size_t evictions() const { return evictions_; }

private:
    struct Entry {
        std::string key;
        std::shared_ptr<const Matcher> matcher;
    };

    static std::string make_key(const std::string& segment, bool case_sensitive);

    size_t capacity_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t evictions_ = 0;
    std::list<Entry> lru_;  // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

// Process-wide cache used by the free functions in <globstar/glob.hpp>.
std::shared_ptr<MatcherCache> default_matcher_cache();

} // namespace globstar
