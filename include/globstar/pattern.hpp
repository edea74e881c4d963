#pragma once

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace globstar {

// True if `s` contains any of the wildcard characters '*', '?' or '['.
bool has_magic(const std::string& s);

// Names starting with '.' are hidden from '*' and '?'.
bool is_hidden(const std::string& name);

// Translate one shell-glob segment (no separators) into an ECMAScript regex
// body. Every wildcard token becomes one capture group, in source order:
//   *       -> ([\s\S]*)
//   ?       -> ([\s\S])
//   [seq]   -> ([seq])
//   [!seq]  -> ([^seq])
// An unclosed '[' is emitted as a literal. There is no way to quote
// meta-characters. The result is not anchored; Matcher applies a full match.
std::string translate(const std::string& segment);

// A compiled single-segment pattern. Literal segments (no magic) never build
// a regex and only test for equality.
class Matcher {
public:
    Matcher(std::string segment, bool case_sensitive);

    // True if `name` matches the whole segment. When `groups` is non-null it
    // receives one captured substring per wildcard token.
    bool match(const std::string& name, std::vector<std::string>* groups = nullptr) const;

    // Convenience form returning the captures, or nullopt on mismatch.
    std::optional<std::vector<std::string>> captures(const std::string& name) const;

    const std::string& segment() const { return segment_; }
    bool case_sensitive() const { return case_sensitive_; }
    bool is_literal() const { return !regex_.has_value(); }
    size_t group_count() const { return group_count_; }

private:
    std::string segment_;
    bool case_sensitive_;
    size_t group_count_ = 0;
    std::optional<std::regex> regex_;
};

// ---- Path helpers ----

enum class NormPaths {
    Full,        // lowercase ASCII and rewrite separators
    Separators,  // rewrite '/' and '\' to the effective separator
    None         // leave paths untouched
};

// The platform separator: '\' on Windows, '/' elsewhere.
char native_separator();

// Split at the last separator in `seps`, like os.path.split(): trailing
// separators are stripped from the head unless the head is all separators.
// "a/b" -> ("a", "b"), "**/" -> ("**", ""), "/x" -> ("/", "x"), "x" -> ("", "x")
std::pair<std::string, std::string> split_path(const std::string& path,
                                               const std::string& seps);

// Join a directory and a name. An empty directory yields `name`; an empty
// name yields `dir` with a trailing separator.
std::string join_path(const std::string& dir, const std::string& name, char sep);

// Apply a normalization mode to a path or pattern.
std::string normalize(const std::string& path, NormPaths mode, char sep);

const char* norm_paths_name(NormPaths mode);
bool parse_norm_paths(const std::string& name, NormPaths& out);

} // namespace globstar
