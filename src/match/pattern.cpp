#include <globstar/pattern.hpp>
#include <cctype>
#include <cstring>

namespace globstar {

bool has_magic(const std::string& s) {
    return s.find_first_of("*?[") != std::string::npos;
}

bool is_hidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

// ---- Translation ----

static bool is_regex_special(char c) {
    return std::strchr("\\^$.|?*+()[]{}", c) != nullptr && c != '\0';
}

std::string translate(const std::string& pat) {
    std::string res;
    size_t i = 0;
    const size_t n = pat.size();

    while (i < n) {
        char c = pat[i++];

        if (c == '*') {
            res += "([\\s\\S]*)";
        } else if (c == '?') {
            res += "([\\s\\S])";
        } else if (c == '[') {
            // Find the closing ']'. A ']' directly after '[' or '[!' is
            // part of the set, not its end.
            size_t j = i;
            if (j < n && pat[j] == '!') j++;
            if (j < n && pat[j] == ']') j++;
            while (j < n && pat[j] != ']') j++;

            if (j >= n) {
                res += "\\[";
                continue;
            }

            std::string stuff = pat.substr(i, j - i);
            i = j + 1;

            std::string cls;
            size_t k = 0;
            if (stuff[0] == '!') {
                cls += '^';
                k = 1;
            } else if (stuff[0] == '^') {
                cls += "\\^";
                k = 1;
            }
            for (; k < stuff.size(); k++) {
                char sc = stuff[k];
                // ECMAScript treats a leading ']' as an empty class
                if (sc == '\\' || sc == ']' || sc == '[') cls += '\\';
                cls += sc;
            }
            res += "([" + cls + "])";
        } else {
            if (is_regex_special(c)) res += '\\';
            res += c;
        }
    }

    return res;
}

// ---- Matcher ----

static bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

Matcher::Matcher(std::string segment, bool case_sensitive)
    : segment_(std::move(segment)), case_sensitive_(case_sensitive) {
    if (!has_magic(segment_)) return;

    auto flags = std::regex::ECMAScript;
    if (!case_sensitive_) flags |= std::regex::icase;
    try {
        regex_.emplace(translate(segment_), flags);
        group_count_ = regex_->mark_count();
    } catch (const std::regex_error&) {
        // e.g. a reversed range "[z-a]"; match the segment literally
        regex_.reset();
        group_count_ = 0;
    }
}

bool Matcher::match(const std::string& name, std::vector<std::string>* groups) const {
    if (!regex_) {
        bool eq = case_sensitive_ ? name == segment_ : iequals(name, segment_);
        if (eq && groups) groups->clear();
        return eq;
    }

    std::smatch m;
    if (!std::regex_match(name, m, *regex_)) return false;

    if (groups) {
        groups->clear();
        groups->reserve(group_count_);
        for (size_t g = 1; g <= group_count_; g++) {
            groups->push_back(m[g].str());
        }
    }
    return true;
}

std::optional<std::vector<std::string>> Matcher::captures(const std::string& name) const {
    std::vector<std::string> groups;
    if (!match(name, &groups)) return std::nullopt;
    return groups;
}

// ---- Path helpers ----

char native_separator() {
#ifdef _WIN32
    return '\\';
#else
    return '/';
#endif
}

std::pair<std::string, std::string> split_path(const std::string& path,
                                               const std::string& seps) {
    size_t pos = path.find_last_of(seps);
    if (pos == std::string::npos) return {"", path};

    std::string head = path.substr(0, pos + 1);
    std::string tail = path.substr(pos + 1);

    bool all_seps = head.find_first_not_of(seps) == std::string::npos;
    if (!all_seps) {
        while (!head.empty() && seps.find(head.back()) != std::string::npos) {
            head.pop_back();
        }
    }
    return {head, tail};
}

std::string join_path(const std::string& dir, const std::string& name, char sep) {
    if (dir.empty()) return name;
    std::string out = dir;
    if (out.back() != '/' && out.back() != sep) out.push_back(sep);
    out += name;
    return out;
}

std::string normalize(const std::string& path, NormPaths mode, char sep) {
    if (mode == NormPaths::None) return path;

    std::string out = path;
    for (char& c : out) {
        if (c == '/' || c == '\\') {
            c = sep;
        } else if (mode == NormPaths::Full) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

const char* norm_paths_name(NormPaths mode) {
    switch (mode) {
        case NormPaths::Full:       return "full";
        case NormPaths::Separators: return "separators";
        case NormPaths::None:       return "none";
    }
    return "unknown";
}

bool parse_norm_paths(const std::string& name, NormPaths& out) {
    for (NormPaths mode : {NormPaths::Full, NormPaths::Separators, NormPaths::None}) {
        if (name == norm_paths_name(mode)) {
            out = mode;
            return true;
        }
    }
    return false;
}

} // namespace globstar
