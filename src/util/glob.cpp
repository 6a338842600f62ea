#include <aiiap/glob.hpp>
#include <algorithm>

namespace aiiap {

namespace fs = std::filesystem;

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Split on commas at brace depth zero.
static std::vector<std::string> split_top_level(const std::string& s) {
    std::vector<std::string> parts;
    std::string cur;
    int depth = 0;
    for (char c : s) {
        if (c == '{') {
            depth++;
        } else if (c == '}') {
            if (depth > 0) depth--;
        } else if (c == ',' && depth == 0) {
            parts.push_back(cur);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    parts.push_back(cur);
    return parts;
}

std::vector<std::string> split_glob_list(const std::string& list) {
    std::vector<std::string> out;
    for (auto& part : split_top_level(list)) {
        auto p = trim(part);
        if (!p.empty()) out.push_back(std::move(p));
    }
    return out;
}

std::string join_glob_list(const std::vector<std::string>& patterns,
                           const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < patterns.size(); i++) {
        if (i > 0) out += sep;
        out += patterns[i];
    }
    return out;
}

std::vector<std::string> expand_braces(const std::string& pattern) {
    // Locate the first '{' and its matching '}'
    size_t open = pattern.find('{');
    if (open == std::string::npos) return {pattern};

    int depth = 0;
    size_t close = std::string::npos;
    for (size_t i = open; i < pattern.size(); i++) {
        if (pattern[i] == '{') depth++;
        else if (pattern[i] == '}' && --depth == 0) {
            close = i;
            break;
        }
    }
    if (close == std::string::npos) return {pattern};

    std::string prefix = pattern.substr(0, open);
    std::string body = pattern.substr(open + 1, close - open - 1);
    std::string suffix = pattern.substr(close + 1);

    std::vector<std::string> out;
    for (const auto& alt : split_top_level(body)) {
        for (auto& expanded : expand_braces(prefix + alt + suffix)) {
            if (std::find(out.begin(), out.end(), expanded) == out.end()) {
                out.push_back(std::move(expanded));
            }
        }
    }
    return out;
}

static std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!cur.empty()) segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) segs.push_back(cur);
    return segs;
}

// Character class starting at pat[pi] == '['; advances pi past ']'.
static bool match_class(const std::string& pat, size_t& pi, char c) {
    pi++;
    bool negate = pi < pat.size() && pat[pi] == '!';
    if (negate) pi++;
    bool hit = false;
    while (pi < pat.size() && pat[pi] != ']') {
        if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
            if (c >= pat[pi] && c <= pat[pi + 2]) hit = true;
            pi += 3;
        } else {
            if (c == pat[pi]) hit = true;
            pi++;
        }
    }
    if (pi < pat.size()) pi++;
    return hit != negate;
}

static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char pc = pat[pi];
        if (pc == '*') {
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }
        if (si == str.size()) return false;
        if (pc == '?') {
            pi++;
        } else if (pc == '[') {
            if (!match_class(pat, pi, str[si])) return false;
        } else {
            if (pc != str[si]) return false;
            pi++;
        }
        si++;
    }
    return si == str.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= path.size(); k++) {
                if (match_segments(pat, pi, path, k)) return true;
            }
            return false;
        }
        if (si == path.size()) return false;
        if (!match_segment(pat[pi], 0, path[si], 0)) return false;
        pi++;
        si++;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    auto path_segs = split_segments(path);
    for (const auto& alt : expand_braces(pattern)) {
        if (match_segments(split_segments(alt), 0, path_segs, 0)) return true;
    }
    return false;
}

Result<std::vector<std::string>> glob_expand(
    const std::string& pattern,
    const fs::path& root_dir)
{
    std::error_code ec;
    if (!fs::is_directory(root_dir, ec)) {
        return AiiapError(AiiapError::IO,
            "glob_expand: not a directory: " + root_dir.string());
    }

    std::vector<std::string> results;
    fs::recursive_directory_iterator it(root_dir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        auto rel = it->path().lexically_relative(root_dir).generic_string();
        if (glob_match(pattern, rel)) {
            results.push_back(std::move(rel));
        }
    }
    if (ec) {
        return AiiapError(AiiapError::IO,
            "glob_expand: error walking " + root_dir.string() + ": " + ec.message());
    }

    std::sort(results.begin(), results.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

} // namespace aiiap
