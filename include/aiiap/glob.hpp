#pragma once

#include <aiiap/result.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace aiiap {

// Split a comma-separated glob list ("**/*.{ts,tsx}, *.js") into patterns.
// Commas nested inside {...} belong to the pattern; surrounding whitespace is
// trimmed and empty entries are dropped. An unclosed '{' swallows the rest.
std::vector<std::string> split_glob_list(const std::string& list);

// Join patterns back into the single-line form tools expect.
std::string join_glob_list(const std::vector<std::string>& patterns,
                           const std::string& sep = ",");

// Expand {a,b} alternatives, left to right, nested groups included.
// "src/*.{c,h}" -> ["src/*.c", "src/*.h"]. Patterns without braces come back as-is.
std::vector<std::string> expand_braces(const std::string& pattern);

// Match a pattern against a '/'-separated relative path.
// Supports * and ? within a segment, ** across segments, [a-z] / [!x] classes
// and {a,b} alternatives.
bool glob_match(const std::string& pattern, const std::string& path);

// Regular files under root_dir whose relative path matches pattern, sorted.
Result<std::vector<std::string>> glob_expand(
    const std::string& pattern,
    const std::filesystem::path& root_dir);

} // namespace aiiap
