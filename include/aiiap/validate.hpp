#pragma once

#include <aiiap/config.hpp>
#include <aiiap/resolver.hpp>
#include <string>
#include <vector>

namespace aiiap {

enum class Severity { Warning, Error };

const char* severity_name(Severity s);

struct ValidationIssue {
    Severity severity = Severity::Error;
    std::string message;
};

// Consistency checks over a normalized config, including that every content
// file it references can be resolved. Issues come back in config order.
std::vector<ValidationIssue> validate_config(const Config& config,
                                             const ContentResolver& resolver);

bool has_errors(const std::vector<ValidationIssue>& issues);

} // namespace aiiap
