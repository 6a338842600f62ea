#pragma once

#include <aiiap/result.hpp>
#include <aiiap/config.hpp>
#include <string>
#include <vector>

namespace aiiap {

enum class OutputShape {
    DirectoryMember,       // one file per item, frontmatter header
    ConcatenatedSection    // one document per tool, sections joined by a delimiter
};

const char* shape_name(OutputShape s);

// Where and how a tool's artifacts are written
struct ToolTarget {
    std::string id;
    std::string name;
    OutputShape shape = OutputShape::ConcatenatedSection;
    std::string output;            // relative to project root: directory or file
    std::string extension;         // DirectoryMember: appended to the content name
    std::string member_filename;   // DirectoryMember: fixed name inside a per-item dir
    bool supports_globs = false;   // frontmatter carries alwaysApply and globs
};

const std::vector<ToolTarget>& builtin_targets();
const ToolTarget* find_builtin_target(const std::string& id);

// Built-in target with the config's [tools.<id>] settings applied on top.
// NotFound for a tool that has neither; InvalidArg for outputDir + outputFile.
Result<ToolTarget> resolve_target(const std::string& id, const Config& config);

// Every target that can be resolved: built-ins plus configured tools, by id
std::vector<ToolTarget> known_targets(const Config& config);

} // namespace aiiap
