#pragma once

#include <aiiap/result.hpp>
#include <aiiap/tools.hpp>
#include <string>
#include <vector>
#include <utility>
#include <filesystem>

namespace aiiap {

inline constexpr int kManagedSchemaVersion = 1;

// A file produced by this generation pass. The marker is embedded in the file
// itself, so later runs recognize it without any bookkeeping on the side.
struct ManagedArtifact {
    std::filesystem::path path;
    std::string marker;
    OutputShape shape = OutputShape::DirectoryMember;
    bool replaced_unmanaged = false;   // overwrote a file aiiap did not write
};

// Ordered frontmatter attributes (key, value)
using Attributes = std::vector<std::pair<std::string, std::string>>;

// "---" block: managed flag, schema version, owning tool, then attrs
std::string member_header(const std::string& tool_id, const Attributes& attrs);

// Single comment line that opens a concatenated document
std::string document_marker(const std::string& tool_id);

// True when text opens with a frontmatter block marked managed by tool_id
bool is_managed_member(const std::string& text, const std::string& tool_id);

// True when the first line of text is the document marker of tool_id
bool is_managed_document(const std::string& text, const std::string& tool_id);

// Write header + "\n" + body, replacing whatever is at path
Result<ManagedArtifact> write_member(const std::filesystem::path& path,
                                     const std::string& tool_id,
                                     const Attributes& attrs,
                                     const std::string& body);

// Write marker line + body, replacing whatever is at path
Result<ManagedArtifact> write_document(const std::filesystem::path& path,
                                       const std::string& tool_id,
                                       const std::string& body);

struct CleanupReport {
    std::vector<std::filesystem::path> removed;        // managed files deleted
    std::vector<std::filesystem::path> kept;           // candidates left alone
    std::vector<std::filesystem::path> removed_dirs;   // directories this pass emptied
};

// Remove every file under the tool's output location that carries its marker
Result<CleanupReport> cleanup(const ToolTarget& target,
                              const std::filesystem::path& project_root);

} // namespace aiiap
