#pragma once

#include <aiiap/result.hpp>
#include <aiiap/resolver.hpp>
#include <toml++/toml.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>

namespace aiiap {

// [tools.<id>]
struct ToolInfo {
    std::string id;
    std::string name;
    bool recommended = false;
    std::string output_dir;                      // outputDir: directory-of-files tools
    std::string output_file;                     // outputFile: single-document tools
    std::optional<std::string> file_extension;   // fileExtension
    std::string skill_filename;                  // skillFilename
    std::optional<bool> use_frontmatter;         // useFrontmatter
    std::optional<bool> supports_globs;          // supportsGlobs
    std::optional<bool> supports_subfolders;     // supportsSubfolders
};

// [languages.<lang>.frameworks.<fw>.structures.<id>]
struct StructureInfo {
    std::string id;
    std::string name;
    std::string description;
    std::string file;
    bool recommended = false;
};

// [languages.<lang>.frameworks.<id>]
struct FrameworkInfo {
    std::string id;
    std::string name;
    std::string description;
    std::string file;
    std::string category;
    bool recommended = false;
    std::vector<std::string> requires_frameworks;   // "requires"
    std::map<std::string, StructureInfo> structures;

    // Structure whose file is `file`, or nullptr
    const StructureInfo* find_structure_file(const std::string& file) const;
};

// [languages.<lang>.processes.<id>]
struct ProcessInfo {
    std::string id;
    std::string name;
    std::string description;
    std::string file;
    bool permanent = true;

    ProcessPhase phase() const {
        return permanent ? ProcessPhase::Permanent : ProcessPhase::OnDemand;
    }
};

// [languages.<lang>.documentation.<id>]
struct DocumentationInfo {
    std::string id;
    std::string name;
    std::string description;
    std::string file;
    bool recommended = false;
    std::vector<std::string> applicable_to;   // "applicableTo"
};

// [languages.<id>]
struct LanguageInfo {
    std::string id;
    std::string name;
    std::string description;
    std::string globs;           // comma-separated, may contain {a,b} groups
    bool always_apply = false;
    bool has_files = false;      // "files" key present
    std::vector<std::string> files;
    std::map<std::string, FrameworkInfo> frameworks;
    std::map<std::string, ProcessInfo> processes;
    std::map<std::string, DocumentationInfo> documentation;

    const FrameworkInfo* find_framework(const std::string& id) const;
    const ProcessInfo* find_process(const std::string& id) const;
    const DocumentationInfo* find_documentation(const std::string& id) const;
};

// Normalized configuration, deserialized once from the merged document.
// Maps are ordered so every walk over them is deterministic.
struct Config {
    std::string version;
    std::map<std::string, ToolInfo> tools;
    std::map<std::string, LanguageInfo> languages;

    // Typed view of an already merged and normalized document
    static Result<Config> from_table(const toml::table& doc);

    // Parse, normalize and deserialize a single document (no overlay)
    static Result<Config> parse(const std::string& toml_str);

    const LanguageInfo* find_language(const std::string& id) const;
    const ToolInfo* find_tool(const std::string& id) const;

    // Languages in emission order: alwaysApply first, then the rest,
    // each group in key order
    std::vector<const LanguageInfo*> ordered_languages() const;
};

// ---------------------------------------------------------------------------
// Document-level operations
// ---------------------------------------------------------------------------

// Deep, right-biased merge: tables merge recursively, any other overlay value
// replaces whatever the base holds at that key.
void merge_tables(toml::table& base, const toml::table& overlay);

// Fold customFiles / customFrameworks / customProcesses of every language into
// files / frameworks / processes and drop the custom keys. Idempotent.
void normalize_document(toml::table& doc);

enum class DocumentRole { Base, Overlay };

// Parse TOML text; errors carry a role-specific remediation hint
Result<toml::table> parse_document(const std::string& text,
                                   const std::string& origin,
                                   DocumentRole role);

Result<toml::table> read_document(const std::filesystem::path& path, DocumentRole role);

struct ConfigSources {
    std::filesystem::path base;      // required
    std::filesystem::path overlay;   // optional; ignored when the file is absent
};

// Base (+ overlay if present), merged and normalized
Result<toml::table> merge_documents(const ConfigSources& sources);

// merge_documents, materialized to a process-scoped temporary file, read back
// and deserialized. The temporary file never outlives the call.
Result<Config> load_config(const ConfigSources& sources);

} // namespace aiiap
