#include <aiiap/tools.hpp>
#include <aiiap/log.hpp>
#include <set>

namespace aiiap {

const char* shape_name(OutputShape s) {
    switch (s) {
        case OutputShape::DirectoryMember:     return "directory";
        case OutputShape::ConcatenatedSection: return "document";
    }
    return "unknown";
}

static ToolTarget directory_target(const char* id, const char* name, const char* dir,
                                   const char* ext, const char* member, bool globs) {
    ToolTarget t;
    t.id = id;
    t.name = name;
    t.shape = OutputShape::DirectoryMember;
    t.output = dir;
    t.extension = ext;
    t.member_filename = member;
    t.supports_globs = globs;
    return t;
}

static ToolTarget document_target(const char* id, const char* name, const char* file) {
    ToolTarget t;
    t.id = id;
    t.name = name;
    t.shape = OutputShape::ConcatenatedSection;
    t.output = file;
    return t;
}

const std::vector<ToolTarget>& builtin_targets() {
    static const std::vector<ToolTarget> targets = {
        directory_target("cursor", "Cursor", ".cursor/rules", ".mdc", "", true),
        directory_target("claude-code", "Claude Code", ".claude/skills", ".md", "SKILL.md", false),
        document_target("claude-cli", "Claude CLI", "CLAUDE.md"),
        document_target("github-copilot", "GitHub Copilot", ".github/copilot-instructions.md"),
        document_target("windsurf", "Windsurf", ".windsurfrules"),
        document_target("aider", "Aider", "CONVENTIONS.md"),
        document_target("google-ai-studio", "Google AI Studio", "GOOGLE_AI_STUDIO.md"),
        document_target("amazon-q", "Amazon Q Developer", "AMAZON_Q.md"),
        document_target("tabnine", "Tabnine", "TABNINE.md"),
        document_target("cody", "Cody (Sourcegraph)", ".cody/instructions.md"),
        document_target("continue", "Continue.dev", ".continue/instructions.md"),
    };
    return targets;
}

const ToolTarget* find_builtin_target(const std::string& id) {
    for (const auto& t : builtin_targets()) {
        if (t.id == id) return &t;
    }
    return nullptr;
}

Result<ToolTarget> resolve_target(const std::string& id, const Config& config) {
    const ToolTarget* builtin = find_builtin_target(id);
    const ToolInfo* info = config.find_tool(id);

    if (!builtin && !info) {
        return AiiapError{AiiapError::NotFound, "unknown tool: " + id};
    }

    ToolTarget t;
    if (builtin) {
        t = *builtin;
    } else {
        t.id = id;
        t.name = id;
    }
    if (!info) return Result<ToolTarget>::ok(std::move(t));

    if (!info->output_dir.empty() && !info->output_file.empty()) {
        return AiiapError{AiiapError::InvalidArg,
            "tool '" + id + "' has both outputDir and outputFile",
            "keep only one of them in [tools." + id + "]"};
    }
    if (!info->name.empty()) t.name = info->name;
    if (!info->output_dir.empty()) {
        t.shape = OutputShape::DirectoryMember;
        t.output = info->output_dir;
        if (t.extension.empty()) t.extension = ".md";
    } else if (!info->output_file.empty()) {
        t.shape = OutputShape::ConcatenatedSection;
        t.output = info->output_file;
        t.extension.clear();
        t.member_filename.clear();
    } else if (!builtin) {
        return AiiapError{AiiapError::NotFound,
            "tool '" + id + "' has no output location",
            "set outputDir or outputFile in [tools." + id + "]"};
    }

    if (t.shape == OutputShape::DirectoryMember) {
        if (info->file_extension) t.extension = *info->file_extension;
        if (!info->skill_filename.empty()) t.member_filename = info->skill_filename;
        if (info->supports_globs) t.supports_globs = *info->supports_globs;
    }

    return Result<ToolTarget>::ok(std::move(t));
}

std::vector<ToolTarget> known_targets(const Config& config) {
    std::set<std::string> ids;
    for (const auto& t : builtin_targets()) ids.insert(t.id);
    for (const auto& [id, info] : config.tools) ids.insert(id);

    std::vector<ToolTarget> out;
    for (const auto& id : ids) {
        auto t = resolve_target(id, config);
        if (t.is_ok()) {
            out.push_back(std::move(t).value());
        } else {
            log::debug("skipping tool %s: %s", id.c_str(), t.error().message.c_str());
        }
    }
    return out;
}

} // namespace aiiap
