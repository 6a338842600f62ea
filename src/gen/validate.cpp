#include <aiiap/validate.hpp>
#include <aiiap/tools.hpp>

namespace aiiap {

const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

namespace {

class IssueList {
public:
    void error(std::string msg) { issues_.push_back({Severity::Error, std::move(msg)}); }
    void warn(std::string msg) { issues_.push_back({Severity::Warning, std::move(msg)}); }

    std::vector<ValidationIssue> take() { return std::move(issues_); }

private:
    std::vector<ValidationIssue> issues_;
};

} // namespace

static std::string q(const std::string& s) { return "'" + s + "'"; }

static void check_tool(const ToolInfo& tool, IssueList& out) {
    std::string where = "Tool " + q(tool.id);
    if (tool.name.empty()) out.error(where + ": Missing 'name' property");

    bool has_dir = !tool.output_dir.empty();
    bool has_file = !tool.output_file.empty();
    if (has_dir && has_file) {
        out.error(where + ": Has both 'outputDir' and 'outputFile' (should have only one)");
    } else if (!has_dir && !has_file && !find_builtin_target(tool.id)) {
        out.error(where + ": Missing both 'outputDir' and 'outputFile' (needs one)");
    }

    if (tool.id == "cursor" && tool.supports_globs && !*tool.supports_globs) {
        out.warn(where + ": Should have 'supportsGlobs: true'");
    }
    if (tool.id == "claude-code" && tool.supports_globs && *tool.supports_globs) {
        out.warn(where + ": Should have 'supportsGlobs: false' (uses directory-based skills)");
    }
}

static void check_resolvable(const ContentResolver& resolver, const ContentRequest& req,
                             const std::string& where, IssueList& out) {
    auto found = resolver.resolve(req);
    if (found.is_err()) out.error(where + ": " + found.error().message);
}

static void check_language(const LanguageInfo& lang, const ContentResolver& resolver,
                           IssueList& out) {
    std::string where = "Language " + q(lang.id);
    if (lang.name.empty()) out.error(where + ": Missing 'name' property");
    if (lang.globs.empty()) out.error(where + ": Missing 'globs' property");
    if (lang.description.empty()) out.error(where + ": Missing 'description' property");
    if (!lang.has_files) out.error(where + ": Missing 'files' property");

    if (lang.id == "general") {
        if (!lang.always_apply) out.error(where + ": Should have 'alwaysApply: true'");
        if (lang.documentation.empty()) out.warn(where + ": Missing 'documentation' section");
    } else if (lang.always_apply) {
        out.warn(where + ": Has 'alwaysApply: true' (only 'general' should have this)");
    }

    for (const auto& file : lang.files) {
        check_resolvable(resolver, {Category::Rule, lang.id, file, std::nullopt}, where, out);
    }

    for (const auto& [id, doc] : lang.documentation) {
        std::string doc_where = where + ", Documentation " + q(id);
        const std::string& file = doc.file.empty() ? id : doc.file;
        check_resolvable(resolver, {Category::Rule, lang.id, file, std::nullopt}, doc_where, out);
    }

    for (const auto& [id, fw] : lang.frameworks) {
        std::string fw_where = where + ", Framework " + q(id);
        if (fw.name.empty()) out.error(fw_where + ": Missing 'name' property");
        if (fw.category.empty()) out.warn(fw_where + ": Missing 'category' property");
        if (fw.description.empty()) out.warn(fw_where + ": Missing 'description' property");
        if (fw.file.empty()) {
            out.error(fw_where + ": Missing 'file' property");
        } else {
            check_resolvable(resolver, {Category::Framework, lang.id, fw.file, std::nullopt},
                             fw_where, out);
        }

        for (const auto& req : fw.requires_frameworks) {
            if (!lang.find_framework(req)) {
                out.error(fw_where + ": Requires unknown framework " + q(req));
            }
        }

        for (const auto& [sid, st] : fw.structures) {
            std::string st_where = fw_where + ", Structure " + q(sid);
            if (st.name.empty()) out.error(st_where + ": Missing 'name'");
            if (st.description.empty()) out.warn(st_where + ": Missing 'description'");
            if (st.file.empty()) {
                out.error(st_where + ": Missing 'file'");
            } else {
                check_resolvable(resolver, {Category::Structure, lang.id, st.file, std::nullopt},
                                 st_where, out);
            }
        }
    }

    for (const auto& [id, proc] : lang.processes) {
        std::string p_where = where + ", Process " + q(id);
        if (proc.name.empty()) out.error(p_where + ": Missing 'name' property");
        if (proc.description.empty()) out.warn(p_where + ": Missing 'description' property");
        if (proc.file.empty()) {
            out.error(p_where + ": Missing 'file' property");
        } else {
            check_resolvable(resolver, {Category::Process, lang.id, proc.file, proc.phase()},
                             p_where, out);
        }
    }
}

std::vector<ValidationIssue> validate_config(const Config& config,
                                             const ContentResolver& resolver) {
    IssueList out;
    if (config.version.empty()) out.error("Missing 'version' property");

    for (const auto& [id, tool] : config.tools) check_tool(tool, out);
    for (const auto& [id, lang] : config.languages) check_language(lang, resolver, out);

    return out.take();
}

bool has_errors(const std::vector<ValidationIssue>& issues) {
    for (const auto& i : issues) {
        if (i.severity == Severity::Error) return true;
    }
    return false;
}

} // namespace aiiap
