#include <aiiap/managed.hpp>
#include <aiiap/glob.hpp>
#include <aiiap/log.hpp>
#include <fstream>
#include <sstream>

namespace aiiap {

namespace fs = std::filesystem;

static constexpr const char* kManagedKey = "aiiap-managed";
static constexpr const char* kVersionKey = "aiiap-version";
static constexpr const char* kToolKey = "aiiap-tool";
static constexpr const char* kDocumentMarkerPrefix = "<!-- aiiap:managed tool=";

// ---------------------------------------------------------------------------
// Markers
// ---------------------------------------------------------------------------

std::string member_header(const std::string& tool_id, const Attributes& attrs) {
    std::string out = "---\n";
    out += std::string(kManagedKey) + ": true\n";
    out += std::string(kVersionKey) + ": " + std::to_string(kManagedSchemaVersion) + "\n";
    out += std::string(kToolKey) + ": " + tool_id + "\n";
    for (const auto& [key, value] : attrs) {
        out += key + ": " + value + "\n";
    }
    out += "---\n";
    return out;
}

std::string document_marker(const std::string& tool_id) {
    return std::string(kDocumentMarkerPrefix) + tool_id + " version=" +
           std::to_string(kManagedSchemaVersion) + " -->";
}

static std::string chomp(std::string line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

bool is_managed_member(const std::string& text, const std::string& tool_id) {
    std::istringstream in(text);
    std::string line;
    if (!std::getline(in, line) || chomp(line) != "---") return false;

    bool managed = false;
    bool owned = false;
    while (std::getline(in, line)) {
        line = chomp(line);
        if (line == "---") break;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        if (key == kManagedKey) managed = value == "true";
        else if (key == kToolKey) owned = value == tool_id;
    }
    return managed && owned;
}

bool is_managed_document(const std::string& text, const std::string& tool_id) {
    std::string first = chomp(text.substr(0, text.find('\n')));
    std::string prefix = std::string(kDocumentMarkerPrefix) + tool_id + " ";
    return first.compare(0, prefix.size(), prefix) == 0 &&
           first.size() >= 3 && first.compare(first.size() - 3, 3, "-->") == 0;
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

static Result<std::string> read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return AiiapError{AiiapError::IO, "cannot read " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::ok(ss.str());
}

static Status write_text(const fs::path& path, const std::string& contents) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return AiiapError{AiiapError::IO,
                "cannot create directory " + path.parent_path().string() + ": " + ec.message()};
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return AiiapError{AiiapError::IO, "cannot write " + path.string()};
    }
    out << contents;
    out.close();
    if (!out) {
        return AiiapError{AiiapError::IO, "failed writing " + path.string()};
    }
    return ok_status();
}

// Overwrite is unconditional, but say so when the file was not ours
template<typename IsOurs>
static bool warn_if_foreign(const fs::path& path, IsOurs&& is_ours) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    auto existing = read_text(path);
    if (existing.is_ok() && !is_ours(existing.value())) {
        log::warn("replacing %s, which was not generated by aiiap", path.string().c_str());
        return true;
    }
    return false;
}

Result<ManagedArtifact> write_member(const fs::path& path,
                                     const std::string& tool_id,
                                     const Attributes& attrs,
                                     const std::string& body) {
    bool foreign = warn_if_foreign(path,
        [&](const std::string& t) { return is_managed_member(t, tool_id); });
    AIIAP_TRY(write_text(path, member_header(tool_id, attrs) + "\n" + body));
    return Result<ManagedArtifact>::ok(ManagedArtifact{
        path, std::string(kToolKey) + ": " + tool_id, OutputShape::DirectoryMember, foreign});
}

Result<ManagedArtifact> write_document(const fs::path& path,
                                       const std::string& tool_id,
                                       const std::string& body) {
    bool foreign = warn_if_foreign(path,
        [&](const std::string& t) { return is_managed_document(t, tool_id); });
    std::string marker = document_marker(tool_id);
    AIIAP_TRY(write_text(path, marker + "\n" + body));
    return Result<ManagedArtifact>::ok(ManagedArtifact{
        path, std::move(marker), OutputShape::ConcatenatedSection, foreign});
}

// ---------------------------------------------------------------------------
// Cleanup
// ---------------------------------------------------------------------------

static bool is_empty_dir(const fs::path& dir) {
    std::error_code ec;
    return fs::is_directory(dir, ec) && fs::is_empty(dir, ec) && !ec;
}

// Remove the parents of a deleted file while they are empty, deepest first,
// never leaving stop. stop itself goes only when remove_stop is set.
static void prune_emptied_parents(const fs::path& file, const fs::path& stop,
                                  bool remove_stop, CleanupReport& report) {
    const fs::path limit = stop.lexically_normal();
    for (fs::path dir = file.parent_path().lexically_normal();
         dir.has_relative_path() && is_empty_dir(dir);
         dir = dir.parent_path()) {
        fs::path rel = dir.lexically_relative(limit);
        if (rel.empty() || *rel.begin() == "..") break;
        const bool at_stop = rel == ".";
        if (at_stop && !remove_stop) break;

        std::error_code ec;
        if (!fs::remove(dir, ec)) break;
        report.removed_dirs.push_back(dir);
        if (at_stop) break;
    }
}

static Status cleanup_directory(const ToolTarget& target, const fs::path& project_root,
                                CleanupReport& report) {
    fs::path root = project_root / target.output;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return ok_status();

    std::string pattern = target.member_filename.empty()
        ? "**/*" + target.extension
        : "**/" + target.member_filename;
    auto files = glob_expand(pattern, root);
    if (files.is_err()) return std::move(files).error();

    for (const auto& rel : files.value()) {
        fs::path p = root / rel;
        auto text = read_text(p);
        if (text.is_err() || !is_managed_member(text.value(), target.id)) {
            report.kept.push_back(p);
            continue;
        }
        if (!fs::remove(p, ec) || ec) {
            return AiiapError{AiiapError::IO,
                "cannot remove " + p.string() + ": " + ec.message()};
        }
        report.removed.push_back(p);
    }

    // Only directories this pass emptied; the root goes too once nothing is left
    for (const auto& p : report.removed) {
        prune_emptied_parents(p, root, true, report);
    }
    return ok_status();
}

static Status cleanup_document(const ToolTarget& target, const fs::path& project_root,
                               CleanupReport& report) {
    fs::path file = project_root / target.output;
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) return ok_status();

    auto text = read_text(file);
    if (text.is_err() || !is_managed_document(text.value(), target.id)) {
        report.kept.push_back(file);
        return ok_status();
    }
    if (!fs::remove(file, ec) || ec) {
        return AiiapError{AiiapError::IO,
            "cannot remove " + file.string() + ": " + ec.message()};
    }
    report.removed.push_back(file);

    // Parent directories we may have created, never the project root itself
    prune_emptied_parents(file, project_root, false, report);
    return ok_status();
}

Result<CleanupReport> cleanup(const ToolTarget& target, const fs::path& project_root) {
    CleanupReport report;
    Status st = target.shape == OutputShape::DirectoryMember
        ? cleanup_directory(target, project_root, report)
        : cleanup_document(target, project_root, report);
    if (st.is_err()) return std::move(st).error();

    for (const auto& p : report.removed) {
        log::debug("removed %s", p.string().c_str());
    }
    return Result<CleanupReport>::ok(std::move(report));
}

} // namespace aiiap
