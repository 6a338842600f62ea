#include <aiiap/config.hpp>
#include <aiiap/tempfile.hpp>
#include <aiiap/log.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace aiiap {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Typed field readers
// ---------------------------------------------------------------------------

static std::string key_path(const std::string& parent, std::string_view key) {
    if (parent.empty()) return std::string(key);
    return parent + "." + std::string(key);
}

static AiiapError type_error(const std::string& where, std::string_view key,
                             const char* expected) {
    return AiiapError{AiiapError::Config,
        "'" + key_path(where, key) + "' must be " + expected};
}

static Status read_string(const toml::table& tbl, std::string_view key,
                          const std::string& where, std::string& out) {
    const toml::node* n = tbl.get(key);
    if (!n) return ok_status();
    auto* s = n->as_string();
    if (!s) return type_error(where, key, "a string");
    out = s->get();
    return ok_status();
}

static Status read_bool(const toml::table& tbl, std::string_view key,
                        const std::string& where, bool& out) {
    const toml::node* n = tbl.get(key);
    if (!n) return ok_status();
    auto* b = n->as_boolean();
    if (!b) return type_error(where, key, "a boolean");
    out = b->get();
    return ok_status();
}

static Status read_opt_bool(const toml::table& tbl, std::string_view key,
                            const std::string& where, std::optional<bool>& out) {
    if (!tbl.contains(key)) return ok_status();
    bool v = false;
    AIIAP_TRY(read_bool(tbl, key, where, v));
    out = v;
    return ok_status();
}

static Status read_string_array(const toml::table& tbl, std::string_view key,
                                const std::string& where,
                                std::vector<std::string>& out) {
    const toml::node* n = tbl.get(key);
    if (!n) return ok_status();
    auto* arr = n->as_array();
    if (!arr) return type_error(where, key, "an array of strings");
    for (const auto& elem : *arr) {
        auto* s = elem.as_string();
        if (!s) return type_error(where, key, "an array of strings");
        out.push_back(s->get());
    }
    return ok_status();
}

// Calls fn(id, table, where) for every sub-table of tbl[key]
template<typename F>
static Status for_each_entry(const toml::table& tbl, std::string_view key,
                             const std::string& where, F&& fn) {
    const toml::node* n = tbl.get(key);
    if (!n) return ok_status();
    auto* sub = n->as_table();
    if (!sub) return type_error(where, key, "a table");

    const std::string sub_where = key_path(where, key);
    for (const auto& [k, v] : *sub) {
        std::string id(k.str());
        auto* entry = v.as_table();
        if (!entry) return type_error(sub_where, id, "a table");
        AIIAP_TRY(fn(id, *entry, key_path(sub_where, id)));
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Section parsers
// ---------------------------------------------------------------------------

static Status parse_tool(const std::string& id, const toml::table& tbl,
                         const std::string& where, ToolInfo& tool) {
    tool.id = id;
    AIIAP_TRY(read_string(tbl, "name", where, tool.name));
    AIIAP_TRY(read_bool(tbl, "recommended", where, tool.recommended));
    AIIAP_TRY(read_string(tbl, "outputDir", where, tool.output_dir));
    AIIAP_TRY(read_string(tbl, "outputFile", where, tool.output_file));
    AIIAP_TRY(read_string(tbl, "skillFilename", where, tool.skill_filename));
    if (tbl.contains("fileExtension")) {
        std::string ext;
        AIIAP_TRY(read_string(tbl, "fileExtension", where, ext));
        tool.file_extension = ext;
    }
    AIIAP_TRY(read_opt_bool(tbl, "useFrontmatter", where, tool.use_frontmatter));
    AIIAP_TRY(read_opt_bool(tbl, "supportsGlobs", where, tool.supports_globs));
    AIIAP_TRY(read_opt_bool(tbl, "supportsSubfolders", where, tool.supports_subfolders));
    return ok_status();
}

static Status parse_framework(const std::string& id, const toml::table& tbl,
                              const std::string& where, FrameworkInfo& fw) {
    fw.id = id;
    AIIAP_TRY(read_string(tbl, "name", where, fw.name));
    AIIAP_TRY(read_string(tbl, "description", where, fw.description));
    AIIAP_TRY(read_string(tbl, "file", where, fw.file));
    AIIAP_TRY(read_string(tbl, "category", where, fw.category));
    AIIAP_TRY(read_bool(tbl, "recommended", where, fw.recommended));
    AIIAP_TRY(read_string_array(tbl, "requires", where, fw.requires_frameworks));

    return for_each_entry(tbl, "structures", where,
        [&](const std::string& sid, const toml::table& st, const std::string& sw) -> Status {
            StructureInfo s;
            s.id = sid;
            AIIAP_TRY(read_string(st, "name", sw, s.name));
            AIIAP_TRY(read_string(st, "description", sw, s.description));
            AIIAP_TRY(read_string(st, "file", sw, s.file));
            AIIAP_TRY(read_bool(st, "recommended", sw, s.recommended));
            fw.structures.emplace(sid, std::move(s));
            return ok_status();
        });
}

static Status parse_language(const std::string& id, const toml::table& tbl,
                             const std::string& where, LanguageInfo& lang) {
    lang.id = id;
    AIIAP_TRY(read_string(tbl, "name", where, lang.name));
    AIIAP_TRY(read_string(tbl, "description", where, lang.description));
    AIIAP_TRY(read_string(tbl, "globs", where, lang.globs));
    AIIAP_TRY(read_bool(tbl, "alwaysApply", where, lang.always_apply));
    lang.has_files = tbl.contains("files");
    AIIAP_TRY(read_string_array(tbl, "files", where, lang.files));

    // Anything still under a custom* key was not foldable
    for (const char* legacy : {"customFiles", "customFrameworks", "customProcesses"}) {
        if (tbl.contains(legacy)) {
            return type_error(where, legacy,
                std::string_view(legacy) == "customFiles"
                    ? "an array of strings" : "a table");
        }
    }

    AIIAP_TRY(for_each_entry(tbl, "frameworks", where,
        [&](const std::string& fid, const toml::table& ft, const std::string& fw_where) -> Status {
            FrameworkInfo fw;
            AIIAP_TRY(parse_framework(fid, ft, fw_where, fw));
            lang.frameworks.emplace(fid, std::move(fw));
            return ok_status();
        }));

    AIIAP_TRY(for_each_entry(tbl, "processes", where,
        [&](const std::string& pid, const toml::table& pt, const std::string& pw) -> Status {
            ProcessInfo p;
            p.id = pid;
            AIIAP_TRY(read_string(pt, "name", pw, p.name));
            AIIAP_TRY(read_string(pt, "description", pw, p.description));
            AIIAP_TRY(read_string(pt, "file", pw, p.file));
            AIIAP_TRY(read_bool(pt, "permanent", pw, p.permanent));
            lang.processes.emplace(pid, std::move(p));
            return ok_status();
        }));

    return for_each_entry(tbl, "documentation", where,
        [&](const std::string& did, const toml::table& dt, const std::string& dw) -> Status {
            DocumentationInfo d;
            d.id = did;
            AIIAP_TRY(read_string(dt, "name", dw, d.name));
            AIIAP_TRY(read_string(dt, "description", dw, d.description));
            AIIAP_TRY(read_string(dt, "file", dw, d.file));
            AIIAP_TRY(read_bool(dt, "recommended", dw, d.recommended));
            AIIAP_TRY(read_string_array(dt, "applicableTo", dw, d.applicable_to));
            lang.documentation.emplace(did, std::move(d));
            return ok_status();
        });
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

Result<Config> Config::from_table(const toml::table& doc) {
    Config cfg;
    AIIAP_TRY(read_string(doc, "version", "", cfg.version));

    AIIAP_TRY(for_each_entry(doc, "tools", "",
        [&](const std::string& id, const toml::table& tbl, const std::string& where) -> Status {
            ToolInfo tool;
            AIIAP_TRY(parse_tool(id, tbl, where, tool));
            cfg.tools.emplace(id, std::move(tool));
            return ok_status();
        }));

    AIIAP_TRY(for_each_entry(doc, "languages", "",
        [&](const std::string& id, const toml::table& tbl, const std::string& where) -> Status {
            LanguageInfo lang;
            AIIAP_TRY(parse_language(id, tbl, where, lang));
            cfg.languages.emplace(id, std::move(lang));
            return ok_status();
        }));

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::parse(const std::string& toml_str) {
    auto doc = parse_document(toml_str, "<string>", DocumentRole::Base);
    if (doc.is_err()) return std::move(doc).error();
    normalize_document(doc.value());
    return Config::from_table(doc.value());
}

const LanguageInfo* Config::find_language(const std::string& id) const {
    auto it = languages.find(id);
    return it == languages.end() ? nullptr : &it->second;
}

const ToolInfo* Config::find_tool(const std::string& id) const {
    auto it = tools.find(id);
    return it == tools.end() ? nullptr : &it->second;
}

std::vector<const LanguageInfo*> Config::ordered_languages() const {
    std::vector<const LanguageInfo*> out;
    for (const auto& [id, lang] : languages) {
        if (lang.always_apply) out.push_back(&lang);
    }
    for (const auto& [id, lang] : languages) {
        if (!lang.always_apply) out.push_back(&lang);
    }
    return out;
}

const StructureInfo* FrameworkInfo::find_structure_file(const std::string& f) const {
    for (const auto& [id, s] : structures) {
        if (s.file == f) return &s;
    }
    return nullptr;
}

const FrameworkInfo* LanguageInfo::find_framework(const std::string& fid) const {
    auto it = frameworks.find(fid);
    return it == frameworks.end() ? nullptr : &it->second;
}

const ProcessInfo* LanguageInfo::find_process(const std::string& pid) const {
    auto it = processes.find(pid);
    return it == processes.end() ? nullptr : &it->second;
}

const DocumentationInfo* LanguageInfo::find_documentation(const std::string& did) const {
    auto it = documentation.find(did);
    return it == documentation.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// Merge and normalization
// ---------------------------------------------------------------------------

void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, node] : overlay) {
        toml::node* existing = base.get(key.str());
        const toml::table* over_tbl = node.as_table();
        if (over_tbl && existing && existing->is_table()) {
            merge_tables(*existing->as_table(), *over_tbl);
            continue;
        }
        node.visit([&](const auto& n) { base.insert_or_assign(key.str(), n); });
    }
}

// files = unique(files ++ customFiles), first-seen order
static void fold_files(toml::table& lang) {
    const toml::node* files = lang.get("files");
    const toml::node* custom = lang.get("customFiles");
    if (!custom && !files) return;
    if ((files && !files->is_array()) || (custom && !custom->is_array())) return;

    std::vector<std::string> merged;
    for (const toml::node* n : {files, custom}) {
        if (!n) continue;
        for (const auto& elem : *n->as_array()) {
            auto* s = elem.as_string();
            if (!s) return;  // left for from_table to report
            if (std::find(merged.begin(), merged.end(), s->get()) == merged.end()) {
                merged.push_back(s->get());
            }
        }
    }

    toml::array arr;
    for (auto& f : merged) arr.push_back(std::move(f));
    lang.insert_or_assign("files", std::move(arr));
    lang.erase("customFiles");
}

// canonical = canonical ∪ custom, custom entries replace on id collision
static void fold_map(toml::table& lang, std::string_view custom_key,
                     std::string_view canonical_key) {
    const toml::node* custom = lang.get(custom_key);
    if (!custom || !custom->is_table()) return;

    if (!lang.contains(canonical_key)) {
        lang.insert_or_assign(canonical_key, toml::table{});
    }
    toml::table* target = lang.get(canonical_key)->as_table();
    if (!target) return;

    for (const auto& [id, entry] : *custom->as_table()) {
        entry.visit([&](const auto& n) { target->insert_or_assign(id.str(), n); });
    }
    lang.erase(custom_key);
}

void normalize_document(toml::table& doc) {
    toml::table* languages = doc["languages"].as_table();
    if (!languages) return;

    for (auto&& [id, node] : *languages) {
        toml::table* lang = node.as_table();
        if (!lang) continue;
        fold_files(*lang);
        fold_map(*lang, "customFrameworks", "frameworks");
        fold_map(*lang, "customProcesses", "processes");
    }
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

Result<toml::table> parse_document(const std::string& text,
                                   const std::string& origin,
                                   DocumentRole role) {
    try {
        return Result<toml::table>::ok(toml::parse(text, origin));
    } catch (const toml::parse_error& e) {
        const bool overlay = role == DocumentRole::Overlay;
        std::string msg = std::string(overlay ? "failed to parse overlay file: "
                                              : "failed to parse config file: ")
            + origin + ": " + std::string(e.description());
        std::string hint = overlay
            ? "fix the TOML syntax in " + origin + " or remove the file;\n"
              "a present overlay is never partially applied"
            : "1. check the TOML syntax near the reported line "
              "(unquoted strings, unmatched brackets, duplicate keys)\n"
              "2. or restore it from version control: git checkout -- " + origin;
        return AiiapError{overlay ? AiiapError::Overlay : AiiapError::Parse,
            std::move(msg), std::move(hint), origin,
            static_cast<int>(e.source().begin.line)};
    }
}

Result<toml::table> read_document(const fs::path& path, DocumentRole role) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return AiiapError{AiiapError::IO, "cannot open " +
            std::string(role == DocumentRole::Overlay ? "overlay" : "config") +
            " file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_document(ss.str(), path.string(), role);
}

Result<toml::table> merge_documents(const ConfigSources& sources) {
    std::error_code ec;
    if (!fs::is_regular_file(sources.base, ec)) {
        fs::path root = sources.base.parent_path().parent_path();
        return AiiapError{AiiapError::Config,
            "config file not found: " + sources.base.string(),
            "this usually means aiiap is running from the wrong directory;\n"
            "cd \"" + root.string() + "\" and run it again"};
    }

    auto base = read_document(sources.base, DocumentRole::Base);
    if (base.is_err()) return std::move(base).error();
    toml::table merged = std::move(base).value();

    if (!sources.overlay.empty() && fs::exists(sources.overlay, ec)) {
        auto overlay = read_document(sources.overlay, DocumentRole::Overlay);
        if (overlay.is_err()) return std::move(overlay).error();
        log::debug("applying overlay %s", sources.overlay.string().c_str());
        merge_tables(merged, overlay.value());
    }

    normalize_document(merged);
    return Result<toml::table>::ok(std::move(merged));
}

Result<Config> load_config(const ConfigSources& sources) {
    auto merged = merge_documents(sources);
    if (merged.is_err()) return std::move(merged).error();

    ScopedTempFile tmp("aiiap-merged", ".toml");
    std::ostringstream ss;
    ss << merged.value();
    AIIAP_TRY(tmp.write(ss.str()));
    log::trace("merged config written to %s", tmp.path().string().c_str());

    auto reread = read_document(tmp.path(), DocumentRole::Base);
    if (reread.is_err()) {
        return AiiapError{AiiapError::Config,
            "merged configuration could not be read back: " + reread.error().message};
    }
    return Config::from_table(reread.value());
}

} // namespace aiiap
