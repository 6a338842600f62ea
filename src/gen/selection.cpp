#include <aiiap/selection.hpp>
#include <aiiap/log.hpp>
#include <fstream>
#include <sstream>

namespace aiiap {

namespace fs = std::filesystem;

bool SelectionState::operator==(const SelectionState& other) const {
    return version == other.version &&
           tools == other.tools &&
           languages == other.languages &&
           documentation == other.documentation &&
           frameworks == other.frameworks &&
           structures == other.structures &&
           processes == other.processes;
}

std::string structure_key(const std::string& language, const std::string& framework) {
    return language + "-" + framework;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

static toml::array to_array(const std::set<std::string>& items) {
    toml::array arr;
    for (const auto& s : items) arr.push_back(s);
    return arr;
}

static toml::table to_table(const std::map<std::string, std::set<std::string>>& m) {
    toml::table tbl;
    for (const auto& [k, v] : m) {
        if (!v.empty()) tbl.insert_or_assign(k, to_array(v));
    }
    return tbl;
}

std::string serialize_selection(const SelectionState& state) {
    toml::table doc;
    doc.insert_or_assign("version", state.version);
    doc.insert_or_assign("selectedTools", to_array(state.tools));
    doc.insert_or_assign("selectedLanguages", to_array(state.languages));
    doc.insert_or_assign("selectedDocumentation", to_array(state.documentation));
    doc.insert_or_assign("selectedFrameworks", to_table(state.frameworks));

    toml::table structures;
    for (const auto& [k, v] : state.structures) structures.insert_or_assign(k, v);
    doc.insert_or_assign("selectedStructures", std::move(structures));

    doc.insert_or_assign("selectedProcesses", to_table(state.processes));

    std::ostringstream ss;
    ss << doc << "\n";
    return ss.str();
}

static std::set<std::string> read_set(const toml::node* n) {
    std::set<std::string> out;
    if (!n || !n->is_array()) return out;
    for (const auto& elem : *n->as_array()) {
        if (auto* s = elem.as_string()) out.insert(s->get());
    }
    return out;
}

static std::map<std::string, std::set<std::string>> read_set_map(const toml::node* n) {
    std::map<std::string, std::set<std::string>> out;
    if (!n || !n->is_table()) return out;
    for (const auto& [k, v] : *n->as_table()) {
        auto items = read_set(&v);
        if (!items.empty()) out.emplace(std::string(k.str()), std::move(items));
    }
    return out;
}

Result<SelectionState> parse_selection(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return AiiapError{AiiapError::State,
            std::string("selection state parse error: ") + std::string(e.description())};
    }

    SelectionState state;
    if (auto v = doc["version"].value<std::string>()) {
        state.version = *v;
        if (state.version != kSelectionSchemaVersion) {
            log::debug("selection state has schema version '%s', reading best-effort",
                state.version.c_str());
        }
    }
    state.tools = read_set(doc.get("selectedTools"));
    state.languages = read_set(doc.get("selectedLanguages"));
    state.documentation = read_set(doc.get("selectedDocumentation"));
    state.frameworks = read_set_map(doc.get("selectedFrameworks"));
    state.processes = read_set_map(doc.get("selectedProcesses"));

    if (auto* st = doc["selectedStructures"].as_table()) {
        for (const auto& [k, v] : *st) {
            if (auto* s = v.as_string()) state.structures.emplace(std::string(k.str()), s->get());
        }
    }

    return Result<SelectionState>::ok(std::move(state));
}

Status save_selection(const SelectionState& state, const fs::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return AiiapError{AiiapError::IO,
            "cannot write selection state: " + path.string()};
    }
    out << serialize_selection(state);
    out.close();
    if (!out) {
        return AiiapError{AiiapError::IO,
            "failed writing selection state: " + path.string()};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Validation against the current config
// ---------------------------------------------------------------------------

template<typename Pred>
static std::set<std::string> keep_if(const std::set<std::string>& in, Pred&& pred,
                                     const char* what) {
    std::set<std::string> out;
    for (const auto& item : in) {
        if (pred(item)) {
            out.insert(item);
        } else {
            log::debug("dropping stale %s selection '%s'", what, item.c_str());
        }
    }
    return out;
}

SelectionState filter_selection(const SelectionState& state, const Config& config) {
    SelectionState out;
    out.version = kSelectionSchemaVersion;

    out.tools = keep_if(state.tools,
        [&](const std::string& id) { return config.find_tool(id) != nullptr; }, "tool");

    out.languages = keep_if(state.languages,
        [&](const std::string& id) { return config.find_language(id) != nullptr; }, "language");

    out.documentation = keep_if(state.documentation, [&](const std::string& id) {
        for (const auto& lang_id : out.languages) {
            if (config.find_language(lang_id)->find_documentation(id)) return true;
        }
        return false;
    }, "documentation");

    for (const auto& [lang_id, ids] : state.frameworks) {
        if (!out.languages.count(lang_id)) continue;
        const LanguageInfo* lang = config.find_language(lang_id);
        auto kept = keep_if(ids,
            [&](const std::string& id) { return lang->find_framework(id) != nullptr; },
            "framework");
        if (!kept.empty()) out.frameworks.emplace(lang_id, std::move(kept));
    }

    // "lang-fw" keys are ambiguous when ids contain '-', so look each pair up
    for (const auto& [key, file] : state.structures) {
        bool kept = false;
        for (const auto& [lang_id, fw_ids] : out.frameworks) {
            const LanguageInfo* lang = config.find_language(lang_id);
            for (const auto& fw_id : fw_ids) {
                if (structure_key(lang_id, fw_id) != key) continue;
                if (lang->find_framework(fw_id)->find_structure_file(file)) {
                    out.structures.emplace(key, file);
                    kept = true;
                }
            }
        }
        if (!kept) log::debug("dropping stale structure selection '%s'", key.c_str());
    }

    for (const auto& [lang_id, ids] : state.processes) {
        if (!out.languages.count(lang_id)) continue;
        const LanguageInfo* lang = config.find_language(lang_id);
        auto kept = keep_if(ids,
            [&](const std::string& id) { return lang->find_process(id) != nullptr; },
            "process");
        if (!kept.empty()) out.processes.emplace(lang_id, std::move(kept));
    }

    return out;
}

std::optional<SelectionState> load_selection(const fs::path& path, const Config& config) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        log::warn("cannot read saved selection %s, starting fresh", path.string().c_str());
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto parsed = parse_selection(ss.str());
    if (parsed.is_err()) {
        log::warn("ignoring saved selection %s (%s), starting fresh",
            path.string().c_str(), parsed.error().message.c_str());
        return std::nullopt;
    }
    return filter_selection(parsed.value(), config);
}

Status delete_selection(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return AiiapError{AiiapError::IO,
            "cannot remove selection state " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

void include_always_apply(SelectionState& state, const Config& config) {
    for (const auto& [id, lang] : config.languages) {
        if (lang.always_apply) state.languages.insert(id);
    }
}

} // namespace aiiap
