#include <aiiap/pipeline.hpp>
#include <aiiap/glob.hpp>
#include <aiiap/log.hpp>
#include <algorithm>
#include <map>

namespace aiiap {

namespace fs = std::filesystem;

const char* stage_name(Stage s) {
    switch (s) {
        case Stage::Init:          return "init";
        case Stage::BaseRules:     return "base-rules";
        case Stage::Documentation: return "documentation";
        case Stage::Frameworks:    return "frameworks";
        case Stage::Structures:    return "structures";
        case Stage::Processes:     return "processes";
        case Stage::Done:          return "done";
    }
    return "unknown";
}

Stage next_stage(Stage s) {
    switch (s) {
        case Stage::Init:          return Stage::BaseRules;
        case Stage::BaseRules:     return Stage::Documentation;
        case Stage::Documentation: return Stage::Frameworks;
        case Stage::Frameworks:    return Stage::Structures;
        case Stage::Structures:    return Stage::Processes;
        case Stage::Processes:     return Stage::Done;
        case Stage::Done:          return Stage::Done;
    }
    return Stage::Done;
}

ContentRequest EmitItem::request() const {
    ContentRequest req;
    req.category = category;
    req.language = language;
    req.name = file;
    req.phase = phase;
    return req;
}

// ---------------------------------------------------------------------------
// Planning
// ---------------------------------------------------------------------------

static const std::string& or_id(const std::string& file, const std::string& id) {
    return file.empty() ? id : file;
}

static EmitItem make_item(Stage stage, Category cat, const std::string& lang,
                          const std::string& id, const std::string& file) {
    EmitItem item;
    item.stage = stage;
    item.category = cat;
    item.language = lang;
    item.id = id;
    item.file = or_id(file, id);
    return item;
}

template<typename Map>
static const std::set<std::string>* selected_for(const Map& m, const std::string& lang) {
    auto it = m.find(lang);
    return it == m.end() ? nullptr : &it->second;
}

static void plan_stage(Stage stage, const LanguageInfo& lang,
                       const SelectionState& sel, std::vector<EmitItem>& out) {
    switch (stage) {
    case Stage::BaseRules:
        for (const auto& file : lang.files) {
            out.push_back(make_item(stage, Category::Rule, lang.id, file, file));
        }
        break;

    case Stage::Documentation:
        for (const auto& [id, doc] : lang.documentation) {
            if (!sel.documentation.count(id)) continue;
            out.push_back(make_item(stage, Category::Rule, lang.id, id, doc.file));
        }
        break;

    case Stage::Frameworks: {
        auto* ids = selected_for(sel.frameworks, lang.id);
        if (!ids) break;
        for (const auto& [id, fw] : lang.frameworks) {
            if (!ids->count(id)) continue;
            EmitItem item = make_item(stage, Category::Framework, lang.id, id, fw.file);
            item.framework = id;
            out.push_back(std::move(item));
        }
        break;
    }

    case Stage::Structures: {
        auto* ids = selected_for(sel.frameworks, lang.id);
        if (!ids) break;
        for (const auto& [id, fw] : lang.frameworks) {
            if (!ids->count(id)) continue;
            auto it = sel.structures.find(structure_key(lang.id, id));
            if (it == sel.structures.end()) continue;
            const StructureInfo* st = fw.find_structure_file(it->second);
            if (!st) continue;
            EmitItem item = make_item(stage, Category::Structure, lang.id, st->id, st->file);
            item.framework = id;
            out.push_back(std::move(item));
        }
        break;
    }

    case Stage::Processes: {
        auto* ids = selected_for(sel.processes, lang.id);
        if (!ids) break;
        for (const auto& [id, proc] : lang.processes) {
            if (!ids->count(id)) continue;
            EmitItem item = make_item(stage, Category::Process, lang.id, id, proc.file);
            item.phase = proc.phase();
            out.push_back(std::move(item));
        }
        break;
    }

    case Stage::Init:
    case Stage::Done:
        break;
    }
}

std::vector<EmitItem> plan_emission(const Config& config, const SelectionState& selection) {
    std::vector<EmitItem> out;
    for (const LanguageInfo* lang : config.ordered_languages()) {
        if (!selection.languages.count(lang->id)) continue;
        for (Stage s = next_stage(Stage::Init); s != Stage::Done; s = next_stage(s)) {
            plan_stage(s, *lang, selection, out);
        }
    }
    return out;
}

std::string describe_item(const EmitItem& item, const Config& config) {
    const LanguageInfo* lang = config.find_language(item.language);
    if (!lang) return item.language + " - " + item.id;

    if (item.category == Category::Framework || item.category == Category::Structure) {
        const FrameworkInfo* fw = lang->find_framework(item.framework);
        std::string fw_name = fw && !fw->name.empty() ? fw->name : item.framework;
        return or_id(lang->name, lang->id) + " - " + fw_name;
    }
    const std::string& lang_text = lang->description.empty()
        ? or_id(lang->name, lang->id) : lang->description;
    // Documentation is named by its content file, everything else by its key
    const std::string& name = item.stage == Stage::Documentation ? item.file : item.id;
    return lang_text + " - " + name;
}

// ---------------------------------------------------------------------------
// Output strategies
// ---------------------------------------------------------------------------

static std::string trim_trailing(const std::string& text) {
    auto end = text.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : text.substr(0, end + 1);
}

static std::string slug(std::string name) {
    std::replace(name.begin(), name.end(), '/', '-');
    return name;
}

namespace {

class DirectoryOutput : public OutputStrategy {
public:
    DirectoryOutput(const ToolTarget& target, const Config& config, const fs::path& root)
        : target_(target), config_(config), dir_(root / target.output) {}

    Status add(const EmitItem& item, const std::string& text) override {
        fs::path path = member_path(item);
        auto seen = index_.find(path);
        if (seen != index_.end()) {
            log::warn("%s: %s/%s overwrites %s written earlier in this run",
                target_.id.c_str(), item.language.c_str(), item.id.c_str(),
                path.string().c_str());
        }

        auto written = write_member(path, target_.id, attributes(item),
                                    trim_trailing(text) + "\n");
        if (written.is_err()) return std::move(written).error();

        if (seen != index_.end()) {
            artifacts_[seen->second] = std::move(written).value();
        } else {
            index_.emplace(path, artifacts_.size());
            artifacts_.push_back(std::move(written).value());
        }
        return ok_status();
    }

    Result<std::vector<ManagedArtifact>> finish() override {
        return Result<std::vector<ManagedArtifact>>::ok(std::move(artifacts_));
    }

private:
    fs::path member_path(const EmitItem& item) const {
        if (!target_.member_filename.empty()) {
            return dir_ / (item.language + "-" + slug(item.file)) / target_.member_filename;
        }
        return dir_ / item.language / (item.file + target_.extension);
    }

    Attributes attributes(const EmitItem& item) const {
        Attributes attrs;
        const LanguageInfo* lang = config_.find_language(item.language);
        if (target_.supports_globs) {
            bool always = lang && lang->always_apply;
            attrs.emplace_back("alwaysApply", always ? "true" : "false");
            attrs.emplace_back("description", describe_item(item, config_));
            attrs.emplace_back("globs",
                lang ? join_glob_list(split_glob_list(lang->globs)) : std::string());
        } else if (!target_.member_filename.empty()) {
            attrs.emplace_back("name", item.language + "-" + slug(item.file));
            attrs.emplace_back("description", describe_item(item, config_));
        } else {
            attrs.emplace_back("description", describe_item(item, config_));
        }
        return attrs;
    }

    const ToolTarget& target_;
    const Config& config_;
    fs::path dir_;
    std::map<fs::path, size_t> index_;
    std::vector<ManagedArtifact> artifacts_;
};

class DocumentOutput : public OutputStrategy {
public:
    DocumentOutput(const ToolTarget& target, const fs::path& root)
        : target_(target), path_(root / target.output),
          body_("# AI Coding Instructions\n\n") {}

    Status add(const EmitItem&, const std::string& text) override {
        body_ += trim_trailing(text);
        body_ += "\n\n---\n\n";
        return ok_status();
    }

    Result<std::vector<ManagedArtifact>> finish() override {
        auto written = write_document(path_, target_.id, body_);
        if (written.is_err()) return std::move(written).error();
        std::vector<ManagedArtifact> out;
        out.push_back(std::move(written).value());
        return Result<std::vector<ManagedArtifact>>::ok(std::move(out));
    }

private:
    const ToolTarget& target_;
    fs::path path_;
    std::string body_;
};

} // namespace

std::unique_ptr<OutputStrategy> make_output_strategy(const ToolTarget& target,
                                                     const Config& config,
                                                     const fs::path& project_root) {
    if (target.shape == OutputShape::DirectoryMember) {
        return std::make_unique<DirectoryOutput>(target, config, project_root);
    }
    return std::make_unique<DocumentOutput>(target, project_root);
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

EmissionPipeline::EmissionPipeline(const Config& config, const ContentResolver& resolver,
                                   fs::path project_root)
    : config_(config), resolver_(resolver), root_(std::move(project_root)) {}

Result<EmissionReport> EmissionPipeline::generate(const ToolTarget& target,
                                                  const SelectionState& selection) const {
    auto cleaned = cleanup(target, root_);
    if (cleaned.is_err()) return std::move(cleaned).error();
    log::debug("%s: removed %zu previously generated file(s)",
        target.id.c_str(), cleaned.value().removed.size());

    EmissionReport report;
    report.tool = target.id;

    auto strategy = make_output_strategy(target, config_, root_);
    for (const auto& item : plan_emission(config_, selection)) {
        if (item.phase == ProcessPhase::OnDemand) {
            report.on_demand.push_back(item);
            continue;
        }

        auto content = resolver_.resolve(item.request());
        if (content.is_err()) {
            log::warn("%s: %s, skipping", target.id.c_str(), content.error().message.c_str());
            report.skipped.push_back(SkippedItem{item, content.error().message});
            continue;
        }
        log::trace("%s: [%s] %s from %s", target.id.c_str(), stage_name(item.stage),
            item.file.c_str(), content.value().source.string().c_str());

        AIIAP_TRY(strategy->add(item, content.value().text));
    }

    auto artifacts = strategy->finish();
    if (artifacts.is_err()) return std::move(artifacts).error();
    report.artifacts = std::move(artifacts).value();
    return Result<EmissionReport>::ok(std::move(report));
}

Result<std::vector<EmissionReport>> EmissionPipeline::generate_all(
        const SelectionState& selection) const {
    std::vector<EmissionReport> reports;
    for (const auto& id : selection.tools) {
        auto target = resolve_target(id, config_);
        if (target.is_err()) {
            log::warn("unknown tool '%s' (%s), skipping",
                id.c_str(), target.error().message.c_str());
            continue;
        }
        auto report = generate(target.value(), selection);
        if (report.is_err()) return std::move(report).error();
        reports.push_back(std::move(report).value());
    }
    return Result<std::vector<EmissionReport>>::ok(std::move(reports));
}

} // namespace aiiap
