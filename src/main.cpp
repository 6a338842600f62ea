#include <aiiap/config.hpp>
#include <aiiap/log.hpp>
#include <aiiap/pipeline.hpp>
#include <aiiap/project.hpp>
#include <aiiap/selection.hpp>
#include <aiiap/tools.hpp>
#include <aiiap/validate.hpp>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

using namespace aiiap;
namespace fs = std::filesystem;

static const char* kUsage =
    "Usage: aiiap [-C DIR] [-v|-q] <command> [options]\n"
    "\n"
    "Commands:\n"
    "  list                          show what the configuration offers\n"
    "  select [options]              save a selection\n"
    "      --tool ID                 (repeatable)\n"
    "      --language ID\n"
    "      --doc ID\n"
    "      --framework LANG:ID\n"
    "      --structure LANG-FW=FILE\n"
    "      --process LANG:ID\n"
    "  generate                      regenerate every selected tool\n"
    "  clean [--tool ID]...          remove generated files and the saved selection\n"
    "  validate                      check the configuration for mistakes\n";

struct Session {
    ProjectLayout layout;
    Config config;
    ContentResolver resolver;
};

static Result<Session> open_session(const fs::path& start_dir) {
    auto layout = ProjectLayout::discover(start_dir);
    if (layout.is_err()) return std::move(layout).error();

    const ProjectLayout& l = layout.value();
    auto config = load_config({l.base_config(), l.overlay_config()});
    if (config.is_err()) return std::move(config).error();

    log::debug("project root: %s", l.root_dir.string().c_str());
    return Result<Session>::ok(Session{l, std::move(config).value(),
                                       ContentResolver(l.content_layers())});
}

static AiiapError bad_arg(const std::string& msg, std::string hint = {}) {
    return AiiapError{AiiapError::InvalidArg, msg, std::move(hint)};
}

// "a:b" -> {"a", "b"}
static Result<std::pair<std::string, std::string>> split_arg(const std::string& arg, char sep,
                                                             const char* flag, const char* form) {
    auto pos = arg.find(sep);
    if (pos == std::string::npos || pos == 0 || pos + 1 == arg.size()) {
        return bad_arg(std::string(flag) + " expects " + form + ", got '" + arg + "'");
    }
    return Result<std::pair<std::string, std::string>>::ok(
        {arg.substr(0, pos), arg.substr(pos + 1)});
}

// ---------------------------------------------------------------------------
// list
// ---------------------------------------------------------------------------

static Status cmd_list(const Session& s) {
    const Config& cfg = s.config;
    std::cout << "Tools:\n";
    for (const auto& t : known_targets(cfg)) {
        const ToolInfo* info = cfg.find_tool(t.id);
        std::cout << "  " << t.id << "  " << t.name << "  -> " << t.output
                  << " (" << shape_name(t.shape) << ")";
        if (!info) std::cout << " [not configured]";
        else if (info->recommended) std::cout << " [recommended]";
        std::cout << "\n";
    }

    std::cout << "\nLanguages:\n";
    for (const LanguageInfo* lang : cfg.ordered_languages()) {
        std::cout << "  " << lang->id << "  " << lang->name;
        if (lang->always_apply) std::cout << " [always applied]";
        std::cout << "\n";
        for (const auto& [id, doc] : lang->documentation) {
            std::cout << "    doc        " << id << "  " << doc.name << "\n";
        }
        for (const auto& [id, fw] : lang->frameworks) {
            std::cout << "    framework  " << id << "  " << fw.name;
            if (!fw.category.empty()) std::cout << " (" << fw.category << ")";
            std::cout << "\n";
            for (const auto& [sid, st] : fw.structures) {
                std::cout << "      structure  " << st.file << "  " << st.name << "\n";
            }
        }
        for (const auto& [id, proc] : lang->processes) {
            std::cout << "    process    " << id << "  " << proc.name
                      << " (" << phase_name(proc.phase()) << ")\n";
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// select
// ---------------------------------------------------------------------------

static Status select_language_item(SelectionState& state, const Config& cfg,
                                   const std::string& arg, const char* flag, bool framework) {
    auto parts = split_arg(arg, ':', flag, "LANG:ID");
    if (parts.is_err()) return std::move(parts).error();
    const auto& [lang_id, id] = parts.value();

    const LanguageInfo* lang = cfg.find_language(lang_id);
    if (!lang || !state.languages.count(lang_id)) {
        return bad_arg("language '" + lang_id + "' is not selected",
                       "add --language " + lang_id);
    }
    if (framework) {
        if (!lang->find_framework(id)) return bad_arg("unknown framework '" + arg + "'");
        state.frameworks[lang_id].insert(id);
    } else {
        if (!lang->find_process(id)) return bad_arg("unknown process '" + arg + "'");
        state.processes[lang_id].insert(id);
    }
    return ok_status();
}

static Status select_structure(SelectionState& state, const Config& cfg, const std::string& arg) {
    auto parts = split_arg(arg, '=', "--structure", "LANG-FW=FILE");
    if (parts.is_err()) return std::move(parts).error();
    const auto& [key, file] = parts.value();

    for (const auto& [lang_id, fw_ids] : state.frameworks) {
        for (const auto& fw_id : fw_ids) {
            if (structure_key(lang_id, fw_id) != key) continue;
            const FrameworkInfo* fw = cfg.find_language(lang_id)->find_framework(fw_id);
            if (!fw->find_structure_file(file)) {
                return bad_arg("framework '" + fw_id + "' has no structure '" + file + "'");
            }
            state.structures[key] = file;
            return ok_status();
        }
    }
    return bad_arg("'" + key + "' does not name a selected framework",
                   "select it first with --framework LANG:FW");
}

static Status cmd_select(const Session& s, const std::vector<std::string>& args) {
    const Config& cfg = s.config;
    SelectionState state;

    // Two passes: languages first so framework/process flags can check them
    std::vector<std::pair<std::string, std::string>> flags;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (i + 1 >= args.size()) return bad_arg(flag + " needs a value");
        flags.emplace_back(flag, args[++i]);
    }

    for (const auto& [flag, value] : flags) {
        if (flag == "--tool") {
            if (!cfg.find_tool(value)) return bad_arg("unknown tool '" + value + "'");
            state.tools.insert(value);
        } else if (flag == "--language") {
            if (!cfg.find_language(value)) return bad_arg("unknown language '" + value + "'");
            state.languages.insert(value);
        } else if (flag != "--doc" && flag != "--framework" &&
                   flag != "--structure" && flag != "--process") {
            return bad_arg("unknown option '" + flag + "'", "see aiiap --help");
        }
    }
    include_always_apply(state, cfg);

    for (const auto& [flag, value] : flags) {
        if (flag == "--framework") AIIAP_TRY(select_language_item(state, cfg, value, "--framework", true));
        else if (flag == "--process") AIIAP_TRY(select_language_item(state, cfg, value, "--process", false));
    }
    for (const auto& [flag, value] : flags) {
        if (flag == "--structure") {
            AIIAP_TRY(select_structure(state, cfg, value));
        } else if (flag == "--doc") {
            bool known = false;
            for (const auto& lang_id : state.languages) {
                if (cfg.find_language(lang_id)->find_documentation(value)) known = true;
            }
            if (!known) return bad_arg("unknown documentation '" + value + "'");
            state.documentation.insert(value);
        }
    }

    if (state.tools.empty()) {
        log::warn("no tool selected; generate will produce nothing");
    }
    AIIAP_TRY(save_selection(state, s.layout.state_file()));
    std::cout << "Saved selection: " << state.tools.size() << " tool(s), "
              << state.languages.size() << " language(s)\n";
    return ok_status();
}

// ---------------------------------------------------------------------------
// generate / clean / validate
// ---------------------------------------------------------------------------

static Status cmd_generate(const Session& s) {
    auto prior = load_selection(s.layout.state_file(), s.config);
    if (!prior) {
        return AiiapError{AiiapError::NotFound, "no saved selection",
            "run aiiap select --tool ID --language ID first"};
    }
    SelectionState state = std::move(*prior);
    include_always_apply(state, s.config);

    EmissionPipeline pipeline(s.config, s.resolver, s.layout.root_dir);
    auto reports = pipeline.generate_all(state);
    if (reports.is_err()) return std::move(reports).error();

    for (const auto& r : reports.value()) {
        std::cout << r.tool << ": " << r.artifacts.size() << " file(s) written";
        if (!r.skipped.empty()) std::cout << ", " << r.skipped.size() << " skipped";
        std::cout << "\n";
        for (const auto& a : r.artifacts) {
            std::cout << "  " << a.path.lexically_relative(s.layout.root_dir).generic_string();
            if (a.replaced_unmanaged) std::cout << "  (replaced a file aiiap did not write)";
            std::cout << "\n";
        }
    }
    if (!reports.value().empty()) {
        for (const auto& item : reports.value().front().on_demand) {
            std::cout << "on-demand process " << item.language << "/" << item.id
                      << " available for manual reference\n";
        }
    }

    return save_selection(state, s.layout.state_file());
}

static Status cmd_clean(const Session& s, const std::vector<std::string>& args) {
    std::vector<ToolTarget> targets;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] != "--tool" || i + 1 >= args.size()) {
            return bad_arg("clean accepts only --tool ID");
        }
        auto t = resolve_target(args[++i], s.config);
        if (t.is_err()) return std::move(t).error();
        targets.push_back(std::move(t).value());
    }
    if (targets.empty()) targets = known_targets(s.config);

    size_t removed = 0;
    for (const auto& t : targets) {
        auto report = cleanup(t, s.layout.root_dir);
        if (report.is_err()) return std::move(report).error();
        removed += report.value().removed.size();
        for (const auto& p : report.value().kept) {
            log::debug("%s: left %s in place", t.id.c_str(), p.string().c_str());
        }
    }
    AIIAP_TRY(delete_selection(s.layout.state_file()));
    std::cout << "Removed " << removed << " generated file(s)\n";
    return ok_status();
}

static int cmd_validate(const Session& s) {
    auto issues = validate_config(s.config, s.resolver);
    size_t errors = 0;
    for (const auto& i : issues) {
        if (i.severity == Severity::Error) ++errors;
        std::cout << severity_name(i.severity) << ": " << i.message << "\n";
    }
    if (issues.empty()) {
        std::cout << "configuration is valid\n";
    } else {
        std::cout << errors << " error(s), " << issues.size() - errors << " warning(s)\n";
    }
    return has_errors(issues) ? 1 : 0;
}

// ---------------------------------------------------------------------------

static int fail(const AiiapError& e) {
    std::fprintf(stderr, "%s\n", e.format().c_str());
    return 1;
}

int main(int argc, char* argv[]) {
    fs::path start_dir = ".";
    std::string command;
    std::vector<std::string> rest;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-C") {
            if (i + 1 >= argc) return fail(bad_arg("-C needs a directory"));
            start_dir = argv[++i];
        } else if (arg == "-v") {
            log::set_level(log::Debug);
        } else if (arg == "-q") {
            log::set_level(log::Warn);
        } else if (arg == "-h" || arg == "--help") {
            std::cout << kUsage;
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else {
            rest.push_back(arg);
        }
    }

    if (command.empty()) {
        std::cerr << kUsage;
        return 1;
    }
    if (command != "list" && command != "select" && command != "generate" &&
        command != "clean" && command != "validate") {
        return fail(bad_arg("unknown command '" + command + "'", "see aiiap --help"));
    }

    std::error_code ec;
    fs::path abs_start = fs::absolute(start_dir, ec);
    if (ec) return fail(AiiapError{AiiapError::IO, "bad directory: " + start_dir.string()});

    auto session = open_session(abs_start);
    if (session.is_err()) return fail(session.error());
    const Session& s = session.value();

    if (command == "validate") return cmd_validate(s);

    Status st = ok_status();
    if (command == "list") st = cmd_list(s);
    else if (command == "select") st = cmd_select(s, rest);
    else if (command == "generate") st = cmd_generate(s);
    else st = cmd_clean(s, rest);

    if (st.is_err()) return fail(st.error());
    return 0;
}
