#pragma once

#include <aiiap/result.hpp>
#include <aiiap/config.hpp>
#include <string>
#include <set>
#include <map>
#include <optional>
#include <filesystem>

namespace aiiap {

inline constexpr const char* kSelectionSchemaVersion = "1";

// What the user chose. Passed explicitly through the pipeline; never global.
struct SelectionState {
    std::string version = kSelectionSchemaVersion;
    std::set<std::string> tools;
    std::set<std::string> languages;
    std::set<std::string> documentation;
    std::map<std::string, std::set<std::string>> frameworks;   // language -> ids
    std::map<std::string, std::string> structures;             // "lang-fw" -> file
    std::map<std::string, std::set<std::string>> processes;    // language -> ids

    bool empty() const { return tools.empty() && languages.empty(); }

    bool operator==(const SelectionState& other) const;
    bool operator!=(const SelectionState& other) const { return !(*this == other); }
};

std::string structure_key(const std::string& language, const std::string& framework);

// TOML record. Deterministic output for a given state.
std::string serialize_selection(const SelectionState& state);

// Best-effort parse: unknown fields and fields of the wrong type are ignored.
// Only a document that is not valid TOML is an error.
Result<SelectionState> parse_selection(const std::string& toml_str);

Status save_selection(const SelectionState& state, const std::filesystem::path& path);

// Drop every key the config no longer knows. Never fails.
SelectionState filter_selection(const SelectionState& state, const Config& config);

// Prior state, filtered against config. nullopt when the record is missing, or
// unreadable (warned, treated as a first run).
std::optional<SelectionState> load_selection(const std::filesystem::path& path,
                                             const Config& config);

// Remove the record if present
Status delete_selection(const std::filesystem::path& path);

// Add every alwaysApply language to the selection
void include_always_apply(SelectionState& state, const Config& config);

} // namespace aiiap
