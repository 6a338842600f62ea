#pragma once

#include <aiiap/result.hpp>
#include <aiiap/config.hpp>
#include <aiiap/selection.hpp>
#include <aiiap/resolver.hpp>
#include <aiiap/tools.hpp>
#include <aiiap/managed.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>

namespace aiiap {

// Per-language emission order. Init and Done carry no items.
enum class Stage { Init, BaseRules, Documentation, Frameworks, Structures, Processes, Done };

const char* stage_name(Stage s);
Stage next_stage(Stage s);

// One piece of content to emit, in emission order
struct EmitItem {
    Stage stage = Stage::Init;
    Category category = Category::Rule;
    std::string language;
    std::string id;          // config key (file name for base rules)
    std::string file;        // content name handed to the resolver
    std::string framework;   // Frameworks / Structures: owning framework id
    std::optional<ProcessPhase> phase;

    ContentRequest request() const;
};

// Deterministic walk over the selection: languages alwaysApply first then by
// key, stages in order, items in config order. Unselected languages are skipped.
std::vector<EmitItem> plan_emission(const Config& config, const SelectionState& selection);

// Frontmatter description, "<language> - <item>"
std::string describe_item(const EmitItem& item, const Config& config);

struct SkippedItem {
    EmitItem item;
    std::string reason;
};

struct EmissionReport {
    std::string tool;
    std::vector<ManagedArtifact> artifacts;
    std::vector<SkippedItem> skipped;
    std::vector<EmitItem> on_demand;   // processes left for manual reference
};

// How a tool's items become files. One implementation per output shape.
class OutputStrategy {
public:
    virtual ~OutputStrategy() {}

    virtual Status add(const EmitItem& item, const std::string& text) = 0;

    // Flush anything buffered; returns every artifact written in this pass
    virtual Result<std::vector<ManagedArtifact>> finish() = 0;
};

std::unique_ptr<OutputStrategy> make_output_strategy(const ToolTarget& target,
                                                     const Config& config,
                                                     const std::filesystem::path& project_root);

class EmissionPipeline {
public:
    EmissionPipeline(const Config& config, const ContentResolver& resolver,
                     std::filesystem::path project_root);

    // Cleanup(target), then write every planned item through its strategy
    Result<EmissionReport> generate(const ToolTarget& target,
                                    const SelectionState& selection) const;

    // generate() for each selected tool; unknown tools are warned and skipped
    Result<std::vector<EmissionReport>> generate_all(const SelectionState& selection) const;

private:
    const Config& config_;
    const ContentResolver& resolver_;
    std::filesystem::path root_;
};

} // namespace aiiap
