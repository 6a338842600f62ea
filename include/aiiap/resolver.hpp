#pragma once

#include <aiiap/result.hpp>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace aiiap {

// Resolution namespaces. Each has its own subpath convention and never falls
// back onto another's.
enum class Category { Rule, Framework, Structure, Process };

enum class ProcessPhase { Permanent, OnDemand };

const char* category_name(Category c);
const char* phase_name(ProcessPhase p);

struct ContentRequest {
    Category category = Category::Rule;
    std::string language;
    std::string name;                      // content name, without ".md"
    std::optional<ProcessPhase> phase;     // Process only: legacy <lang>/<phase>/<name>
};

// One layer of the content library
struct ContentRoots {
    std::filesystem::path rules;       // rule, framework, structure
    std::filesystem::path processes;   // process
};

struct ResolvedContent {
    std::string text;
    std::filesystem::path source;
};

class ContentResolver {
public:
    // Layers in precedence order: overlay first, base last
    explicit ContentResolver(std::vector<ContentRoots> layers);

    // Every physical path tried for a request, in the order tried
    std::vector<std::filesystem::path> candidates(const ContentRequest& req) const;

    // Text of the first candidate that exists. NotFound lists every candidate.
    Result<ResolvedContent> resolve(const ContentRequest& req) const;

    const std::vector<ContentRoots>& layers() const { return layers_; }

private:
    std::vector<ContentRoots> layers_;
};

} // namespace aiiap
