#include <aiiap/resolver.hpp>
#include <fstream>
#include <sstream>

namespace aiiap {

namespace fs = std::filesystem;

static constexpr const char* kContentSuffix = ".md";

const char* category_name(Category c) {
    switch (c) {
        case Category::Rule:      return "rule";
        case Category::Framework: return "framework";
        case Category::Structure: return "structure";
        case Category::Process:   return "process";
    }
    return "unknown";
}

const char* phase_name(ProcessPhase p) {
    switch (p) {
        case ProcessPhase::Permanent: return "permanent";
        case ProcessPhase::OnDemand:  return "ondemand";
    }
    return "unknown";
}

ContentResolver::ContentResolver(std::vector<ContentRoots> layers)
    : layers_(std::move(layers)) {}

std::vector<fs::path> ContentResolver::candidates(const ContentRequest& req) const {
    const std::string file = req.name + kContentSuffix;
    std::vector<fs::path> out;

    for (const auto& layer : layers_) {
        switch (req.category) {
            case Category::Rule:
                out.push_back(layer.rules / req.language / file);
                break;
            case Category::Framework:
                out.push_back(layer.rules / req.language / "frameworks" / file);
                break;
            case Category::Structure:
                out.push_back(layer.rules / req.language / "frameworks" / "structures" / file);
                break;
            case Category::Process:
                out.push_back(layer.processes / req.language / file);
                if (req.phase) {
                    out.push_back(layer.processes / req.language / phase_name(*req.phase) / file);
                }
                break;
        }
    }
    return out;
}

Result<ResolvedContent> ContentResolver::resolve(const ContentRequest& req) const {
    auto paths = candidates(req);

    for (const auto& p : paths) {
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) continue;

        std::ifstream in(p, std::ios::binary);
        if (!in.is_open()) {
            return AiiapError{AiiapError::IO,
                "cannot read content file: " + p.string()};
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return Result<ResolvedContent>::ok(ResolvedContent{ss.str(), p});
    }

    std::string tried;
    for (const auto& p : paths) {
        if (!tried.empty()) tried += ", ";
        tried += p.string();
    }
    return AiiapError{AiiapError::NotFound,
        std::string(category_name(req.category)) + " '" + req.language + "/" +
            req.name + "' not found (tried: " + tried + ")"};
}

} // namespace aiiap
