#pragma once

#include <aiiap/result.hpp>
#include <aiiap/resolver.hpp>
#include <filesystem>
#include <vector>

namespace aiiap {

inline constexpr const char* kBaseDirName = ".ai-iap";
inline constexpr const char* kCustomDirName = ".ai-iap-custom";
inline constexpr const char* kConfigFileName = "config.toml";
inline constexpr const char* kStateFileName = ".ai-iap-state.toml";

// On-disk layout of a project using aiiap:
//   <root>/.ai-iap/config.toml            base configuration
//   <root>/.ai-iap/{rules,processes}/     base content library
//   <root>/.ai-iap-custom/config.toml     overlay (optional)
//   <root>/.ai-iap-custom/{rules,processes}/
//   <root>/.ai-iap-state.toml             saved selection
struct ProjectLayout {
    std::filesystem::path root_dir;

    static ProjectLayout at(const std::filesystem::path& root);

    // Walk up from start_dir to the nearest directory holding .ai-iap/config.toml
    static Result<ProjectLayout> discover(const std::filesystem::path& start_dir);

    std::filesystem::path base_dir() const;
    std::filesystem::path custom_dir() const;
    std::filesystem::path base_config() const;
    std::filesystem::path overlay_config() const;
    std::filesystem::path state_file() const;

    // Content layers for ContentResolver, overlay first
    std::vector<ContentRoots> content_layers() const;
};

bool has_base_config(const std::filesystem::path& dir);

} // namespace aiiap
