#include <aiiap/project.hpp>

namespace aiiap {

namespace fs = std::filesystem;

bool has_base_config(const fs::path& dir) {
    std::error_code ec;
    return fs::is_regular_file(dir / kBaseDirName / kConfigFileName, ec);
}

ProjectLayout ProjectLayout::at(const fs::path& root) {
    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    if (ec) abs = root;
    return ProjectLayout{abs.lexically_normal()};
}

Result<ProjectLayout> ProjectLayout::discover(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return AiiapError{AiiapError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        if (has_base_config(dir)) {
            return Result<ProjectLayout>::ok(ProjectLayout::at(dir));
        }
        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return AiiapError{AiiapError::Config,
                std::string("no ") + kBaseDirName + "/" + kConfigFileName +
                    " found in " + start_dir.string() + " or any parent directory",
                "run aiiap from your project root (the directory containing " +
                    std::string(kBaseDirName) + "/), or pass -C <project-root>"};
        }
        dir = parent;
    }
}

fs::path ProjectLayout::base_dir() const { return root_dir / kBaseDirName; }
fs::path ProjectLayout::custom_dir() const { return root_dir / kCustomDirName; }
fs::path ProjectLayout::base_config() const { return base_dir() / kConfigFileName; }
fs::path ProjectLayout::overlay_config() const { return custom_dir() / kConfigFileName; }
fs::path ProjectLayout::state_file() const { return root_dir / kStateFileName; }

std::vector<ContentRoots> ProjectLayout::content_layers() const {
    return {
        ContentRoots{custom_dir() / "rules", custom_dir() / "processes"},
        ContentRoots{base_dir() / "rules", base_dir() / "processes"},
    };
}

} // namespace aiiap
