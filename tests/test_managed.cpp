#include <catch2/catch.hpp>
#include <aiiap/managed.hpp>
#include "test_helpers.hpp"

using namespace aiiap;

static ToolTarget dir_target(const std::string& id = "cursor") {
    ToolTarget t;
    t.id = id;
    t.shape = OutputShape::DirectoryMember;
    t.output = ".cursor/rules";
    t.extension = ".mdc";
    return t;
}

static ToolTarget doc_target(const std::string& id, const std::string& output) {
    ToolTarget t;
    t.id = id;
    t.shape = OutputShape::ConcatenatedSection;
    t.output = output;
    return t;
}

// ===== Markers =====

TEST_CASE("member header carries marker then metadata", "[managed]") {
    auto h = member_header("cursor", {{"alwaysApply", "false"}, {"globs", "*.ts"}});
    REQUIRE(h ==
        "---\n"
        "aiiap-managed: true\n"
        "aiiap-version: 1\n"
        "aiiap-tool: cursor\n"
        "alwaysApply: false\n"
        "globs: *.ts\n"
        "---\n");
}

TEST_CASE("member marker recognition is per tool", "[managed]") {
    std::string text = member_header("cursor", {}) + "\nbody\n";
    REQUIRE(is_managed_member(text, "cursor"));
    REQUIRE_FALSE(is_managed_member(text, "claude-code"));
    REQUIRE_FALSE(is_managed_member("---\ndescription: mine\n---\nbody", "cursor"));
    REQUIRE_FALSE(is_managed_member("no frontmatter", "cursor"));
}

TEST_CASE("marker keys after the closing fence do not count", "[managed]") {
    std::string text = "---\ntitle: x\n---\naiiap-managed: true\naiiap-tool: cursor\n";
    REQUIRE_FALSE(is_managed_member(text, "cursor"));
}

TEST_CASE("document marker recognition ignores schema version", "[managed]") {
    REQUIRE(document_marker("aider") == "<!-- aiiap:managed tool=aider version=1 -->");
    REQUIRE(is_managed_document(document_marker("aider") + "\n# body", "aider"));
    REQUIRE(is_managed_document("<!-- aiiap:managed tool=aider version=7 -->\n", "aider"));
    REQUIRE_FALSE(is_managed_document(document_marker("aider"), "aider-x"));
    REQUIRE_FALSE(is_managed_document("# my own notes\n" + document_marker("aider"), "aider"));
}

// ===== Writing =====

TEST_CASE("write_member creates parents and stamps the file", "[managed]") {
    TempDir tmp;
    auto r = write_member(tmp.path / "a/b/c.mdc", "cursor", {{"description", "d"}}, "body\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().shape == OutputShape::DirectoryMember);
    std::string text = tmp.read_file("a/b/c.mdc");
    REQUIRE(is_managed_member(text, "cursor"));
    REQUIRE(text.substr(text.size() - 6) == "\nbody\n");
}

TEST_CASE("replacing an unmanaged file warns", "[managed]") {
    TempDir tmp;
    tmp.write_file("CLAUDE.md", "hand written\n");
    LogCapture cap;
    auto first = write_document(tmp.path / "CLAUDE.md", "claude-cli", "x");
    REQUIRE(first.is_ok());
    REQUIRE(first.value().replaced_unmanaged);
    REQUIRE(cap.text().find("not generated by aiiap") != std::string::npos);

    LogCapture again;
    auto second = write_document(tmp.path / "CLAUDE.md", "claude-cli", "y");
    REQUIRE(second.is_ok());
    REQUIRE_FALSE(second.value().replaced_unmanaged);
    REQUIRE(again.text().empty());
}

// ===== Cleanup =====

TEST_CASE("cleanup removes only files marked for the tool", "[managed]") {
    TempDir tmp;
    auto t = dir_target();
    fs::path root = tmp.path / ".cursor/rules";
    REQUIRE(write_member(root / "demo/style.mdc", "cursor", {}, "x\n").is_ok());
    REQUIRE(write_member(root / "demo/web.mdc", "cursor", {}, "y\n").is_ok());
    tmp.write_file(".cursor/rules/demo/mine.mdc", "---\ndescription: mine\n---\nkeep me\n");
    tmp.write_file(".cursor/rules/demo/other.mdc", member_header("windsurf", {}) + "\nz\n");

    auto r = cleanup(t, tmp.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed.size() == 2);
    REQUIRE(r.value().kept.size() == 2);
    REQUIRE_FALSE(tmp.exists(".cursor/rules/demo/style.mdc"));
    REQUIRE_FALSE(tmp.exists(".cursor/rules/demo/web.mdc"));
    REQUIRE(tmp.read_file(".cursor/rules/demo/mine.mdc") ==
            "---\ndescription: mine\n---\nkeep me\n");
    REQUIRE(tmp.exists(".cursor/rules/demo/other.mdc"));
}

TEST_CASE("cleanup ignores files with other extensions", "[managed]") {
    TempDir tmp;
    tmp.write_file(".cursor/rules/demo/notes.md", member_header("cursor", {}));
    auto r = cleanup(dir_target(), tmp.path);
    REQUIRE(r.is_ok());
    REQUIRE(tmp.exists(".cursor/rules/demo/notes.md"));
}

TEST_CASE("cleanup prunes emptied directories and the output root", "[managed]") {
    TempDir tmp;
    fs::path root = tmp.path / ".cursor/rules";
    REQUIRE(write_member(root / "demo/style.mdc", "cursor", {}, "x\n").is_ok());
    REQUIRE(write_member(root / "general/persona.mdc", "cursor", {}, "y\n").is_ok());

    auto r = cleanup(dir_target(), tmp.path);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(fs::exists(root));
    REQUIRE(fs::exists(tmp.path / ".cursor"));
    REQUIRE(r.value().removed_dirs.size() == 3);
}

TEST_CASE("cleanup leaves empty directories it did not empty", "[managed]") {
    TempDir tmp;
    fs::path root = tmp.path / ".cursor/rules";
    fs::create_directories(root / "team-drafts");
    fs::create_directories(root / "demo/later");
    REQUIRE(write_member(root / "demo/style.mdc", "cursor", {}, "x\n").is_ok());

    auto r = cleanup(dir_target(), tmp.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed.size() == 1);
    REQUIRE(r.value().removed_dirs.empty());
    REQUIRE(fs::is_directory(root / "team-drafts"));
    REQUIRE(fs::is_directory(root / "demo/later"));
}

TEST_CASE("cleanup keeps an output root that was already empty", "[managed]") {
    TempDir tmp;
    fs::create_directories(tmp.path / ".cursor/rules");

    auto r = cleanup(dir_target(), tmp.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed_dirs.empty());
    REQUIRE(fs::is_directory(tmp.path / ".cursor/rules"));
}

TEST_CASE("cleanup keeps directories holding user files", "[managed]") {
    TempDir tmp;
    fs::path root = tmp.path / ".cursor/rules";
    REQUIRE(write_member(root / "demo/style.mdc", "cursor", {}, "x\n").is_ok());
    tmp.write_file(".cursor/rules/demo/mine.mdc", "user\n");

    REQUIRE(cleanup(dir_target(), tmp.path).is_ok());
    REQUIRE(tmp.exists(".cursor/rules/demo/mine.mdc"));
}

TEST_CASE("skill-style targets match the fixed member name", "[managed]") {
    TempDir tmp;
    ToolTarget t;
    t.id = "claude-code";
    t.shape = OutputShape::DirectoryMember;
    t.output = ".claude/skills";
    t.extension = ".md";
    t.member_filename = "SKILL.md";
    REQUIRE(write_member(tmp.path / ".claude/skills/demo-style/SKILL.md",
                         "claude-code", {}, "x\n").is_ok());
    tmp.write_file(".claude/skills/mine/SKILL.md", "user skill\n");

    auto r = cleanup(t, tmp.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed.size() == 1);
    REQUIRE_FALSE(tmp.exists(".claude/skills/demo-style"));
    REQUIRE(tmp.exists(".claude/skills/mine/SKILL.md"));
}

TEST_CASE("document cleanup removes marked file and empty parents", "[managed]") {
    TempDir tmp;
    auto t = doc_target("cody", ".cody/instructions.md");
    REQUIRE(write_document(tmp.path / ".cody/instructions.md", "cody", "body").is_ok());

    auto r = cleanup(t, tmp.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed.size() == 1);
    REQUIRE_FALSE(fs::exists(tmp.path / ".cody"));
    REQUIRE(fs::exists(tmp.path));
}

TEST_CASE("document cleanup leaves an unmarked document alone", "[managed]") {
    TempDir tmp;
    tmp.write_file("CONVENTIONS.md", "# Team conventions\n");
    auto r = cleanup(doc_target("aider", "CONVENTIONS.md"), tmp.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed.empty());
    REQUIRE(tmp.read_file("CONVENTIONS.md") == "# Team conventions\n");
}

TEST_CASE("cleanup of a tool that never ran is a no-op", "[managed]") {
    TempDir tmp;
    REQUIRE(cleanup(dir_target(), tmp.path).is_ok());
    REQUIRE(cleanup(doc_target("aider", "CONVENTIONS.md"), tmp.path).is_ok());
}
