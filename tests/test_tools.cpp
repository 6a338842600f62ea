#include <catch2/catch.hpp>
#include <aiiap/tools.hpp>

using namespace aiiap;

static Config parse_config(const char* text) {
    auto r = Config::parse(text);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

TEST_CASE("built-in targets cover directory and document tools", "[tools]") {
    const ToolTarget* cursor = find_builtin_target("cursor");
    REQUIRE(cursor != nullptr);
    REQUIRE(cursor->shape == OutputShape::DirectoryMember);
    REQUIRE(cursor->output == ".cursor/rules");
    REQUIRE(cursor->extension == ".mdc");
    REQUIRE(cursor->supports_globs);

    const ToolTarget* skills = find_builtin_target("claude-code");
    REQUIRE(skills->member_filename == "SKILL.md");

    const ToolTarget* copilot = find_builtin_target("github-copilot");
    REQUIRE(copilot->shape == OutputShape::ConcatenatedSection);
    REQUIRE(copilot->output == ".github/copilot-instructions.md");

    REQUIRE(builtin_targets().size() == 11);
    REQUIRE(find_builtin_target("nope") == nullptr);
}

TEST_CASE("config settings override a built-in target", "[tools]") {
    auto cfg = parse_config(R"(
[tools.aider]
name = "Aider (custom)"
outputFile = "docs/CONVENTIONS.md"
[tools.cursor]
fileExtension = ".md"
)");
    auto aider = resolve_target("aider", cfg);
    REQUIRE(aider.is_ok());
    REQUIRE(aider.value().name == "Aider (custom)");
    REQUIRE(aider.value().output == "docs/CONVENTIONS.md");

    auto cursor = resolve_target("cursor", cfg);
    REQUIRE(cursor.value().extension == ".md");
    REQUIRE(cursor.value().output == ".cursor/rules");
}

TEST_CASE("configured tool without a built-in needs an output location", "[tools]") {
    auto cfg = parse_config(R"(
[tools.mine]
name = "Mine"
outputDir = ".mine"
[tools.lost]
name = "Lost"
)");
    auto mine = resolve_target("mine", cfg);
    REQUIRE(mine.is_ok());
    REQUIRE(mine.value().shape == OutputShape::DirectoryMember);
    REQUIRE(mine.value().extension == ".md");

    auto lost = resolve_target("lost", cfg);
    REQUIRE(lost.is_err());
    REQUIRE(lost.error().code == AiiapError::NotFound);
}

TEST_CASE("both outputDir and outputFile is rejected", "[tools]") {
    auto cfg = parse_config(R"(
[tools.both]
outputDir = "a"
outputFile = "b"
)");
    auto r = resolve_target("both", cfg);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AiiapError::InvalidArg);
}

TEST_CASE("unknown tool id", "[tools]") {
    auto r = resolve_target("ghost", parse_config(""));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AiiapError::NotFound);
}

TEST_CASE("known_targets merges built-ins and config, sorted by id", "[tools]") {
    auto cfg = parse_config(R"(
[tools.aaa]
outputFile = "AAA.md"
[tools.broken]
name = "Broken"
)");
    auto targets = known_targets(cfg);
    REQUIRE(targets.size() == 12);
    REQUIRE(targets.front().id == "aaa");
    for (size_t i = 1; i < targets.size(); i++) {
        REQUIRE(targets[i - 1].id < targets[i].id);
    }
}
