#include <catch2/catch.hpp>
#include <aiiap/selection.hpp>
#include "test_helpers.hpp"

using namespace aiiap;

static Config test_config() {
    auto r = Config::parse(R"(
version = "1"
[tools.cursor]
name = "Cursor"
[tools.aider]
name = "Aider"

[languages.general]
name = "General"
alwaysApply = true
files = ["persona"]
[languages.general.documentation.api]
file = "api-docs"

[languages.demo]
name = "Demo"
files = ["style"]
[languages.demo.frameworks.web]
file = "web"
[languages.demo.frameworks.web.structures.feature]
file = "web-feature"
[languages.demo.frameworks.cli]
file = "cli"
[languages.demo.processes.ship]
file = "ship"
)");
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

static SelectionState full_selection() {
    SelectionState s;
    s.tools = {"cursor", "aider"};
    s.languages = {"general", "demo"};
    s.documentation = {"api"};
    s.frameworks["demo"] = {"web"};
    s.structures[structure_key("demo", "web")] = "web-feature";
    s.processes["demo"] = {"ship"};
    return s;
}

TEST_CASE("structure key joins language and framework", "[selection]") {
    REQUIRE(structure_key("demo", "web") == "demo-web");
}

TEST_CASE("save and load preserve a valid selection", "[selection]") {
    TempDir tmp;
    Config cfg = test_config();
    auto state = full_selection();
    REQUIRE(save_selection(state, tmp.path / "state.toml").is_ok());

    auto loaded = load_selection(tmp.path / "state.toml", cfg);
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == state);
}

TEST_CASE("serialization is deterministic", "[selection]") {
    auto a = full_selection();
    auto b = full_selection();
    REQUIRE(serialize_selection(a) == serialize_selection(b));
    REQUIRE(serialize_selection(a).find("selectedTools") != std::string::npos);
}

TEST_CASE("stale entries are dropped without error", "[selection]") {
    Config cfg = test_config();
    auto state = full_selection();
    state.tools.insert("ghost-tool");
    state.languages.insert("ghost");
    state.documentation.insert("ghost-doc");
    state.frameworks["ghost"] = {"web"};
    state.frameworks["demo"].insert("ghost-fw");
    state.processes["demo"].insert("ghost-proc");
    state.structures["demo-cli"] = "web-feature";   // framework not selected
    state.structures["ghost-web"] = "web-feature";

    LogCapture cap(log::Debug);
    auto filtered = filter_selection(state, cfg);
    REQUIRE(filtered == full_selection());
    REQUIRE(cap.text().find("ghost") != std::string::npos);
    REQUIRE(cap.text().find("warn") == std::string::npos);
}

TEST_CASE("dependent selections fall with their language", "[selection]") {
    Config cfg = test_config();
    auto state = full_selection();
    state.languages.erase("demo");

    auto filtered = filter_selection(state, cfg);
    REQUIRE(filtered.frameworks.empty());
    REQUIRE(filtered.structures.empty());
    REQUIRE(filtered.processes.empty());
    REQUIRE(filtered.documentation == std::set<std::string>{"api"});
}

TEST_CASE("structure with an unknown file is dropped", "[selection]") {
    Config cfg = test_config();
    auto state = full_selection();
    state.structures["demo-web"] = "web-layered";
    REQUIRE(filter_selection(state, cfg).structures.empty());
}

TEST_CASE("documentation requires a selected language defining it", "[selection]") {
    Config cfg = test_config();
    SelectionState state;
    state.languages = {"demo"};
    state.documentation = {"api"};
    REQUIRE(filter_selection(state, cfg).documentation.empty());
}

TEST_CASE("missing state file means no prior state", "[selection]") {
    TempDir tmp;
    REQUIRE_FALSE(load_selection(tmp.path / "none.toml", test_config()).has_value());
}

TEST_CASE("malformed state warns and is treated as absent", "[selection]") {
    TempDir tmp;
    tmp.write_file("state.toml", "selectedTools = [\"cursor\"\n");
    LogCapture cap;
    REQUIRE_FALSE(load_selection(tmp.path / "state.toml", test_config()).has_value());
    REQUIRE(cap.text().find("warn:") != std::string::npos);
}

TEST_CASE("wrong-typed and unknown fields are ignored", "[selection]") {
    auto r = parse_selection(R"(
version = "99"
selectedTools = "cursor"
selectedLanguages = ["demo", 3]
futureField = true
[selectedFrameworks]
demo = "web"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().version == "99");
    REQUIRE(r.value().tools.empty());
    REQUIRE(r.value().languages == std::set<std::string>{"demo"});
    REQUIRE(r.value().frameworks.empty());
}

TEST_CASE("parse_selection reports invalid TOML as a State error", "[selection]") {
    auto r = parse_selection("[[[");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AiiapError::State);
}

TEST_CASE("include_always_apply adds flagged languages", "[selection]") {
    SelectionState s;
    include_always_apply(s, test_config());
    REQUIRE(s.languages == std::set<std::string>{"general"});
}

TEST_CASE("delete_selection removes the record and tolerates absence", "[selection]") {
    TempDir tmp;
    tmp.write_file("state.toml", "version = \"1\"\n");
    REQUIRE(delete_selection(tmp.path / "state.toml").is_ok());
    REQUIRE_FALSE(tmp.exists("state.toml"));
    REQUIRE(delete_selection(tmp.path / "state.toml").is_ok());
}
