#include <catch2/catch.hpp>
#include <aiiap/tempfile.hpp>
#include "test_helpers.hpp"
#include <csignal>
#include <unistd.h>

using namespace aiiap;

TEST_CASE("temp file name carries prefix, pid and suffix", "[tempfile]") {
    ScopedTempFile tmp("aiiap-test", ".toml");
    std::string name = tmp.path().filename().string();
    REQUIRE(name.rfind("aiiap-test-" + std::to_string(getpid()) + "-", 0) == 0);
    REQUIRE(tmp.path().extension() == ".toml");
}

TEST_CASE("temp file is removed at scope exit", "[tempfile]") {
    fs::path p;
    {
        ScopedTempFile tmp("aiiap-test", ".txt");
        p = tmp.path();
        REQUIRE(tmp.write("hello").is_ok());
        REQUIRE(fs::exists(p));
    }
    REQUIRE_FALSE(fs::exists(p));
}

TEST_CASE("temp file removed on early error return", "[tempfile]") {
    fs::path seen;
    auto fails = [&]() -> Status {
        ScopedTempFile tmp("aiiap-test", ".txt");
        seen = tmp.path();
        AIIAP_TRY(tmp.write("partial"));
        return AiiapError{AiiapError::Config, "later step failed"};
    };
    REQUIRE(fails().is_err());
    REQUIRE_FALSE(fs::exists(seen));
}

TEST_CASE("guards register and release signal-cleanup slots", "[tempfile]") {
    int before = live_temp_file_count();
    {
        ScopedTempFile a("aiiap-test", ".a");
        ScopedTempFile b("aiiap-test", ".b");
        REQUIRE(a.path() != b.path());
        REQUIRE(live_temp_file_count() == before + 2);
    }
    REQUIRE(live_temp_file_count() == before);
}

TEST_CASE("write replaces contents", "[tempfile]") {
    ScopedTempFile tmp("aiiap-test", ".txt");
    REQUIRE(tmp.write("first version").is_ok());
    REQUIRE(tmp.write("second").is_ok());
    std::ifstream in(tmp.path());
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(s == "second");
}

TEST_CASE("an ignored hangup signal stays ignored", "[tempfile]") {
    auto original = std::signal(SIGHUP, SIG_IGN);
    {
        ScopedTempFile tmp("aiiap-test", ".txt");
        auto current = std::signal(SIGHUP, SIG_IGN);
        REQUIRE(current == SIG_IGN);
    }
    std::signal(SIGHUP, original);
}

TEST_CASE("interrupt gets the cleanup handler", "[tempfile]") {
    auto original = std::signal(SIGINT, SIG_DFL);
    {
        ScopedTempFile tmp("aiiap-test", ".txt");
        auto current = std::signal(SIGINT, SIG_DFL);
        REQUIRE(current != SIG_DFL);
        REQUIRE(current != SIG_IGN);
    }
    std::signal(SIGINT, original);
}
