#pragma once

#include <aiiap/log.hpp>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        static int counter = 0;
        fs::path base = fs::canonical(fs::temp_directory_path());
        path = base / ("aiiap_test_" + std::to_string(
            std::hash<std::string>{}(std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()))) +
            "_" + std::to_string(++counter));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full, std::ios::binary);
        f << content;
    }

    std::string read_file(const std::string& rel) const {
        std::ifstream f(path / rel, std::ios::binary);
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    bool exists(const std::string& rel) const {
        return fs::exists(path / rel);
    }
};

// Redirects aiiap::log into a temporary stream for the lifetime of the object
struct LogCapture {
    std::FILE* file;
    aiiap::log::Level saved_level;

    explicit LogCapture(aiiap::log::Level lvl = aiiap::log::Info)
        : file(std::tmpfile()), saved_level(aiiap::log::get_level()) {
        aiiap::log::set_output(file);
        aiiap::log::set_color_enabled(false);
        aiiap::log::set_level(lvl);
    }

    ~LogCapture() {
        aiiap::log::set_output(nullptr);
        aiiap::log::set_level(saved_level);
        std::fclose(file);
    }

    std::string text() const {
        std::fflush(file);
        std::rewind(file);
        std::string out;
        char buf[1024];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), file)) > 0) out.append(buf, n);
        return out;
    }
};
