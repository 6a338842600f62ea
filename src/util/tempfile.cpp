#include <aiiap/tempfile.hpp>
#include <aiiap/log.hpp>
#include <csignal>
#include <cstring>
#include <fstream>

#ifdef _WIN32
#include <process.h>
#define getpid _getpid
#define unlink _unlink
#else
#include <unistd.h>
#endif

namespace aiiap {

namespace fs = std::filesystem;

// Fixed-size registry so the signal handler never allocates
static constexpr int kMaxLive = 8;
static constexpr size_t kMaxPath = 1024;
static char s_paths[kMaxLive][kMaxPath];
static volatile std::sig_atomic_t s_used[kMaxLive];
static unsigned s_counter = 0;

extern "C" void aiiap_tempfile_on_signal(int sig) {
    for (int i = 0; i < kMaxLive; i++) {
        if (s_used[i]) unlink(s_paths[i]);
    }
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

// Leaves a signal the process inherited as ignored (nohup) ignored
static void install_handler(int sig) {
    auto prev = std::signal(sig, aiiap_tempfile_on_signal);
    if (prev == SIG_IGN) std::signal(sig, SIG_IGN);
}

static void install_handlers() {
    install_handler(SIGINT);
    install_handler(SIGTERM);
#ifdef SIGHUP
    install_handler(SIGHUP);
#endif
}

static int register_path(const std::string& p) {
    if (p.size() >= kMaxPath) return -1;
    for (int i = 0; i < kMaxLive; i++) {
        if (!s_used[i]) {
            std::memcpy(s_paths[i], p.c_str(), p.size() + 1);
            s_used[i] = 1;
            return i;
        }
    }
    return -1;
}

ScopedTempFile::ScopedTempFile(const std::string& prefix, const std::string& suffix) {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) dir = ".";

    path_ = dir / (prefix + "-" + std::to_string(getpid()) + "-" +
                   std::to_string(s_counter++) + suffix);

    install_handlers();
    slot_ = register_path(path_.string());
    if (slot_ < 0) {
        log::debug("temp file %s not registered for signal cleanup", path_.c_str());
    }
}

ScopedTempFile::~ScopedTempFile() {
    if (slot_ >= 0) s_used[slot_] = 0;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        log::warn("could not remove temporary file %s: %s",
            path_.c_str(), ec.message().c_str());
    }
}

Status ScopedTempFile::write(const std::string& contents) const {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return AiiapError{AiiapError::IO,
            "cannot create temporary file: " + path_.string()};
    }
    out << contents;
    out.close();
    if (!out) {
        return AiiapError{AiiapError::IO,
            "cannot write temporary file: " + path_.string()};
    }
    return ok_status();
}

int live_temp_file_count() {
    int n = 0;
    for (int i = 0; i < kMaxLive; i++) {
        if (s_used[i]) n++;
    }
    return n;
}

} // namespace aiiap
