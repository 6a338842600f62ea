#pragma once

#include <aiiap/result.hpp>
#include <string>
#include <filesystem>

namespace aiiap {

// A file in the system temp directory named <prefix>-<pid>-<n><suffix>.
// Removed when the guard goes out of scope, and unlinked from a signal handler
// if the process is interrupted (SIGINT, SIGTERM, SIGHUP) while it is alive.
class ScopedTempFile {
public:
    ScopedTempFile(const std::string& prefix, const std::string& suffix);
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Replace the file contents
    Status write(const std::string& contents) const;

private:
    std::filesystem::path path_;
    int slot_ = -1;
};

// Number of guards currently registered for signal-time cleanup
int live_temp_file_count();

} // namespace aiiap
