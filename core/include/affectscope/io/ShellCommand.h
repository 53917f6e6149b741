#pragma once

#include <absl/status/status.h>

#include <string>

namespace affectscope {
namespace io {

// Single-quote `s` for /bin/sh.
std::string shell_quote(const std::string& s);

/**
 * Run `command` through the shell. Exit code 127 (command not found) maps to
 * NotFound, any other non-zero exit to Unavailable.
 */
absl::Status run_shell_command(const std::string& command);

/**
 * Unique path under the system temp directory, removed on destruction.
 * The file itself is not created.
 */
class TempPath {
  public:
    explicit TempPath(const std::string& suffix);
    ~TempPath();

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
};

}  // namespace io
}  // namespace affectscope
