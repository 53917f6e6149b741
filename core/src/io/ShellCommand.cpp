#include "affectscope/io/ShellCommand.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace affectscope {
namespace io {

std::string shell_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

absl::Status run_shell_command(const std::string& command) {
    VLOG(1) << "Running: " << command;
    const int ret = std::system(command.c_str());
    if (ret == -1) {
        return absl::InternalError("Failed to spawn shell for: " + command);
    }
    if (!WIFEXITED(ret)) {
        return absl::UnavailableError(absl::StrCat("Command terminated abnormally: ", command));
    }
    const int code = WEXITSTATUS(ret);
    if (code == 0) {
        return absl::OkStatus();
    }
    if (code == 127) {
        return absl::NotFoundError(absl::StrCat("Command not found: ", command));
    }
    return absl::UnavailableError(absl::StrCat("Command exited with status ", code, ": ", command));
}

TempPath::TempPath(const std::string& suffix) {
    static std::atomic<unsigned> counter{0};
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto name = absl::StrCat("affectscope_", ::getpid(), "_", ticks, "_", counter.fetch_add(1), suffix);
    path_ = (std::filesystem::temp_directory_path() / name).string();
}

TempPath::~TempPath() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

}  // namespace io
}  // namespace affectscope
