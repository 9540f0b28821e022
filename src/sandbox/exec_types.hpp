#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace sandkeep::sandbox {

constexpr int kTimeoutExitCode = 124;
constexpr const char* kWorkspaceMount = "/workspace";
constexpr const char* kSandboxUser = "1000:1000";

struct ResourceLimits {
    std::string memory = "256m";
    std::string cpus = "1.0";
    int pids_limit = 64;
};

struct ExecRequest {
    std::string source;
    std::string mount_dir;
    std::string workdir_subpath;
    std::chrono::milliseconds timeout{5000};
    ResourceLimits limits;
    std::map<std::string, std::string> env;
};

struct ExecResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    bool truncated = false;
};

}  // namespace sandkeep::sandbox
