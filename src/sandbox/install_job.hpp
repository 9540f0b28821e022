#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "sandbox/exec_types.hpp"

namespace sandkeep::sandbox {

constexpr const char* kSitePackagesMount = "/workspace/.site-packages";

struct InstallCommand {
    std::string runtime;
    std::string container_name;
    std::vector<std::string> args;
};

struct InstallJob {
    std::vector<std::string> fragments;
    std::string text;
    int exit_code = -1;
    bool timed_out = false;
};

// Drives `pip install --target` in a container that, unlike ExecutionEngine
// runs, is allowed to reach the network.
class InstallJobRunner {
public:
    using ChunkHandler = std::function<void(const std::string& fragment, const std::string& cumulative)>;
    using DoneHandler = std::function<void(InstallJob)>;

    InstallJobRunner(std::string runtime_binary, std::string image);

    // Throws SandboxError when the runtime binary is missing.
    InstallCommand BuildInvocation(const std::string& mount_dir,
                                   const std::vector<std::string>& packages,
                                   const ResourceLimits& limits) const;

    // Reads combined stdout/stderr as it arrives. A zero timeout lets the job
    // run until it exits on its own.
    void Stream(boost::asio::io_context& ioc,
                const InstallCommand& command,
                ChunkHandler on_chunk,
                DoneHandler on_done,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) const;

    InstallJob Run(const InstallCommand& command,
                   ChunkHandler on_chunk = {},
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) const;

    static std::vector<std::string> ParsePackages(const std::string& text);

private:
    std::string runtime_binary_;
    std::string image_;
};

// Rate limits progress snapshots: at most one per interval, plus a final one.
// Snapshots carry only the trailing window of the log.
class ProgressThrottle {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ProgressThrottle(std::chrono::milliseconds interval = std::chrono::seconds(3),
                              std::size_t tail_bytes = 1800,
                              Clock clock = {});

    std::optional<std::string> Offer(const std::string& cumulative);
    std::string Final(const std::string& cumulative);

    static std::string Tail(const std::string& text, std::size_t max_bytes);

private:
    std::chrono::steady_clock::time_point Now() const;

    std::chrono::milliseconds interval_;
    std::size_t tail_bytes_;
    Clock clock_;
    std::chrono::steady_clock::time_point last_emit_;
};

}  // namespace sandkeep::sandbox
