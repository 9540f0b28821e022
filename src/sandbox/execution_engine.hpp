#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "sandbox/exec_types.hpp"

namespace sandkeep::sandbox {

struct EngineOptions {
    std::string runtime_binary = "docker";
    std::string image = "python:3.11-alpine";
    std::size_t max_output_bytes = 100000;
    std::string name_prefix = "py-sbx";
};

// Runs one snippet per call in a fresh, network-less, read-only container with
// the session workspace as its only writable mount. The source is piped to
// `python -` on stdin; the process should ignore SIGPIPE so a runtime that
// exits early shows up as a write error.
class ExecutionEngine {
public:
    using Handler = std::function<void(ExecResult)>;

    explicit ExecutionEngine(EngineOptions options);

    // Blocking convenience around AsyncRun on a private io_context.
    ExecResult Run(const ExecRequest& request) const;

    // Spawns the container and returns immediately; `handler` is invoked once
    // from `ioc` with the result. Throws SandboxError when the runtime cannot
    // be located or started. Timeouts are delivered as results.
    void AsyncRun(boost::asio::io_context& ioc, const ExecRequest& request, Handler handler) const;

    static std::vector<std::string> BuildRunArgs(const ExecRequest& request,
                                                 const std::string& image,
                                                 const std::string& container_name);

    // "/workspace" joined with a relative subpath; "." and escaping subpaths
    // map to the mount root.
    static std::string ContainerWorkdir(const std::string& subpath);

    static std::string TimeoutMessage();

private:
    EngineOptions options_;
};

}  // namespace sandkeep::sandbox
