#include "sandbox/execution_engine.hpp"

#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>

#include <boost/asio/buffer.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/process.hpp>

#include "sandbox/container_handle.hpp"
#include "sandbox/image_manager.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/sandbox_error.hpp"
#include "utils/logging.hpp"

namespace sandkeep::sandbox {
namespace bp = boost::process;
namespace {

struct RunState {
    RunState(boost::asio::io_context& ioc,
             std::string runtime,
             std::string name,
             std::size_t cap,
             ExecutionEngine::Handler on_done)
        : stdin_pipe(ioc)
        , stdout_pipe(ioc)
        , stderr_pipe(ioc)
        , deadline(ioc)
        , container(std::move(runtime), std::move(name))
        , out(cap)
        , err(cap)
        , handler(std::move(on_done)) {}

    bp::async_pipe stdin_pipe;
    bp::async_pipe stdout_pipe;
    bp::async_pipe stderr_pipe;
    boost::asio::steady_timer deadline;
    ContainerHandle container;
    bp::child child;
    std::string source;
    CappedBuffer out;
    CappedBuffer err;
    std::array<char, 4096> out_chunk{};
    std::array<char, 4096> err_chunk{};
    bool exited = false;
    bool out_done = false;
    bool err_done = false;
    bool timed_out = false;
    bool finished = false;
    int exit_code = -1;
    ExecutionEngine::Handler handler;
};

void ClosePipe(bp::async_pipe& pipe) {
    boost::system::error_code ec;
    if (pipe.is_open()) {
        pipe.close(ec);
    }
}

void Finish(const std::shared_ptr<RunState>& state) {
    if (state->finished) {
        return;
    }
    state->finished = true;
    state->deadline.cancel();
    ClosePipe(state->stdin_pipe);
    ClosePipe(state->stdout_pipe);
    ClosePipe(state->stderr_pipe);

    ExecResult result{};
    if (state->timed_out) {
        result.exit_code = kTimeoutExitCode;
        result.stderr_text = ExecutionEngine::TimeoutMessage();
        result.timed_out = true;
    } else {
        state->container.Release();
        result.exit_code = state->exit_code;
        result.stdout_text = SanitizeUtf8(state->out.Data());
        result.stderr_text = SanitizeUtf8(state->err.Data());
        result.truncated = state->out.Overflowed() || state->err.Overflowed();
    }
    utils::LogDebug("sandbox", state->container.Name() + " finished with exit code " +
                                   std::to_string(result.exit_code));
    auto handler = std::move(state->handler);
    if (handler) {
        handler(std::move(result));
    }
}

void MaybeFinish(const std::shared_ptr<RunState>& state) {
    if (state->exited && state->out_done && state->err_done) {
        Finish(state);
    }
}

void ReadStream(const std::shared_ptr<RunState>& state,
                bp::async_pipe& pipe,
                std::array<char, 4096>& chunk,
                CappedBuffer& sink,
                bool& done) {
    pipe.async_read_some(
        boost::asio::buffer(chunk),
        [state, &pipe, &chunk, &sink, &done](const boost::system::error_code& ec, std::size_t size) {
            if (state->finished) {
                return;
            }
            if (size > 0) {
                sink.Append(chunk.data(), size);
            }
            if (ec) {
                done = true;
                MaybeFinish(state);
                return;
            }
            ReadStream(state, pipe, chunk, sink, done);
        });
}

}  // namespace

ExecutionEngine::ExecutionEngine(EngineOptions options)
    : options_(std::move(options)) {}

std::string ExecutionEngine::TimeoutMessage() {
    return "Execution timed out. If this was the first run, the Docker image"
           " may still be pulling. Try pre-pulling or increasing the timeout.";
}

std::string ExecutionEngine::ContainerWorkdir(const std::string& subpath) {
    std::string sub = subpath;
    const auto first = sub.find_first_not_of('/');
    sub = first == std::string::npos ? std::string() : sub.substr(first);
    const auto normal = std::filesystem::path(sub).lexically_normal().generic_string();
    if (normal.empty() || normal == "." || normal == "./" || normal.rfind("..", 0) == 0) {
        return kWorkspaceMount;
    }
    std::string workdir = std::string(kWorkspaceMount) + "/" + normal;
    if (workdir.size() > 1 && workdir.back() == '/') {
        workdir.pop_back();
    }
    return workdir;
}

std::vector<std::string> ExecutionEngine::BuildRunArgs(const ExecRequest& request,
                                                       const std::string& image,
                                                       const std::string& container_name) {
    std::vector<std::string> args = {
        "run",
        "--rm",
        "--name", container_name,
        "-i",
        "--network", "none",
        "--read-only",
        "--tmpfs", "/tmp:rw,noexec,nosuid,size=64m",
        "--pids-limit", std::to_string(request.limits.pids_limit),
        "--cpus", request.limits.cpus,
        "--memory", request.limits.memory,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--user", kSandboxUser,
        "-e", "PYTHONDONTWRITEBYTECODE=1",
        "-e", "PYTHONUNBUFFERED=1",
    };
    if (!request.mount_dir.empty()) {
        args.push_back("-v");
        args.push_back(request.mount_dir + ":" + kWorkspaceMount + ":rw");
        args.push_back("-w");
        args.push_back(ContainerWorkdir(request.workdir_subpath));
    }
    for (const auto& [key, value] : request.env) {
        if (key.empty() || key.find('=') != std::string::npos) {
            continue;
        }
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }
    args.push_back(image);
    args.push_back("python");
    args.push_back("-");
    return args;
}

ExecResult ExecutionEngine::Run(const ExecRequest& request) const {
    boost::asio::io_context ioc;
    std::optional<ExecResult> result;
    AsyncRun(ioc, request, [&result](ExecResult finished) {
        result = std::move(finished);
    });
    ioc.run();
    if (!result) {
        throw SandboxError(SandboxErrc::kLaunchFailed, "Execution ended without a result.");
    }
    return *result;
}

void ExecutionEngine::AsyncRun(boost::asio::io_context& ioc, const ExecRequest& request, Handler handler) const {
    const auto runtime = LocateRuntime(options_.runtime_binary);
    const auto name = GenerateContainerName(options_.name_prefix);
    auto state = std::make_shared<RunState>(ioc, runtime, name, options_.max_output_bytes, std::move(handler));
    state->source = request.source;

    const auto args = BuildRunArgs(request, options_.image, name);
    std::error_code launch_ec;
    state->child = bp::child(
        bp::exe = runtime,
        bp::args = args,
        bp::std_in < state->stdin_pipe,
        bp::std_out > state->stdout_pipe,
        bp::std_err > state->stderr_pipe,
        ioc,
        bp::on_exit([state](int exit_code, const std::error_code& ec) {
            // A timed out child was already reaped by terminate().
            if (state->finished) {
                return;
            }
            if (ec) {
                utils::LogWarn("sandbox", "waiting for " + state->container.Name() + " failed: " + ec.message());
            }
            state->exit_code = exit_code;
            state->exited = true;
            MaybeFinish(state);
        }),
        launch_ec);
    if (launch_ec) {
        // Nothing was started, so there is no container to remove.
        state->container.Release();
        throw SandboxError(SandboxErrc::kLaunchFailed, "Failed to execute code in Docker: " + launch_ec.message());
    }
    utils::LogDebug("sandbox", "started " + name + " in " + ContainerWorkdir(request.workdir_subpath));

    boost::asio::async_write(
        state->stdin_pipe,
        boost::asio::buffer(state->source),
        [state](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                utils::LogDebug("sandbox", "stdin for " + state->container.Name() + " closed early: " + ec.message());
            }
            ClosePipe(state->stdin_pipe);
        });
    ReadStream(state, state->stdout_pipe, state->out_chunk, state->out, state->out_done);
    ReadStream(state, state->stderr_pipe, state->err_chunk, state->err, state->err_done);

    state->deadline.expires_after(request.timeout);
    state->deadline.async_wait([state, &ioc](const boost::system::error_code& ec) {
        if (ec || state->finished) {
            return;
        }
        utils::LogWarn("sandbox", state->container.Name() + " hit the deadline; removing");
        state->timed_out = true;
        state->container.ForceRemoveAsync(ioc);
        std::error_code term_ec;
        state->child.terminate(term_ec);
        Finish(state);
    });
}

}  // namespace sandkeep::sandbox
