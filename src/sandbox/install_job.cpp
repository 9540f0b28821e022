#include "sandbox/install_job.hpp"

#include <array>
#include <memory>
#include <system_error>

#include <boost/asio/buffer.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/process.hpp>

#include "sandbox/container_handle.hpp"
#include "sandbox/image_manager.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandkeep::sandbox {
namespace bp = boost::process;
namespace {

struct StreamState {
    StreamState(boost::asio::io_context& ioc,
                const InstallCommand& command,
                InstallJobRunner::ChunkHandler chunk_handler,
                InstallJobRunner::DoneHandler done_handler)
        : pipe(ioc)
        , deadline(ioc)
        , container(command.runtime, command.container_name)
        , on_chunk(std::move(chunk_handler))
        , on_done(std::move(done_handler)) {}

    bp::async_pipe pipe;
    boost::asio::steady_timer deadline;
    ContainerHandle container;
    bp::child child;
    std::array<char, 4096> chunk{};
    std::string pending;
    InstallJob job;
    bool exited = false;
    bool drained = false;
    bool finished = false;
    InstallJobRunner::ChunkHandler on_chunk;
    InstallJobRunner::DoneHandler on_done;
};

void Publish(const std::shared_ptr<StreamState>& state, const std::string& raw) {
    if (raw.empty()) {
        return;
    }
    auto fragment = SanitizeUtf8(raw);
    state->job.text += fragment;
    state->job.fragments.push_back(fragment);
    if (state->on_chunk) {
        state->on_chunk(state->job.fragments.back(), state->job.text);
    }
}

// Forwards complete lines; a partial trailing line waits for more bytes.
void PublishLines(const std::shared_ptr<StreamState>& state) {
    const auto last_newline = state->pending.rfind('\n');
    if (last_newline == std::string::npos) {
        return;
    }
    const auto complete = state->pending.substr(0, last_newline + 1);
    state->pending.erase(0, last_newline + 1);
    std::size_t start = 0;
    while (start < complete.size()) {
        const auto end = complete.find('\n', start);
        Publish(state, complete.substr(start, end - start + 1));
        start = end + 1;
    }
}

void Finish(const std::shared_ptr<StreamState>& state) {
    if (state->finished) {
        return;
    }
    state->finished = true;
    state->deadline.cancel();
    boost::system::error_code ec;
    if (state->pipe.is_open()) {
        state->pipe.close(ec);
    }
    Publish(state, state->pending);
    state->pending.clear();
    if (state->job.timed_out) {
        state->job.exit_code = kTimeoutExitCode;
    } else {
        state->container.Release();
    }
    utils::LogInfo("install", state->container.Name() + " finished with exit code " +
                                  std::to_string(state->job.exit_code));
    auto on_done = std::move(state->on_done);
    if (on_done) {
        on_done(std::move(state->job));
    }
}

void MaybeFinish(const std::shared_ptr<StreamState>& state) {
    if (state->exited && state->drained) {
        Finish(state);
    }
}

void ReadLog(const std::shared_ptr<StreamState>& state) {
    state->pipe.async_read_some(
        boost::asio::buffer(state->chunk),
        [state](const boost::system::error_code& ec, std::size_t size) {
            if (state->finished) {
                return;
            }
            if (size > 0) {
                state->pending.append(state->chunk.data(), size);
                PublishLines(state);
            }
            if (ec) {
                state->drained = true;
                MaybeFinish(state);
                return;
            }
            ReadLog(state);
        });
}

}  // namespace

InstallJobRunner::InstallJobRunner(std::string runtime_binary, std::string image)
    : runtime_binary_(std::move(runtime_binary))
    , image_(std::move(image)) {}

std::vector<std::string> InstallJobRunner::ParsePackages(const std::string& text) {
    return utils::SplitWhitespace(text);
}

InstallCommand InstallJobRunner::BuildInvocation(const std::string& mount_dir,
                                                 const std::vector<std::string>& packages,
                                                 const ResourceLimits& limits) const {
    InstallCommand command{};
    command.runtime = LocateRuntime(runtime_binary_);
    command.container_name = GenerateContainerName("py-pip");
    command.args = {
        "run",
        "--rm",
        "--name", command.container_name,
        "-v", mount_dir + ":" + kWorkspaceMount + ":rw",
        "--pids-limit", std::to_string(limits.pids_limit),
        "--cpus", limits.cpus,
        "--memory", limits.memory,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--user", kSandboxUser,
        "-w", kWorkspaceMount,
        "-e", "PYTHONDONTWRITEBYTECODE=1",
        "-e", "PYTHONUNBUFFERED=1",
        "-e", "HOME=/tmp",
        image_,
        "python", "-m", "pip", "install",
        "--no-cache-dir",
        "--disable-pip-version-check",
        "-U",
        "-t", kSitePackagesMount,
    };
    // "--" keeps a package name that starts with '-' from being read as a pip option.
    command.args.push_back("--");
    command.args.insert(command.args.end(), packages.begin(), packages.end());
    return command;
}

void InstallJobRunner::Stream(boost::asio::io_context& ioc,
                              const InstallCommand& command,
                              ChunkHandler on_chunk,
                              DoneHandler on_done,
                              std::chrono::milliseconds timeout) const {
    auto state = std::make_shared<StreamState>(ioc, command, std::move(on_chunk), std::move(on_done));
    std::error_code launch_ec;
    state->child = bp::child(
        bp::exe = command.runtime,
        bp::args = command.args,
        bp::std_in < bp::null,
        (bp::std_out & bp::std_err) > state->pipe,
        ioc,
        bp::on_exit([state](int exit_code, const std::error_code& ec) {
            // A timed out child was already reaped by terminate().
            if (state->finished) {
                return;
            }
            if (ec) {
                utils::LogWarn("install", "waiting for " + state->container.Name() + " failed: " + ec.message());
            }
            state->job.exit_code = exit_code;
            state->exited = true;
            MaybeFinish(state);
        }),
        launch_ec);
    if (launch_ec) {
        state->container.Release();
        throw SandboxError(SandboxErrc::kLaunchFailed, "Failed to start package install: " + launch_ec.message());
    }
    utils::LogInfo("install", "started " + command.container_name);
    ReadLog(state);

    if (timeout.count() > 0) {
        state->deadline.expires_after(timeout);
        state->deadline.async_wait([state, &ioc](const boost::system::error_code& ec) {
            if (ec || state->finished) {
                return;
            }
            utils::LogWarn("install", state->container.Name() + " hit the deadline; removing");
            state->job.timed_out = true;
            state->container.ForceRemoveAsync(ioc);
            std::error_code term_ec;
            state->child.terminate(term_ec);
            Finish(state);
        });
    }
}

InstallJob InstallJobRunner::Run(const InstallCommand& command,
                                 ChunkHandler on_chunk,
                                 std::chrono::milliseconds timeout) const {
    boost::asio::io_context ioc;
    std::optional<InstallJob> job;
    Stream(ioc, command, std::move(on_chunk), [&job](InstallJob finished) {
        job = std::move(finished);
    }, timeout);
    ioc.run();
    if (!job) {
        throw SandboxError(SandboxErrc::kLaunchFailed, "Package install ended without a result.");
    }
    return std::move(*job);
}

ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval, std::size_t tail_bytes, Clock clock)
    : interval_(interval)
    , tail_bytes_(tail_bytes)
    , clock_(std::move(clock))
    , last_emit_(Now()) {}

std::chrono::steady_clock::time_point ProgressThrottle::Now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

std::optional<std::string> ProgressThrottle::Offer(const std::string& cumulative) {
    const auto now = Now();
    if (now - last_emit_ < interval_) {
        return std::nullopt;
    }
    last_emit_ = now;
    return Tail(cumulative, tail_bytes_);
}

std::string ProgressThrottle::Final(const std::string& cumulative) {
    last_emit_ = Now();
    return Tail(cumulative, tail_bytes_);
}

std::string ProgressThrottle::Tail(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    auto start = text.size() - max_bytes;
    // Do not start in the middle of a UTF-8 sequence.
    while (start < text.size() && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
        ++start;
    }
    return text.substr(start);
}

}  // namespace sandkeep::sandbox
