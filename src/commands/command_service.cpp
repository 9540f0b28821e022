#include "commands/command_service.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>

#include <boost/asio/post.hpp>

#include "commands/formatting.hpp"
#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandkeep::commands {
namespace {

std::chrono::milliseconds ToMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

}  // namespace

CommandService::CommandService(const config::Config& config,
                               session::SessionStore& sessions,
                               const sandbox::ExecutionEngine& engine,
                               const sandbox::InstallJobRunner& installer,
                               const sandbox::ImageManager& images)
    : config_(config)
    , sessions_(sessions)
    , engine_(engine)
    , installer_(installer)
    , images_(images)
    , rewriter_(config.echo.echo_last_expr) {}

std::string CommandService::Usage() {
    return "Usage: create | py <code> | look [path] [page] | write <name> <content> | "
           "rm <name> [-r] | cat <name> | pip <packages...> | delete | health";
}

sandbox::ResourceLimits CommandService::Limits() const {
    sandbox::ResourceLimits limits{};
    limits.memory = config_.sandbox.memory;
    limits.cpus = config_.sandbox.cpus;
    limits.pids_limit = config_.sandbox.pids_limit;
    return limits;
}

void CommandService::EnsureImageIfLazy() const {
    if (config_.sandbox.pull_on_startup || image_ready_.load()) {
        return;
    }
    images_.EnsureImage(config_.sandbox.image, true);
    image_ready_.store(true);
}

sandbox::ExecRequest CommandService::BuildRequest(const std::string& user, const std::string& code) const {
    sandbox::ExecRequest request{};
    request.source = rewriter_.Rewrite(ExtractCodeBlock(code));
    request.mount_dir = sessions_.RootPath(user).string();
    request.workdir_subpath = sessions_.CurrentCwd(user);
    request.timeout = ToMillis(config_.sandbox.exec_timeout_s);
    request.limits = Limits();
    request.env["PYTHONPATH"] = sandbox::kSitePackagesMount;
    return request;
}

std::string CommandService::Create(const std::string& user) {
    switch (sessions_.Create(user)) {
        case session::CreateStatus::kCreated:
            return "Sandbox created. Use look to browse and py to run code.";
        case session::CreateStatus::kAlreadyExists:
            return "You already have a sandbox.";
        case session::CreateStatus::kFailed:
            break;
    }
    return "Failed to create sandbox. Try again.";
}

std::string CommandService::Delete(const std::string& user) {
    if (!sessions_.Ensure(user)) {
        return "No sandbox to delete.";
    }
    if (sessions_.Delete(user)) {
        return "Sandbox deleted.";
    }
    return "Failed to delete sandbox. Try again.";
}

std::string CommandService::Health() const {
    return images_.Health(config_.sandbox.image);
}

std::string CommandService::RunCode(const std::string& user, const std::string& raw_code) {
    boost::asio::io_context ioc;
    std::string reply;
    AsyncRunCode(ioc, user, raw_code, [&reply](std::string text) {
        reply = std::move(text);
    });
    ioc.run();
    return reply;
}

void CommandService::AsyncRunCode(boost::asio::io_context& ioc,
                                  const std::string& user,
                                  const std::string& raw_code,
                                  ReplyHandler reply) {
    if (!sessions_.Ensure(user)) {
        reply(kNoSession);
        return;
    }
    try {
        EnsureImageIfLazy();
        engine_.AsyncRun(ioc, BuildRequest(user, raw_code),
                         [this, user, reply](sandbox::ExecResult result) {
                             sessions_.Touch(user);
                             if (result.timed_out) {
                                 utils::LogInfo("run", "execution for " + user + " timed out");
                             }
                             reply(FormatResult(result));
                         });
    } catch (const sandbox::SandboxError& ex) {
        utils::LogWarn("run", std::string("sandbox error for ") + user + ": " + ex.what());
        reply(std::string("Sandbox error: ") + ex.what());
    }
}

std::string CommandService::Look(const std::string& user, const std::string& path, std::size_t page) {
    if (!sessions_.Ensure(user)) {
        return kNoSession;
    }
    if (!utils::Trim(path).empty() && !sessions_.SetCwd(user, path)) {
        return "Invalid path. Stay in current directory.";
    }
    const auto listing = sessions_.List(user);
    if (!listing) {
        return "Failed to list directory.";
    }
    sessions_.Touch(user);
    return Paginate(RenderListing(*listing), page);
}

std::string CommandService::Write(const std::string& user, const std::string& name, const std::string& content) {
    if (!sessions_.Ensure(user)) {
        return kNoSession;
    }
    std::filesystem::path written;
    switch (sessions_.WriteFile(user, name, content, &written)) {
        case session::FileOpStatus::kOk:
            sessions_.Touch(user);
            return "Wrote " + written.filename().string() + " (" + std::to_string(content.size()) + " bytes).";
        case session::FileOpStatus::kDirectoryConflict:
            return "A directory exists with that name.";
        case session::FileOpStatus::kNoSession:
            return kNoSession;
        case session::FileOpStatus::kPathEscape:
        case session::FileOpStatus::kNotFound:
            return "Invalid path.";
        case session::FileOpStatus::kNeedsRecursive:
        case session::FileOpStatus::kIoFailure:
            break;
    }
    return "Failed to write file.";
}

std::string CommandService::Remove(const std::string& user, const std::string& name, bool recursive) {
    if (!sessions_.Ensure(user)) {
        return kNoSession;
    }
    switch (sessions_.Remove(user, name, recursive)) {
        case session::FileOpStatus::kOk:
            sessions_.Touch(user);
            return "Removed.";
        case session::FileOpStatus::kNeedsRecursive:
            return "Use recursive to remove directories.";
        case session::FileOpStatus::kNoSession:
            return kNoSession;
        case session::FileOpStatus::kPathEscape:
        case session::FileOpStatus::kNotFound:
            return "Path not found.";
        case session::FileOpStatus::kDirectoryConflict:
        case session::FileOpStatus::kIoFailure:
            break;
    }
    return "Failed to remove.";
}

std::string CommandService::Cat(const std::string& user, const std::string& name) {
    if (!sessions_.Ensure(user)) {
        return kNoSession;
    }
    const auto content = sessions_.ReadFile(user, name);
    if (!content) {
        return "Path not found.";
    }
    sessions_.Touch(user);
    return *content;
}

std::string CommandService::Install(const std::string& user, const std::string& packages, SnapshotHandler on_snapshot) {
    boost::asio::io_context ioc;
    std::string reply;
    AsyncInstall(ioc, user, packages, std::move(on_snapshot), [&reply](std::string text) {
        reply = std::move(text);
    });
    ioc.run();
    return reply;
}

void CommandService::AsyncInstall(boost::asio::io_context& ioc,
                                  const std::string& user,
                                  const std::string& packages,
                                  SnapshotHandler on_snapshot,
                                  ReplyHandler reply) {
    if (!sessions_.Ensure(user)) {
        reply(kNoSession);
        return;
    }
    const auto names = sandbox::InstallJobRunner::ParsePackages(packages);
    if (names.empty()) {
        reply("Provide at least one package name.");
        return;
    }
    try {
        EnsureImageIfLazy();
        const auto command = installer_.BuildInvocation(sessions_.RootPath(user).string(), names, Limits());
        auto throttle = std::make_shared<sandbox::ProgressThrottle>();
        if (on_snapshot) {
            on_snapshot("Starting pip install...");
        }
        installer_.Stream(
            ioc,
            command,
            [throttle, on_snapshot](const std::string&, const std::string& cumulative) {
                if (!on_snapshot) {
                    return;
                }
                if (auto snapshot = throttle->Offer(cumulative)) {
                    on_snapshot(*snapshot);
                }
            },
            [this, user, throttle, on_snapshot, reply](sandbox::InstallJob job) {
                auto final_text = throttle->Final(job.text);
                if (job.timed_out) {
                    final_text += "\n[install timed out]";
                }
                if (on_snapshot) {
                    on_snapshot(final_text);
                }
                utils::LogInfo("install", user + " pip exited with " + std::to_string(job.exit_code));
                sessions_.Touch(user);
                reply(final_text);
            },
            ToMillis(config_.sandbox.install_timeout_s));
    } catch (const sandbox::SandboxError& ex) {
        utils::LogWarn("install", std::string("sandbox error for ") + user + ": " + ex.what());
        reply(std::string("Sandbox error: ") + ex.what());
    }
}

std::string CommandService::Dispatch(const std::string& user,
                                     const std::string& verb,
                                     const std::vector<std::string>& args,
                                     SnapshotHandler on_snapshot) {
    if (verb == "create") {
        return Create(user);
    }
    if (verb == "delete") {
        return Delete(user);
    }
    if (verb == "health") {
        return Health();
    }
    if (verb == "py") {
        return RunCode(user, utils::Join(args, " "));
    }
    if (verb == "look") {
        std::size_t page = 0;
        if (args.size() > 1) {
            try {
                const auto requested = std::stoul(args[1]);
                page = requested > 0 ? requested - 1 : 0;
            } catch (const std::exception&) {
                return Usage();
            }
        }
        return Look(user, args.empty() ? std::string() : args[0], page);
    }
    if (verb == "write" && !args.empty()) {
        const std::vector<std::string> rest(args.begin() + 1, args.end());
        return Write(user, args[0], utils::Join(rest, " "));
    }
    if (verb == "rm" && !args.empty()) {
        const bool recursive = args.size() > 1 && (args[1] == "-r" || args[1] == "--recursive");
        return Remove(user, args[0], recursive);
    }
    if (verb == "cat" && !args.empty()) {
        return Cat(user, args[0]);
    }
    if (verb == "pip") {
        return Install(user, utils::Join(args, " "), std::move(on_snapshot));
    }
    return Usage();
}

void CommandService::AsyncDispatch(boost::asio::io_context& ioc,
                                   const std::string& user,
                                   const std::string& verb,
                                   const std::vector<std::string>& args,
                                   SnapshotHandler on_snapshot,
                                   ReplyHandler reply) {
    if (verb != "py" && verb != "pip") {
        reply(Dispatch(user, verb, args, std::move(on_snapshot)));
        return;
    }
    if (!sessions_.Ensure(user)) {
        reply(kNoSession);
        return;
    }
    try {
        EnsureImageIfLazy();
    } catch (const sandbox::SandboxError& ex) {
        utils::LogWarn(verb == "py" ? "run" : "install", std::string("sandbox error for ") + user + ": " + ex.what());
        reply(std::string("Sandbox error: ") + ex.what());
        return;
    }
    boost::asio::post(ioc, [this, &ioc, user, verb, text = utils::Join(args, " "), on_snapshot, reply]() {
        if (verb == "py") {
            AsyncRunCode(ioc, user, text, reply);
        } else {
            AsyncInstall(ioc, user, text, on_snapshot, reply);
        }
    });
}

}  // namespace sandkeep::commands
