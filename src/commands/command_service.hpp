#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "config/config_schema.hpp"
#include "echo/echo_rewriter.hpp"
#include "sandbox/execution_engine.hpp"
#include "sandbox/image_manager.hpp"
#include "sandbox/install_job.hpp"
#include "session/session_store.hpp"

namespace sandkeep::commands {

// The user-facing verbs. Every method answers with a short message and never
// lets an exception or internal detail escape to the caller.
class CommandService {
public:
    using ReplyHandler = std::function<void(std::string)>;
    using SnapshotHandler = std::function<void(const std::string&)>;

    CommandService(const config::Config& config,
                   session::SessionStore& sessions,
                   const sandbox::ExecutionEngine& engine,
                   const sandbox::InstallJobRunner& installer,
                   const sandbox::ImageManager& images);

    std::string Create(const std::string& user);
    std::string Delete(const std::string& user);
    std::string Health() const;

    std::string RunCode(const std::string& user, const std::string& raw_code);
    void AsyncRunCode(boost::asio::io_context& ioc,
                      const std::string& user,
                      const std::string& raw_code,
                      ReplyHandler reply);

    std::string Look(const std::string& user, const std::string& path = {}, std::size_t page = 0);
    std::string Write(const std::string& user, const std::string& name, const std::string& content);
    std::string Remove(const std::string& user, const std::string& name, bool recursive);
    std::string Cat(const std::string& user, const std::string& name);

    // `on_snapshot` sees the starting notice, throttled progress and the final
    // tail; the final tail is also the return value.
    std::string Install(const std::string& user, const std::string& packages, SnapshotHandler on_snapshot = {});
    void AsyncInstall(boost::asio::io_context& ioc,
                      const std::string& user,
                      const std::string& packages,
                      SnapshotHandler on_snapshot,
                      ReplyHandler reply);

    // Routes "<verb> args..." to the methods above.
    std::string Dispatch(const std::string& user,
                         const std::string& verb,
                         const std::vector<std::string>& args,
                         SnapshotHandler on_snapshot = {});

    // py and pip are posted to `ioc` and answered from there; every other verb
    // is answered before returning. The lazy image pull runs on the calling
    // thread so it never stalls `ioc`.
    void AsyncDispatch(boost::asio::io_context& ioc,
                       const std::string& user,
                       const std::string& verb,
                       const std::vector<std::string>& args,
                       SnapshotHandler on_snapshot,
                       ReplyHandler reply);

    static std::string Usage();

    static constexpr const char* kNoSession = "No sandbox found or it expired. Use create first.";

private:
    sandbox::ExecRequest BuildRequest(const std::string& user, const std::string& code) const;
    sandbox::ResourceLimits Limits() const;
    // Pulls the image on demand when it was not pulled at startup.
    void EnsureImageIfLazy() const;

    const config::Config& config_;
    session::SessionStore& sessions_;
    const sandbox::ExecutionEngine& engine_;
    const sandbox::InstallJobRunner& installer_;
    const sandbox::ImageManager& images_;
    echo::EchoRewriter rewriter_;
    mutable std::atomic<bool> image_ready_{false};
};

}  // namespace sandkeep::commands
