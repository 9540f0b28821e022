#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <signal.h>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "commands/command_service.hpp"
#include "config/config_loader.hpp"
#include "sandbox/image_manager.hpp"
#include "sandbox/sandbox_error.hpp"
#include "session/session_store.hpp"
#include "utils/logging.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

struct Runtime {
    explicit Runtime(const sandkeep::config::Config& cfg)
        : config(cfg)
        , sessions(cfg.sessions.base_dir, cfg.sessions.retention_s)
        , engine(sandkeep::sandbox::EngineOptions{
              cfg.sandbox.runtime_binary,
              cfg.sandbox.image,
              cfg.sandbox.max_output_bytes,
              "py-sbx"})
        , installer(cfg.sandbox.runtime_binary, cfg.sandbox.image)
        , images(cfg.sandbox.runtime_binary, std::chrono::seconds(cfg.sandbox.pull_timeout_s))
        , service(config, sessions, engine, installer, images) {}

    const sandkeep::config::Config& config;
    sandkeep::session::SessionStore sessions;
    sandkeep::sandbox::ExecutionEngine engine;
    sandkeep::sandbox::InstallJobRunner installer;
    sandkeep::sandbox::ImageManager images;
    sandkeep::commands::CommandService service;
};

void PullOnStartup(const Runtime& runtime) {
    const auto& sandbox = runtime.config.sandbox;
    sandkeep::utils::LogInfo("config", std::string("echo_last_expr=") +
                                           (runtime.config.echo.echo_last_expr ? "true" : "false") +
                                           ", pull_on_startup=" + (sandbox.pull_on_startup ? "true" : "false") +
                                           ", image=" + sandbox.image);
    if (!sandbox.pull_on_startup) {
        return;
    }
    try {
        runtime.images.EnsureImage(sandbox.image, true);
        sandkeep::utils::LogInfo("image", "Docker image ready: " + sandbox.image);
    } catch (const sandkeep::sandbox::SandboxError& ex) {
        sandkeep::utils::LogWarn("image", "Unable to ensure Docker image '" + sandbox.image + "': " + ex.what());
    }
}

int RunGateway(Runtime& runtime) {
    PullOnStartup(runtime);

    // Every container run and install of the gateway shares this loop.
    boost::asio::io_context sandbox_ioc;
    auto sandbox_work = boost::asio::make_work_guard(sandbox_ioc);
    std::thread sandbox_thread([&sandbox_ioc]() { sandbox_ioc.run(); });

    httplib::Server http_server;
    http_server.Get("/health", [&runtime](const httplib::Request&, httplib::Response& res) {
        const nlohmann::json json = {{"reply", runtime.service.Health()}};
        res.set_content(json.dump(), "application/json");
    });
    http_server.Post("/command", [&runtime, &sandbox_ioc](const httplib::Request& req, httplib::Response& res) {
        const auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (!body.is_object() || !body.contains("user") || !body["user"].is_string() ||
            !body.contains("verb") || !body["verb"].is_string()) {
            res.status = 400;
            res.set_content(nlohmann::json{{"error", "expected {\"user\", \"verb\", \"args\"}"}}.dump(),
                            "application/json");
            return;
        }
        std::vector<std::string> args;
        if (body.contains("args") && body["args"].is_array()) {
            for (const auto& item : body["args"]) {
                if (item.is_string()) {
                    args.push_back(item.get<std::string>());
                }
            }
        }
        // Written from the sandbox loop; read here only after the reply arrived.
        auto snapshots = std::make_shared<nlohmann::json>(nlohmann::json::array());
        auto done = std::make_shared<std::promise<std::string>>();
        auto reply = done->get_future();
        runtime.service.AsyncDispatch(
            sandbox_ioc,
            body["user"].get<std::string>(),
            body["verb"].get<std::string>(),
            args,
            [snapshots](const std::string& snapshot) { snapshots->push_back(snapshot); },
            [done](std::string text) { done->set_value(std::move(text)); });
        nlohmann::json json = {{"reply", reply.get()}};
        if (!snapshots->empty()) {
            json["snapshots"] = std::move(*snapshots);
        }
        res.set_content(json.dump(), "application/json");
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);

    const auto host = runtime.config.gateway.host;
    const auto port = runtime.config.gateway.port;
    std::thread http_thread([&http_server, host, port]() {
        if (!http_server.listen(host, port)) {
            sandkeep::utils::LogError("gateway", "http server failed to listen on " + host + ":" +
                                                     std::to_string(port));
            g_running.store(false);
        }
    });

    std::cout << "sandkeep gateway listening on " << host << ":" << port
              << ". Press Ctrl+C to stop." << std::endl;
    while (g_running.load()) {
        if (g_signal != 0) {
            g_running.store(false);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    // Lets pending container removals finish before returning.
    sandbox_work.reset();
    if (sandbox_thread.joinable()) {
        sandbox_thread.join();
    }
    return 0;
}

int RunOnce(Runtime& runtime, int argc, char** argv) {
    const std::string user = argv[1];
    const std::string verb = argv[2];
    std::vector<std::string> args;
    for (int i = 3; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    if (verb == "py" || verb == "pip") {
        PullOnStartup(runtime);
    }
    const auto reply = runtime.service.Dispatch(user, verb, args, [](const std::string& snapshot) {
        std::cerr << snapshot << std::endl;
    });
    std::cout << reply << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    // A runtime that exits before draining stdin must surface as EPIPE.
    signal(SIGPIPE, SIG_IGN);
    const auto config = sandkeep::config::LoadConfig();
    sandkeep::utils::SetMinLogLevel(sandkeep::utils::ParseLogLevel(config.logging.level));
    Runtime runtime(config);

    if (argc >= 2 && std::string(argv[1]) == "gateway") {
        return RunGateway(runtime);
    }

    if (argc < 3) {
        std::cout << "Usage: sandkeep_cli gateway | sandkeep_cli <user> <verb> [args...]\n"
                  << sandkeep::commands::CommandService::Usage() << std::endl;
        return 1;
    }
    return RunOnce(runtime, argc, argv);
}
