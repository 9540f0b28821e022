#pragma once

#include <cstddef>
#include <string>

namespace sandkeep::config {

struct SandboxConfig {
    std::string image = "python:3.11-alpine";
    std::string runtime_binary = "docker";
    bool pull_on_startup = true;
    int pull_timeout_s = 300;
    double exec_timeout_s = 30.0;
    // 0 keeps an install running until pip exits.
    double install_timeout_s = 600.0;
    std::string memory = "256m";
    std::string cpus = "1.0";
    int pids_limit = 64;
    std::size_t max_output_bytes = 100000;
};

struct SessionsConfig {
    std::string base_dir = "./il_sandboxes";
    long long retention_s = 7LL * 24 * 3600;
};

struct EchoConfig {
    bool echo_last_expr = true;
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    SessionsConfig sessions;
    EchoConfig echo;
    GatewayConfig gateway;
    LoggingConfig logging;
};

}  // namespace sandkeep::config
