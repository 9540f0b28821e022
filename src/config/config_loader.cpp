#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandkeep::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".sandkeep" / "config.json";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

long long ParseLong(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ReadString(const nlohmann::json& object, const char* key, std::string& target) {
    if (object.contains(key) && object[key].is_string()) {
        target = object[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& object, const char* key, bool& target) {
    if (object.contains(key) && object[key].is_boolean()) {
        target = object[key].get<bool>();
    }
}

template <typename T>
void ReadNumber(const nlohmann::json& object, const char* key, T& target) {
    if (object.contains(key) && object[key].is_number()) {
        target = object[key].get<T>();
    }
}

}  // namespace

bool ParseBool(const std::string& value) {
    const auto trimmed = utils::Trim(value);
    return trimmed != "0" && utils::ToLower(trimmed) != "false";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "image", config.sandbox.image);
        ReadString(sandbox, "runtimeBinary", config.sandbox.runtime_binary);
        ReadBool(sandbox, "pullOnStartup", config.sandbox.pull_on_startup);
        ReadNumber(sandbox, "pullTimeoutS", config.sandbox.pull_timeout_s);
        ReadNumber(sandbox, "execTimeoutS", config.sandbox.exec_timeout_s);
        ReadNumber(sandbox, "installTimeoutS", config.sandbox.install_timeout_s);
        ReadString(sandbox, "memory", config.sandbox.memory);
        ReadString(sandbox, "cpus", config.sandbox.cpus);
        ReadNumber(sandbox, "pidsLimit", config.sandbox.pids_limit);
        if (sandbox.contains("maxOutputBytes") && sandbox["maxOutputBytes"].is_number_unsigned()) {
            config.sandbox.max_output_bytes = sandbox["maxOutputBytes"].get<std::size_t>();
        }
    }

    if (data.contains("sessions") && data["sessions"].is_object()) {
        const auto& sessions = data["sessions"];
        ReadString(sessions, "baseDir", config.sessions.base_dir);
        ReadNumber(sessions, "retentionS", config.sessions.retention_s);
    }

    if (data.contains("echo") && data["echo"].is_object()) {
        ReadBool(data["echo"], "lastExpr", config.echo.echo_last_expr);
    }

    if (data.contains("gateway") && data["gateway"].is_object()) {
        const auto& gateway = data["gateway"];
        ReadString(gateway, "host", config.gateway.host);
        ReadNumber(gateway, "port", config.gateway.port);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto image = GetEnvFallback("SANDKEEP_SANDBOX__IMAGE", "SANDBOX_IMAGE");
    if (!image.empty()) {
        config.sandbox.image = image;
    }

    const auto runtime = GetEnvFallback("SANDKEEP_SANDBOX__RUNTIME_BINARY", "DOCKER_BINARY");
    if (!runtime.empty()) {
        config.sandbox.runtime_binary = runtime;
    }

    const auto pull = GetEnvFallback("SANDKEEP_SANDBOX__PULL_ON_STARTUP", "SANDBOX_PULL_ON_STARTUP");
    if (!pull.empty()) {
        config.sandbox.pull_on_startup = ParseBool(pull);
    }

    const auto exec_timeout = GetEnvFallback("SANDKEEP_SANDBOX__EXEC_TIMEOUT_S", "IL_TIMEOUT_SECONDS");
    if (!exec_timeout.empty()) {
        config.sandbox.exec_timeout_s = ParseDouble(exec_timeout, config.sandbox.exec_timeout_s);
    }

    const auto install_timeout = GetEnvFallback(
        "SANDKEEP_SANDBOX__INSTALL_TIMEOUT_S",
        "IL_INSTALL_TIMEOUT_SECONDS");
    if (!install_timeout.empty()) {
        config.sandbox.install_timeout_s = ParseDouble(install_timeout, config.sandbox.install_timeout_s);
    }

    const auto memory = GetEnvFallback("SANDKEEP_SANDBOX__MEMORY", "IL_MEMORY");
    if (!memory.empty()) {
        config.sandbox.memory = memory;
    }

    const auto cpus = GetEnvFallback("SANDKEEP_SANDBOX__CPUS", "IL_CPUS");
    if (!cpus.empty()) {
        config.sandbox.cpus = cpus;
    }

    const auto pids = GetEnvFallback("SANDKEEP_SANDBOX__PIDS_LIMIT", "IL_PIDS_LIMIT");
    if (!pids.empty()) {
        config.sandbox.pids_limit = ParseInt(pids, config.sandbox.pids_limit);
    }

    const auto max_output = GetEnvFallback(
        "SANDKEEP_SANDBOX__MAX_OUTPUT_BYTES",
        "SANDBOX_MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        const auto value = ParseLong(max_output, -1);
        if (value > 0) {
            config.sandbox.max_output_bytes = static_cast<std::size_t>(value);
        }
    }

    const auto base_dir = GetEnvFallback("SANDKEEP_SESSIONS__BASE_DIR", "IL_BASE_DIR");
    if (!base_dir.empty()) {
        config.sessions.base_dir = base_dir;
    }

    const auto retention = GetEnvFallback("SANDKEEP_SESSIONS__RETENTION_S", "IL_RETENTION_SECONDS");
    if (!retention.empty()) {
        config.sessions.retention_s = ParseLong(retention, config.sessions.retention_s);
    }

    const auto echo = GetEnvFallback("SANDKEEP_ECHO__LAST_EXPR", "ECHO_LAST_EXPR");
    if (!echo.empty()) {
        config.echo.echo_last_expr = ParseBool(echo);
    }

    const auto gateway_host = GetEnv("SANDKEEP_GATEWAY__HOST");
    if (!gateway_host.empty()) {
        config.gateway.host = gateway_host;
    }

    const auto gateway_port = GetEnv("SANDKEEP_GATEWAY__PORT");
    if (!gateway_port.empty()) {
        config.gateway.port = ParseInt(gateway_port, config.gateway.port);
    }

    const auto log_level = GetEnvFallback("SANDKEEP_LOGGING__LEVEL", "SANDKEEP_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfigFrom(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "ignoring unreadable " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace sandkeep::config
