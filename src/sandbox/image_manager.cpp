#include "sandbox/image_manager.hpp"

#include <boost/process.hpp>
#include <system_error>
#include <vector>
#include <unistd.h>

#include "sandbox/sandbox_error.hpp"
#include "utils/logging.hpp"

namespace sandkeep::sandbox {
namespace bp = boost::process;
namespace {

// Runs the runtime CLI with output discarded; -1 when it outlives `timeout`.
int RunQuiet(const std::string& runtime,
             const std::vector<std::string>& args,
             std::chrono::seconds timeout) {
    std::error_code ec;
    bp::child child(bp::exe = runtime, bp::args = args,
                    bp::std_out > bp::null, bp::std_err > bp::null, bp::std_in < bp::null, ec);
    if (ec) {
        throw SandboxError(SandboxErrc::kRuntimeUnavailable,
                           "Failed to start '" + runtime + "': " + ec.message());
    }
    if (!child.wait_for(timeout, ec)) {
        child.terminate(ec);
        return -1;
    }
    if (ec) {
        throw SandboxError(SandboxErrc::kRuntimeUnavailable,
                           "Failed to wait for '" + runtime + "': " + ec.message());
    }
    return child.exit_code();
}

}  // namespace

std::string LocateRuntime(const std::string& binary) {
    if (binary.find('/') != std::string::npos) {
        if (::access(binary.c_str(), X_OK) == 0) {
            return binary;
        }
    } else {
        const auto found = bp::search_path(binary);
        if (!found.empty()) {
            return found.string();
        }
    }
    throw SandboxError(SandboxErrc::kRuntimeUnavailable,
                       "Docker binary '" + binary + "' not found. Install Docker and ensure it's on PATH.");
}

ImageManager::ImageManager(std::string runtime_binary, std::chrono::seconds pull_timeout)
    : runtime_binary_(std::move(runtime_binary))
    , pull_timeout_(pull_timeout) {}

void ImageManager::EnsureImage(const std::string& image, bool pull) const {
    const auto runtime = LocateRuntime(runtime_binary_);
    const auto inspected = RunQuiet(runtime, {"image", "inspect", image}, std::chrono::seconds(30));
    if (inspected == 0) {
        return;
    }
    if (inspected < 0) {
        throw SandboxError(SandboxErrc::kRuntimeUnavailable,
                           "Timed out inspecting Docker image '" + image + "'.");
    }
    if (!pull) {
        throw SandboxError(SandboxErrc::kImageUnavailable,
                           "Docker image '" + image + "' not found locally and pulling is disabled.");
    }
    utils::LogInfo("image", "pulling " + image);
    const auto pulled = RunQuiet(runtime, {"pull", image}, pull_timeout_);
    if (pulled < 0) {
        throw SandboxError(SandboxErrc::kImageUnavailable,
                           "Timed out pulling Docker image '" + image + "'. Try pulling manually.");
    }
    if (pulled != 0) {
        throw SandboxError(SandboxErrc::kImageUnavailable,
                           "Docker failed to pull image '" + image + "'. Check Docker connectivity.");
    }
}

std::string ImageManager::Health(const std::string& image) const {
    try {
        EnsureImage(image, false);
        return "Docker reachable. Image present: " + image;
    } catch (const SandboxError& ex) {
        return std::string("Sandbox not ready: ") + ex.what();
    }
}

}  // namespace sandkeep::sandbox
