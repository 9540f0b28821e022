#pragma once

#include <chrono>
#include <string>

namespace sandkeep::sandbox {

// Absolute path of the container runtime CLI. `binary` may be a bare name
// looked up on PATH or an explicit path. Throws SandboxError when missing.
std::string LocateRuntime(const std::string& binary);

class ImageManager {
public:
    ImageManager(std::string runtime_binary, std::chrono::seconds pull_timeout = std::chrono::seconds(300));

    // Inspects the image and pulls it when absent and `pull` is set.
    // Throws SandboxError(kRuntimeUnavailable | kImageUnavailable).
    void EnsureImage(const std::string& image, bool pull) const;

    // One line suitable for a user-facing health reply.
    std::string Health(const std::string& image) const;

private:
    std::string runtime_binary_;
    std::chrono::seconds pull_timeout_;
};

}  // namespace sandkeep::sandbox
