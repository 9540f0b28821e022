#pragma once

#include <stdexcept>
#include <string>

namespace sandkeep::sandbox {

enum class SandboxErrc {
    kRuntimeUnavailable,
    kImageUnavailable,
    kLaunchFailed
};

// Setup-level failure: the run never produced a result. Timeouts and non-zero
// exits are reported through ExecResult instead.
class SandboxError : public std::runtime_error {
public:
    SandboxError(SandboxErrc code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    SandboxErrc Code() const { return code_; }

private:
    SandboxErrc code_;
};

}  // namespace sandkeep::sandbox
