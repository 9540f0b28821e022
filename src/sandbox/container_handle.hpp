#pragma once

#include <string>

#include <boost/asio/io_context.hpp>

namespace sandkeep::sandbox {

// "<prefix>-" followed by 12 random hex characters.
std::string GenerateContainerName(const std::string& prefix);

// Owns one named container for the duration of a run. Unless Release() or
// ForceRemoveAsync() was called, the destructor force-removes the container;
// failures of the removal are logged and otherwise ignored.
class ContainerHandle {
public:
    ContainerHandle(std::string runtime, std::string name);
    ~ContainerHandle();

    ContainerHandle(const ContainerHandle&) = delete;
    ContainerHandle& operator=(const ContainerHandle&) = delete;

    const std::string& Name() const { return name_; }

    // The runtime removed the container itself (--rm) on a normal exit.
    void Release() { released_ = true; }

    // Unconditional blocking `rm -f`, bounded at ten seconds.
    void ForceRemove();

    // Starts `rm -f` on `ioc` and returns at once. The removal is killed if it
    // has not finished within ten seconds.
    void ForceRemoveAsync(boost::asio::io_context& ioc);

private:
    std::string runtime_;
    std::string name_;
    bool released_ = false;
};

}  // namespace sandkeep::sandbox
