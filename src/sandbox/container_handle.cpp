#include "sandbox/container_handle.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/process.hpp>
#include <chrono>
#include <memory>
#include <random>
#include <system_error>
#include <vector>

#include "utils/logging.hpp"

namespace sandkeep::sandbox {
namespace bp = boost::process;
namespace {

constexpr std::chrono::seconds kRemoveTimeout{10};

struct Removal {
    Removal(boost::asio::io_context& ioc, std::string container)
        : timer(ioc)
        , name(std::move(container)) {}

    bp::child child;
    boost::asio::steady_timer timer;
    std::string name;
    bool done = false;
};

}  // namespace

std::string GenerateContainerName(const std::string& prefix) {
    static const char* kChars = "0123456789abcdef";
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    std::string name = prefix + "-";
    for (int i = 0; i < 12; ++i) {
        name.push_back(kChars[dist(gen)]);
    }
    return name;
}

ContainerHandle::ContainerHandle(std::string runtime, std::string name)
    : runtime_(std::move(runtime))
    , name_(std::move(name)) {}

ContainerHandle::~ContainerHandle() {
    if (!released_) {
        ForceRemove();
    }
}

void ContainerHandle::ForceRemove() {
    released_ = true;
    std::error_code ec;
    bp::child child(bp::exe = runtime_, bp::args = std::vector<std::string>{"rm", "-f", name_},
                    bp::std_out > bp::null, bp::std_err > bp::null, bp::std_in < bp::null, ec);
    if (ec) {
        utils::LogWarn("sandbox", "rm -f " + name_ + " failed to start: " + ec.message());
        return;
    }
    if (!child.wait_for(kRemoveTimeout, ec)) {
        child.terminate(ec);
        utils::LogWarn("sandbox", "rm -f " + name_ + " did not finish in time");
        return;
    }
    utils::LogDebug("sandbox", "removed container " + name_);
}

void ContainerHandle::ForceRemoveAsync(boost::asio::io_context& ioc) {
    released_ = true;
    auto removal = std::make_shared<Removal>(ioc, name_);
    std::error_code ec;
    removal->child = bp::child(
        bp::exe = runtime_,
        bp::args = std::vector<std::string>{"rm", "-f", name_},
        bp::std_out > bp::null,
        bp::std_err > bp::null,
        bp::std_in < bp::null,
        ioc,
        bp::on_exit([removal](int exit_code, const std::error_code& exit_ec) {
            // Already reaped by terminate() after the removal deadline.
            if (removal->done) {
                return;
            }
            removal->done = true;
            removal->timer.cancel();
            if (exit_ec) {
                utils::LogWarn("sandbox", "waiting for rm -f " + removal->name + " failed: " + exit_ec.message());
                return;
            }
            utils::LogDebug("sandbox", "rm -f " + removal->name + " exited with " + std::to_string(exit_code));
        }),
        ec);
    if (ec) {
        utils::LogWarn("sandbox", "rm -f " + name_ + " failed to start: " + ec.message());
        return;
    }
    removal->timer.expires_after(kRemoveTimeout);
    removal->timer.async_wait([removal](const boost::system::error_code& timer_ec) {
        if (timer_ec || removal->done) {
            return;
        }
        removal->done = true;
        std::error_code term_ec;
        removal->child.terminate(term_ec);
        utils::LogWarn("sandbox", "rm -f " + removal->name + " did not finish in time");
    });
}

}  // namespace sandkeep::sandbox
