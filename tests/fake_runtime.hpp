#pragma once

#include <filesystem>
#include <string>

namespace sandkeep::test_support {

// mkdtemp-backed directory removed with everything in it on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Writes an executable stand-in for the container runtime CLI into `dir`.
// Every invocation is appended to <dir>/calls.log. `run` reads the program
// from stdin and reacts to marker words in it:
//   SLEEP     never finishes
//   FLOOD     prints 5000 'x' bytes
//   FAIL      writes a traceback to stderr and exits 3
//   BADBYTES  prints an invalid UTF-8 byte
// anything else is echoed back verbatim. `pip install` runs print two lines
// per package; the package "slow-package" never finishes. `image inspect`
// fails while <dir>/image_missing exists, and `rm` takes three seconds while
// <dir>/rm_slow exists.
std::filesystem::path WriteFakeRuntime(const std::filesystem::path& dir);

std::string ReadCalls(const std::filesystem::path& dir);

void WriteText(const std::filesystem::path& path, const std::string& content);

}  // namespace sandkeep::test_support
