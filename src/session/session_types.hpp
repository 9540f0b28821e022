#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sandkeep::session {

struct SessionMeta {
    double created_at = 0.0;
    double last_used = 0.0;
    std::string cwd = ".";
};

enum class CreateStatus {
    kCreated,
    kAlreadyExists,
    kFailed
};

enum class FileOpStatus {
    kOk,
    kNoSession,
    kPathEscape,
    kNotFound,
    kDirectoryConflict,
    kNeedsRecursive,
    kIoFailure
};

struct DirEntry {
    std::string name;
    bool is_dir = false;
    std::uintmax_t size = 0;
};

struct Listing {
    std::string cwd = ".";
    std::vector<DirEntry> entries;
};

}  // namespace sandkeep::session
