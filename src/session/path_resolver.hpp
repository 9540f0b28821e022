#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sandkeep::session {

// Normalizes user supplied paths and keeps them inside a session root.
class PathResolver {
public:
    // Leading separators are treated as relative to the session root and
    // backslashes are accepted as separators. The containment check runs on
    // the canonical path, so ".." segments and symlinks cannot leave the root.
    static std::optional<std::filesystem::path> Resolve(const std::filesystem::path& root,
                                                        const std::string& cwd,
                                                        const std::string& user_path);

    // Canonical target relative to root ("." for the root itself), or nullopt
    // when it escapes, does not exist, or is not a directory.
    static std::optional<std::string> ResolveDirectory(const std::filesystem::path& root,
                                                       const std::string& cwd,
                                                       const std::string& user_path);

    static bool IsContained(const std::filesystem::path& root, const std::filesystem::path& candidate);

    static std::string Normalize(const std::string& user_path);
};

}  // namespace sandkeep::session
