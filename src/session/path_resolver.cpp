#include "session/path_resolver.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace sandkeep::session {
namespace fs = std::filesystem;

std::string PathResolver::Normalize(const std::string& user_path) {
    std::string rel = utils::Trim(user_path);
    std::replace(rel.begin(), rel.end(), '\\', '/');
    const auto first = rel.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    return rel.substr(first);
}

bool PathResolver::IsContained(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++candidate_it) {
        // A trailing separator on root shows up as an empty component.
        if (root_it->empty()) {
            continue;
        }
        if (candidate_it == candidate.end() || *root_it != *candidate_it) {
            return false;
        }
    }
    return true;
}

std::optional<fs::path> PathResolver::Resolve(const fs::path& root,
                                              const std::string& cwd,
                                              const std::string& user_path) {
    std::error_code ec;
    const auto canonical_root = fs::canonical(root, ec);
    if (ec) {
        return std::nullopt;
    }
    fs::path joined = canonical_root;
    const auto cwd_rel = Normalize(cwd);
    if (!cwd_rel.empty()) {
        joined /= cwd_rel;
    }
    const auto rel = Normalize(user_path);
    if (!rel.empty()) {
        joined /= rel;
    }
    // ".." is folded before touching the filesystem. weakly_canonical only
    // follows symlinks in the existing prefix, so a "missing/../link" step
    // would otherwise skip resolving "link".
    joined = joined.lexically_normal();
    if (!joined.has_filename() && joined.has_relative_path()) {
        joined = joined.parent_path();
    }
    if (!IsContained(canonical_root, joined)) {
        return std::nullopt;
    }
    auto target = fs::weakly_canonical(joined, ec);
    if (ec) {
        return std::nullopt;
    }
    target = target.lexically_normal();
    if (!IsContained(canonical_root, target)) {
        return std::nullopt;
    }
    return target;
}

std::optional<std::string> PathResolver::ResolveDirectory(const fs::path& root,
                                                          const std::string& cwd,
                                                          const std::string& user_path) {
    const auto target = Resolve(root, cwd, user_path.empty() ? "." : user_path);
    if (!target) {
        return std::nullopt;
    }
    std::error_code ec;
    if (!fs::is_directory(*target, ec) || ec) {
        return std::nullopt;
    }
    const auto canonical_root = fs::canonical(root, ec);
    if (ec) {
        return std::nullopt;
    }
    if (*target == canonical_root) {
        return std::string(".");
    }
    const auto relative = target->lexically_relative(canonical_root).generic_string();
    if (relative.empty() || relative == ".") {
        return std::string(".");
    }
    return relative;
}

}  // namespace sandkeep::session
