#include "session/session_store.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

#include "nlohmann/json.hpp"
#include "session/path_resolver.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandkeep::session {
namespace fs = std::filesystem;
namespace {

fs::path AbsoluteBase(const fs::path& base_dir) {
    std::error_code ec;
    auto absolute = fs::absolute(base_dir, ec);
    if (ec) {
        return base_dir.lexically_normal();
    }
    return absolute.lexically_normal();
}

bool ByDirThenName(const DirEntry& a, const DirEntry& b) {
    if (a.is_dir != b.is_dir) {
        return a.is_dir;
    }
    return utils::ToLower(a.name) < utils::ToLower(b.name);
}

bool IsMetaRecord(const fs::path& target, const fs::path& root) {
    std::error_code ec;
    const auto canonical_root = fs::canonical(root, ec);
    return !ec && target == canonical_root / SessionStore::kMetaFileName;
}

}  // namespace

SessionStore::SessionStore(fs::path base_dir, long long retention_s, Clock clock)
    : base_dir_(AbsoluteBase(base_dir))
    , retention_s_(retention_s)
    , clock_(std::move(clock)) {}

bool SessionStore::IsValidOwnerId(const std::string& owner_id) {
    if (owner_id.empty() || owner_id == "." || owner_id == "..") {
        return false;
    }
    return owner_id.find_first_of("/\\") == std::string::npos &&
           owner_id.find('\0') == std::string::npos;
}

double SessionStore::Now() const {
    return clock_ ? clock_() : utils::NowSeconds();
}

fs::path SessionStore::RootPath(const std::string& owner_id) const {
    return base_dir_ / owner_id;
}

fs::path SessionStore::MetaPath(const std::string& owner_id) const {
    return RootPath(owner_id) / kMetaFileName;
}

std::optional<SessionMeta> SessionStore::LoadMeta(const std::string& owner_id) const {
    if (!IsValidOwnerId(owner_id)) {
        return std::nullopt;
    }
    std::ifstream input(MetaPath(owner_id));
    if (!input.is_open()) {
        return std::nullopt;
    }
    const auto json = nlohmann::json::parse(input, nullptr, false);
    if (!json.is_object()) {
        return std::nullopt;
    }
    SessionMeta meta{};
    if (json.contains("created_at") && json["created_at"].is_number()) {
        meta.created_at = json["created_at"].get<double>();
    }
    if (json.contains("last_used") && json["last_used"].is_number()) {
        meta.last_used = json["last_used"].get<double>();
    } else {
        meta.last_used = meta.created_at;
    }
    // The record sits in the writable workspace; a future last_used counts as expired.
    if (meta.last_used > Now()) {
        utils::LogWarn("session", "metadata for " + owner_id + " has last_used in the future");
        meta.last_used = 0.0;
    }
    if (json.contains("cwd") && json["cwd"].is_string()) {
        const auto cwd = PathResolver::ResolveDirectory(RootPath(owner_id), ".", json["cwd"].get<std::string>());
        if (cwd) {
            meta.cwd = *cwd;
        } else {
            utils::LogWarn("session", "metadata for " + owner_id + " has an unusable cwd; using the root");
        }
    }
    return meta;
}

bool SessionStore::SaveMeta(const std::string& owner_id, const SessionMeta& meta) {
    if (!IsValidOwnerId(owner_id)) {
        return false;
    }
    std::error_code ec;
    fs::create_directories(RootPath(owner_id), ec);
    if (ec) {
        utils::LogError("session", "failed to create " + RootPath(owner_id).string() + ": " + ec.message());
        return false;
    }
    const nlohmann::json json = {
        {"created_at", meta.created_at},
        {"last_used", meta.last_used},
        {"cwd", meta.cwd}
    };
    std::ofstream output(MetaPath(owner_id), std::ios::trunc);
    if (!output.is_open()) {
        utils::LogError("session", "failed to write metadata for " + owner_id);
        return false;
    }
    output << json.dump();
    return static_cast<bool>(output);
}

CreateStatus SessionStore::Create(const std::string& owner_id) {
    if (!IsValidOwnerId(owner_id)) {
        return CreateStatus::kFailed;
    }
    if (Ensure(owner_id)) {
        return CreateStatus::kAlreadyExists;
    }
    const auto root = RootPath(owner_id);
    std::error_code ec;
    if (fs::exists(root, ec)) {
        // Leftover directory without usable metadata.
        if (!RemoveTree(root)) {
            return CreateStatus::kFailed;
        }
    }
    fs::create_directories(root, ec);
    if (ec) {
        utils::LogError("session", "failed to create " + root.string() + ": " + ec.message());
        return CreateStatus::kFailed;
    }
    const auto now = Now();
    SessionMeta meta{};
    meta.created_at = now;
    meta.last_used = now;
    meta.cwd = ".";
    if (!SaveMeta(owner_id, meta)) {
        return CreateStatus::kFailed;
    }
    utils::LogInfo("session", "created sandbox for " + owner_id);
    return CreateStatus::kCreated;
}

bool SessionStore::Ensure(const std::string& owner_id) {
    if (!IsValidOwnerId(owner_id)) {
        return false;
    }
    const auto root = RootPath(owner_id);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return false;
    }
    const auto meta = LoadMeta(owner_id);
    if (!meta) {
        return false;
    }
    if (Now() - meta->last_used > static_cast<double>(retention_s_)) {
        utils::LogInfo("session", "sandbox for " + owner_id + " expired; removing");
        RemoveTree(root);
        return false;
    }
    return true;
}

bool SessionStore::Delete(const std::string& owner_id) {
    if (!IsValidOwnerId(owner_id)) {
        return false;
    }
    const auto root = RootPath(owner_id);
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return false;
    }
    const bool removed = RemoveTree(root);
    if (removed) {
        utils::LogInfo("session", "deleted sandbox for " + owner_id);
    }
    return removed;
}

void SessionStore::Touch(const std::string& owner_id) {
    auto meta = LoadMeta(owner_id);
    if (!meta) {
        return;
    }
    meta->last_used = Now();
    SaveMeta(owner_id, *meta);
}

bool SessionStore::SetCwd(const std::string& owner_id, const std::string& rel) {
    auto meta = LoadMeta(owner_id);
    if (!meta) {
        return false;
    }
    // Navigation targets are relative to the session root, not to the current cwd.
    const auto target = PathResolver::ResolveDirectory(RootPath(owner_id), ".", rel);
    if (!target) {
        return false;
    }
    meta->cwd = *target;
    return SaveMeta(owner_id, *meta);
}

std::string SessionStore::CurrentCwd(const std::string& owner_id) const {
    const auto meta = LoadMeta(owner_id);
    return meta ? meta->cwd : std::string(".");
}

std::optional<fs::path> SessionStore::Resolve(const std::string& owner_id, const std::string& rel) const {
    if (!IsValidOwnerId(owner_id)) {
        return std::nullopt;
    }
    return PathResolver::Resolve(RootPath(owner_id), CurrentCwd(owner_id), rel);
}

std::optional<Listing> SessionStore::List(const std::string& owner_id) const {
    if (!IsValidOwnerId(owner_id)) {
        return std::nullopt;
    }
    const auto cwd = CurrentCwd(owner_id);
    const auto dir = PathResolver::Resolve(RootPath(owner_id), cwd, ".");
    if (!dir) {
        return std::nullopt;
    }
    Listing listing{};
    listing.cwd = cwd;
    std::error_code ec;
    for (fs::directory_iterator it(*dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (IsMetaRecord(it->path(), RootPath(owner_id))) {
            continue;
        }
        DirEntry entry{};
        entry.name = it->path().filename().string();
        std::error_code stat_ec;
        entry.is_dir = it->is_directory(stat_ec);
        if (!entry.is_dir) {
            const auto size = it->file_size(stat_ec);
            entry.size = stat_ec ? 0 : size;
        }
        listing.entries.push_back(std::move(entry));
    }
    if (ec) {
        utils::LogWarn("session", "listing " + dir->string() + " failed: " + ec.message());
        return std::nullopt;
    }
    std::sort(listing.entries.begin(), listing.entries.end(), ByDirThenName);
    return listing;
}

FileOpStatus SessionStore::WriteFile(const std::string& owner_id,
                                     const std::string& rel,
                                     const std::string& content,
                                     fs::path* written) {
    if (!LoadMeta(owner_id)) {
        return FileOpStatus::kNoSession;
    }
    const auto target = Resolve(owner_id, rel);
    if (!target || IsMetaRecord(*target, RootPath(owner_id))) {
        return FileOpStatus::kPathEscape;
    }
    std::error_code ec;
    if (fs::is_directory(*target, ec)) {
        return FileOpStatus::kDirectoryConflict;
    }
    fs::create_directories(target->parent_path(), ec);
    if (ec) {
        return FileOpStatus::kIoFailure;
    }
    std::ofstream output(*target, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        return FileOpStatus::kIoFailure;
    }
    output.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!output) {
        return FileOpStatus::kIoFailure;
    }
    if (written) {
        *written = *target;
    }
    return FileOpStatus::kOk;
}

FileOpStatus SessionStore::Remove(const std::string& owner_id, const std::string& rel, bool recursive) {
    if (!LoadMeta(owner_id)) {
        return FileOpStatus::kNoSession;
    }
    const auto target = Resolve(owner_id, rel);
    if (!target) {
        return FileOpStatus::kPathEscape;
    }
    std::error_code ec;
    const auto root = fs::canonical(RootPath(owner_id), ec);
    if (ec || *target == root || IsMetaRecord(*target, root)) {
        return FileOpStatus::kPathEscape;
    }
    const auto status = fs::symlink_status(*target, ec);
    if (ec || !fs::exists(status)) {
        return FileOpStatus::kNotFound;
    }
    if (fs::is_directory(status)) {
        if (!recursive) {
            return FileOpStatus::kNeedsRecursive;
        }
        return RemoveTree(*target) ? FileOpStatus::kOk : FileOpStatus::kIoFailure;
    }
    fs::remove(*target, ec);
    return ec ? FileOpStatus::kIoFailure : FileOpStatus::kOk;
}

std::optional<std::string> SessionStore::ReadFile(const std::string& owner_id, const std::string& rel) const {
    const auto target = Resolve(owner_id, rel);
    if (!target) {
        return std::nullopt;
    }
    std::ifstream input(*target, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

bool SessionStore::RemoveTree(const fs::path& path) {
    std::error_code ec;
    std::vector<fs::path> files;
    std::vector<fs::path> dirs;
    for (fs::recursive_directory_iterator it(path, fs::directory_options::none, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_symlink(entry_ec) || !it->is_directory(entry_ec)) {
            files.push_back(it->path());
        } else {
            dirs.push_back(it->path());
        }
    }
    if (ec) {
        utils::LogWarn("session", "walking " + path.string() + " failed: " + ec.message());
        return false;
    }
    bool ok = true;
    for (const auto& file : files) {
        fs::remove(file, ec);
        if (ec) {
            utils::LogWarn("session", "failed to remove " + file.string() + ": " + ec.message());
            ok = false;
        }
    }
    // Pre-order walk: reversing puts every child before its parent.
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
        fs::remove(*it, ec);
        if (ec) {
            utils::LogWarn("session", "failed to remove " + it->string() + ": " + ec.message());
            ok = false;
        }
    }
    fs::remove(path, ec);
    if (ec) {
        utils::LogWarn("session", "failed to remove " + path.string() + ": " + ec.message());
        ok = false;
    }
    return ok;
}

}  // namespace sandkeep::session
