#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "session/session_types.hpp"

namespace sandkeep::session {

// One workspace directory per owner under a base directory, each holding a
// .meta.json record. Expiry is lazy: it is detected when a session is next
// accessed. Concurrent requests for the same owner are not serialized and the
// last metadata write wins.
class SessionStore {
public:
    using Clock = std::function<double()>;

    static constexpr const char* kMetaFileName = ".meta.json";

    SessionStore(std::filesystem::path base_dir, long long retention_s, Clock clock = {});

    CreateStatus Create(const std::string& owner_id);
    bool Ensure(const std::string& owner_id);
    bool Delete(const std::string& owner_id);
    void Touch(const std::string& owner_id);

    bool SetCwd(const std::string& owner_id, const std::string& rel);
    std::string CurrentCwd(const std::string& owner_id) const;
    std::optional<std::filesystem::path> Resolve(const std::string& owner_id,
                                                 const std::string& rel) const;

    std::optional<Listing> List(const std::string& owner_id) const;
    FileOpStatus WriteFile(const std::string& owner_id,
                           const std::string& rel,
                           const std::string& content,
                           std::filesystem::path* written = nullptr);
    FileOpStatus Remove(const std::string& owner_id, const std::string& rel, bool recursive);
    std::optional<std::string> ReadFile(const std::string& owner_id, const std::string& rel) const;

    std::filesystem::path RootPath(const std::string& owner_id) const;
    std::optional<SessionMeta> LoadMeta(const std::string& owner_id) const;
    bool SaveMeta(const std::string& owner_id, const SessionMeta& meta);

    static bool IsValidOwnerId(const std::string& owner_id);

    // Files and symlinks are removed before directories, deepest first.
    // Errors are reported through the return value, never thrown.
    static bool RemoveTree(const std::filesystem::path& path);

private:
    std::filesystem::path MetaPath(const std::string& owner_id) const;
    double Now() const;

    std::filesystem::path base_dir_;
    long long retention_s_;
    Clock clock_;
};

}  // namespace sandkeep::session
