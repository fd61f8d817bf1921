#pragma once

#include "upload_session.hpp"
#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>

struct sqlite3;

namespace chunkup::storage {

struct ResumableUpload {
    std::string upload_id;
    std::string file_name;
    std::uint64_t file_size;
    int progress;
    std::chrono::system_clock::time_point expires_at;
};

// Durable record of upload sessions keyed by upload id, plus the leases that keep
// two engines (in this or another process) off the same session.
class SessionStore {
public:
    explicit SessionStore(const std::filesystem::path& database_path);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    bool initialize();
    const std::filesystem::path& path() const { return db_path_; }

    bool save(const UploadSession& session);
    std::optional<UploadSession> load(const std::string& upload_id);
    // With an owner, refuses while another owner holds a live lease and only
    // drops the lease row when owner holds it.
    bool remove(const std::string& upload_id, const std::string& owner = {});

    // Sessions with expires_at > now, oldest first.
    std::vector<ResumableUpload> list_resumable(std::chrono::system_clock::time_point now);

    // Removes expired sessions and their leases; returns how many sessions went.
    size_t purge_expired(std::chrono::system_clock::time_point now);

    size_t count() const;

    // Succeeds when the lease is free, expired, or already held by owner (renewal).
    bool acquire_lease(const std::string& upload_id,
                       const std::string& owner,
                       std::chrono::system_clock::time_point now,
                       std::chrono::seconds duration);
    bool release_lease(const std::string& upload_id, const std::string& owner);
    std::optional<std::string> lease_holder(const std::string& upload_id,
                                            std::chrono::system_clock::time_point now);

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;

    bool create_tables();
    bool execute(const char* sql);

    static std::vector<std::uint8_t> serialize_chunks(const std::set<std::uint32_t>& chunks);
    static std::set<std::uint32_t> deserialize_chunks(const std::uint8_t* data, size_t size);
};

} // namespace chunkup::storage
