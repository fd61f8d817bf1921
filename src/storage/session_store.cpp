#include "chunkup/storage/session_store.hpp"
#include "chunkup/core/logger.hpp"
#include "chunkup/core/utils.hpp"
#include <sqlite3.h>

namespace chunkup::storage {

using core::utils::TimeUtils;

SessionStore::SessionStore(const std::filesystem::path& database_path)
    : db_path_(database_path), db_(nullptr) {
}

SessionStore::~SessionStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SessionStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        return true;
    }

    auto parent = db_path_.parent_path();
    if (!parent.empty() && !core::utils::FileUtils::create_directories(parent)) {
        LOG_ERROR("Cannot create directory for session store: {}", parent.string());
        return false;
    }

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open session store {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, 2000);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_DEBUG("Session store ready at {}", db_path_.string());
    return true;
}

bool SessionStore::execute(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Session store statement failed: {}", error_msg ? error_msg : sqlite3_errstr(result));
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

bool SessionStore::create_tables() {
    const char* create_sessions_table = R"(
        CREATE TABLE IF NOT EXISTS upload_sessions (
            upload_id TEXT PRIMARY KEY,
            file_name TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            file_type TEXT NOT NULL,
            chunk_size INTEGER NOT NULL,
            total_chunks INTEGER NOT NULL,
            uploaded_chunks BLOB,
            start_time INTEGER NOT NULL,
            expires_at INTEGER NOT NULL,
            status TEXT NOT NULL
        );
    )";

    const char* create_leases_table = R"(
        CREATE TABLE IF NOT EXISTS session_leases (
            upload_id TEXT PRIMARY KEY,
            owner TEXT NOT NULL,
            expires_at INTEGER NOT NULL
        );
    )";

    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_sessions_expires_at ON upload_sessions(expires_at);
    )";

    return execute(create_sessions_table) &&
           execute(create_leases_table) &&
           execute(create_indexes);
}

bool SessionStore::save(const UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* upsert_sql = R"(
        INSERT OR REPLACE INTO upload_sessions
        (upload_id, file_name, file_size, file_type, chunk_size, total_chunks,
         uploaded_chunks, start_time, expires_at, status)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, upsert_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to prepare session save: {}", sqlite3_errmsg(db_));
        return false;
    }

    auto chunks = serialize_chunks(session.uploaded_chunks);
    auto status = to_string(session.status);

    sqlite3_bind_text(stmt, 1, session.upload_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, session.file_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(session.file_size));
    sqlite3_bind_text(stmt, 4, session.file_type.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(session.chunk_size));
    sqlite3_bind_int64(stmt, 6, session.total_chunks);
    sqlite3_bind_blob(stmt, 7, chunks.data(), static_cast<int>(chunks.size()), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 8, TimeUtils::to_unix_ms(session.start_time));
    sqlite3_bind_int64(stmt, 9, TimeUtils::to_unix_ms(session.expires_at));
    sqlite3_bind_text(stmt, 10, status.c_str(), -1, SQLITE_STATIC);

    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        LOG_ERROR("Failed to save session {}: {}", session.upload_id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<UploadSession> SessionStore::load(const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return std::nullopt;

    const char* select_sql = R"(
        SELECT file_name, file_size, file_type, chunk_size, total_chunks,
               uploaded_chunks, start_time, expires_at, status
        FROM upload_sessions WHERE upload_id = ?;
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare session load: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, upload_id.c_str(), -1, SQLITE_STATIC);

    std::optional<UploadSession> loaded;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        UploadSession session;
        session.upload_id = upload_id;
        session.file_name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        session.file_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
        session.file_type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        session.chunk_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 3));
        session.total_chunks = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 4));

        auto blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, 5));
        auto blob_size = static_cast<size_t>(sqlite3_column_bytes(stmt, 5));
        for (auto index : deserialize_chunks(blob, blob_size)) {
            if (!session.mark_chunk_uploaded(index)) {
                LOG_WARN("Dropping out-of-range chunk {} from stored session {}", index, upload_id);
            }
        }

        session.start_time = TimeUtils::from_unix_ms(sqlite3_column_int64(stmt, 6));
        session.expires_at = TimeUtils::from_unix_ms(sqlite3_column_int64(stmt, 7));

        std::string status = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 8));
        auto parsed = status_from_string(status);
        if (!parsed) {
            LOG_WARN("Unknown status '{}' for stored session {}, treating as paused", status, upload_id);
        }
        session.status = parsed.value_or(UploadStatus::PAUSED);

        loaded = std::move(session);
    }

    sqlite3_finalize(stmt);
    return loaded;
}

bool SessionStore::remove(const std::string& upload_id, const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    if (!owner.empty()) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_,
                "SELECT owner FROM session_leases WHERE upload_id = ? AND owner <> ? AND expires_at > ?;",
                -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR("Failed to prepare lease check: {}", sqlite3_errmsg(db_));
            return false;
        }

        sqlite3_bind_text(stmt, 1, upload_id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 3, TimeUtils::to_unix_ms(std::chrono::system_clock::now()));

        bool held_elsewhere = sqlite3_step(stmt) == SQLITE_ROW;
        sqlite3_finalize(stmt);

        if (held_elsewhere) {
            LOG_WARN("Not removing session {}: leased by another owner", upload_id);
            return false;
        }
    }

    const char* statements[] = {
        "DELETE FROM upload_sessions WHERE upload_id = ?1;",
        owner.empty() ? "DELETE FROM session_leases WHERE upload_id = ?1;"
                      : "DELETE FROM session_leases WHERE upload_id = ?1 AND owner = ?2;"
    };

    for (const char* sql : statements) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR("Failed to prepare session delete: {}", sqlite3_errmsg(db_));
            return false;
        }

        sqlite3_bind_text(stmt, 1, upload_id.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_bind_parameter_count(stmt) > 1) {
            sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_STATIC);
        }
        int result = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (result != SQLITE_DONE) {
            LOG_ERROR("Failed to delete session {}: {}", upload_id, sqlite3_errmsg(db_));
            return false;
        }
    }

    return true;
}

std::vector<ResumableUpload> SessionStore::list_resumable(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResumableUpload> uploads;
    if (!db_) return uploads;

    const char* select_sql = R"(
        SELECT upload_id, file_name, file_size, chunk_size, total_chunks, uploaded_chunks, expires_at
        FROM upload_sessions WHERE expires_at > ? ORDER BY start_time ASC;
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare resumable listing: {}", sqlite3_errmsg(db_));
        return uploads;
    }

    sqlite3_bind_int64(stmt, 1, TimeUtils::to_unix_ms(now));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        UploadSession session;
        session.upload_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        session.file_name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        session.file_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 2));
        session.chunk_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 3));
        session.total_chunks = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 4));

        auto blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, 5));
        auto blob_size = static_cast<size_t>(sqlite3_column_bytes(stmt, 5));
        for (auto index : deserialize_chunks(blob, blob_size)) {
            session.mark_chunk_uploaded(index);
        }

        uploads.push_back(ResumableUpload{
            session.upload_id,
            session.file_name,
            session.file_size,
            session.percentage(),
            TimeUtils::from_unix_ms(sqlite3_column_int64(stmt, 6))
        });
    }

    sqlite3_finalize(stmt);
    return uploads;
}

size_t SessionStore::purge_expired(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    const char* delete_sessions_sql = "DELETE FROM upload_sessions WHERE expires_at <= ?;";
    const char* delete_leases_sql =
        "DELETE FROM session_leases WHERE upload_id NOT IN (SELECT upload_id FROM upload_sessions);";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, delete_sessions_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare expiry purge: {}", sqlite3_errmsg(db_));
        return 0;
    }

    sqlite3_bind_int64(stmt, 1, TimeUtils::to_unix_ms(now));
    int result = sqlite3_step(stmt);
    size_t removed = result == SQLITE_DONE ? static_cast<size_t>(sqlite3_changes(db_)) : 0;
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        LOG_ERROR("Failed to purge expired sessions: {}", sqlite3_errmsg(db_));
        return 0;
    }

    execute(delete_leases_sql);

    if (removed > 0) {
        LOG_INFO("Purged {} expired upload session(s)", removed);
    }
    return removed;
}

size_t SessionStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM upload_sessions;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

bool SessionStore::acquire_lease(const std::string& upload_id,
                                 const std::string& owner,
                                 std::chrono::system_clock::time_point now,
                                 std::chrono::seconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* acquire_sql = R"(
        INSERT INTO session_leases (upload_id, owner, expires_at) VALUES (?1, ?2, ?3)
        ON CONFLICT(upload_id) DO UPDATE SET owner = excluded.owner, expires_at = excluded.expires_at
        WHERE session_leases.owner = excluded.owner OR session_leases.expires_at <= ?4;
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, acquire_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare lease acquire: {}", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, upload_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, TimeUtils::to_unix_ms(now + duration));
    sqlite3_bind_int64(stmt, 4, TimeUtils::to_unix_ms(now));

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        LOG_ERROR("Failed to acquire lease on {}: {}", upload_id, sqlite3_errmsg(db_));
        return false;
    }

    return sqlite3_changes(db_) > 0;
}

bool SessionStore::release_lease(const std::string& upload_id, const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "DELETE FROM session_leases WHERE upload_id = ? AND owner = ?;",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare lease release: {}", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, upload_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_STATIC);

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return result == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

std::optional<std::string> SessionStore::lease_holder(const std::string& upload_id,
                                                      std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return std::nullopt;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT owner FROM session_leases WHERE upload_id = ? AND expires_at > ?;",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, upload_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, TimeUtils::to_unix_ms(now));

    std::optional<std::string> holder;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        holder = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return holder;
}

// Big-endian uint32 per completed index.
std::vector<std::uint8_t> SessionStore::serialize_chunks(const std::set<std::uint32_t>& chunks) {
    std::vector<std::uint8_t> data;
    data.reserve(chunks.size() * 4);
    for (auto index : chunks) {
        data.push_back((index >> 24) & 0xFF);
        data.push_back((index >> 16) & 0xFF);
        data.push_back((index >> 8) & 0xFF);
        data.push_back(index & 0xFF);
    }
    return data;
}

std::set<std::uint32_t> SessionStore::deserialize_chunks(const std::uint8_t* data, size_t size) {
    std::set<std::uint32_t> chunks;
    if (!data) return chunks;

    for (size_t offset = 0; offset + 4 <= size; offset += 4) {
        chunks.insert((static_cast<std::uint32_t>(data[offset]) << 24) |
                      (static_cast<std::uint32_t>(data[offset + 1]) << 16) |
                      (static_cast<std::uint32_t>(data[offset + 2]) << 8) |
                      static_cast<std::uint32_t>(data[offset + 3]));
    }
    return chunks;
}

} // namespace chunkup::storage
