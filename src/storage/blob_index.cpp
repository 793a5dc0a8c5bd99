#include "ginseng/storage/blob_index.hpp"
#include "ginseng/core/logger.hpp"
#include "ginseng/core/utils.hpp"
#include <sqlite3.h>

namespace ginseng::storage {

BlobIndex::BlobIndex(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

BlobIndex::~BlobIndex() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool BlobIndex::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int result = sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open index {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }
    
    // Another node may be reading this index while we write to it
    sqlite3_busy_timeout(db_, 5000);
    
    return create_tables();
}

bool BlobIndex::create_tables() {
    const char* create_blobs_table = R"(
        CREATE TABLE IF NOT EXISTS blobs (
            blob_hash TEXT PRIMARY KEY,
            size INTEGER NOT NULL,
            created_at INTEGER NOT NULL
        );
    )";
    
    const char* create_shares_table = R"(
        CREATE TABLE IF NOT EXISTS shares (
            share_hash TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            share_type TEXT NOT NULL,
            total_size INTEGER NOT NULL,
            file_count INTEGER NOT NULL,
            manifest TEXT NOT NULL,
            created_at INTEGER NOT NULL
        );
    )";
    
    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_shares_created_at ON shares(created_at);
    )";
    
    for (const char* sql : {create_blobs_table, create_shares_table, create_indexes}) {
        char* error_msg = nullptr;
        int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
        if (result != SQLITE_OK) {
            LOG_ERROR("Failed to create index tables: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg);
            return false;
        }
    }
    
    return true;
}

bool BlobIndex::add_blob(const std::string& blob_hash, uint64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    
    const char* insert_sql = R"(
        INSERT OR REPLACE INTO blobs (blob_hash, size, created_at)
        VALUES (?, ?, ?);
    )";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return false;
    }
    
    auto now = core::utils::TimeUtils::unix_seconds(core::utils::TimeUtils::now());
    
    sqlite3_bind_text(stmt, 1, blob_hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(size));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(now));
    
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    return result == SQLITE_DONE;
}

bool BlobIndex::has_blob(const std::string& blob_hash) {
    return get_blob_size(blob_hash).has_value();
}

std::optional<uint64_t> BlobIndex::get_blob_size(const std::string& blob_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    
    const char* select_sql = "SELECT size FROM blobs WHERE blob_hash = ? LIMIT 1;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return std::nullopt;
    }
    
    sqlite3_bind_text(stmt, 1, blob_hash.c_str(), -1, SQLITE_STATIC);
    result = sqlite3_step(stmt);
    
    std::optional<uint64_t> size;
    if (result == SQLITE_ROW) {
        size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    
    return size;
}

core::TransferResult BlobIndex::remove_blob(const std::string& blob_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return core::TransferResult(core::TransferError::INVALID_STATE, "Index is not open");
    }
    
    const char* delete_sql = "DELETE FROM blobs WHERE blob_hash = ?;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return core::TransferResult(core::TransferError::IO_ERROR,
                                    "Failed to prepare delete statement");
    }
    
    sqlite3_bind_text(stmt, 1, blob_hash.c_str(), -1, SQLITE_STATIC);
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return core::TransferResult(core::TransferError::IO_ERROR,
                                    "Failed to remove blob from index");
    }
    return core::TransferResult();
}

bool BlobIndex::add_share(const std::string& share_hash, const std::string& manifest,
                          const ShareMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    
    const char* insert_sql = R"(
        INSERT OR REPLACE INTO shares
        (share_hash, name, share_type, total_size, file_count, manifest, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return false;
    }
    
    auto now = core::utils::TimeUtils::unix_seconds(core::utils::TimeUtils::now());
    
    sqlite3_bind_text(stmt, 1, share_hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, metadata.name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, to_string(metadata.share_type), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(metadata.total_size));
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(metadata.files.size()));
    sqlite3_bind_text(stmt, 6, manifest.c_str(), static_cast<int>(manifest.size()), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(now));
    
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    return result == SQLITE_DONE;
}

core::TransferResult BlobIndex::get_manifest(const std::string& share_hash, std::string& manifest) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return core::TransferResult(core::TransferError::INVALID_STATE, "Index is not open");
    }
    
    const char* select_sql = "SELECT manifest FROM shares WHERE share_hash = ?;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return core::TransferResult(core::TransferError::IO_ERROR,
                                    "Failed to prepare manifest query");
    }
    
    sqlite3_bind_text(stmt, 1, share_hash.c_str(), -1, SQLITE_STATIC);
    result = sqlite3_step(stmt);
    
    if (result != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return core::TransferResult(core::TransferError::METADATA_ERROR,
                                    "Share not found: " + share_hash);
    }
    
    const unsigned char* text = sqlite3_column_text(stmt, 0);
    int length = sqlite3_column_bytes(stmt, 0);
    manifest.assign(reinterpret_cast<const char*>(text), static_cast<size_t>(length));
    sqlite3_finalize(stmt);
    
    return core::TransferResult();
}

std::vector<ShareRecord> BlobIndex::list_shares() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ShareRecord> shares;
    if (!db_) {
        return shares;
    }
    
    const char* select_sql = R"(
        SELECT share_hash, name, share_type, total_size, file_count, created_at
        FROM shares ORDER BY created_at DESC;
    )";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return shares;
    }
    
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        ShareRecord record;
        record.share_hash = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        record.name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        auto type = share_type_from_string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)));
        record.share_type = type.value_or(ShareType::SINGLE_FILE);
        record.total_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
        record.file_count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        record.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
        shares.push_back(std::move(record));
    }
    
    sqlite3_finalize(stmt);
    return shares;
}

size_t BlobIndex::get_blob_count() {
    return static_cast<size_t>(query_count("SELECT COUNT(*) FROM blobs;"));
}

uint64_t BlobIndex::get_total_size() {
    return query_count("SELECT COALESCE(SUM(size), 0) FROM blobs;");
}

size_t BlobIndex::get_share_count() {
    return static_cast<size_t>(query_count("SELECT COUNT(*) FROM shares;"));
}

uint64_t BlobIndex::query_count(const char* sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return 0;
    }
    
    result = sqlite3_step(stmt);
    uint64_t value = (result == SQLITE_ROW) ? static_cast<uint64_t>(sqlite3_column_int64(stmt, 0)) : 0;
    sqlite3_finalize(stmt);
    
    return value;
}

} // namespace ginseng::storage
