#ifndef CHUNKWORKER_STORAGE_SNAPSHOT_STORE_HPP
#define CHUNKWORKER_STORAGE_SNAPSHOT_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <sqlite3.h>
#include "core/chunk_identity.hpp"
#include "core/chunk_registry.hpp"
#include "util/json_map.hpp"
#include "util/logger.hpp"

namespace chunkworker {
namespace storage {

/*
  SnapshotStore
  --------------------------------
  Durable copy of the whole chunk registry, one SQLite file at a fixed path.

  Table layout (one row per entry):
    chunks(id TEXT PRIMARY KEY,   -- hex chunk id
           dataset_id TEXT,       -- hex dataset id
           block_start INTEGER,   -- uint64 stored as its int64 bit pattern
           block_end INTEGER,
           files TEXT,            -- JSON object {"name":"url",...}
           status TEXT)           -- Downloading | Ready | Deleting | Deleted

  save() writes a fresh database next to the target and renames it over the
  previous one, so a reader never sees a half-written snapshot.
  load() on a missing file returns no entries (first start).
  Every failure throws SnapshotError.
*/

class SnapshotError : public std::runtime_error
{
public:
    explicit SnapshotError(const std::string &what) : std::runtime_error(what) {}
};

class SnapshotStore
{
public:
    explicit SnapshotStore(std::string path)
        : m_path(std::move(path))
    {
        if (m_path.empty()) {
            throw std::invalid_argument("SnapshotStore: empty snapshot path");
        }
    }

    const std::string& path() const { return m_path; }

    // -------------------------------------------------------------------------
    // Replace the snapshot with the given entries.
    // -------------------------------------------------------------------------
    void save(const std::vector<core::ChunkStateEntry>& entries) const
    {
        namespace fs = std::filesystem;

        const fs::path target(m_path);
        const std::string tmpPath = m_path + ".tmp";

        std::error_code ec;
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                throw SnapshotError("[SnapshotStore] cannot create directory " +
                                    target.parent_path().string() + ": " + ec.message());
            }
        }
        fs::remove(tmpPath, ec);

        try {
            DbHandle db = openDatabase(tmpPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
            exec(db.get(), "CREATE TABLE chunks ("
                           " id TEXT PRIMARY KEY,"
                           " dataset_id TEXT NOT NULL,"
                           " block_start INTEGER NOT NULL,"
                           " block_end INTEGER NOT NULL,"
                           " files TEXT NOT NULL,"
                           " status TEXT NOT NULL"
                           ");");
            exec(db.get(), "BEGIN TRANSACTION;");

            StmtHandle stmt = prepare(db.get(),
                "INSERT INTO chunks (id, dataset_id, block_start, block_end, files, status)"
                " VALUES (?, ?, ?, ?, ?, ?);");

            for (const auto& entry : entries) {
                insertEntry(db.get(), stmt.get(), entry);
            }
            stmt.reset();

            exec(db.get(), "COMMIT;");
        } catch (...) {
            fs::remove(tmpPath, ec);
            throw;
        }

        fs::rename(tmpPath, target, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmpPath, ignored);
            throw SnapshotError("[SnapshotStore] cannot replace " + m_path + ": " + ec.message());
        }

        util::logger::debug("[SnapshotStore] Saved " + std::to_string(entries.size()) +
                            " entries to " + m_path);
    }

    // -------------------------------------------------------------------------
    // Read every entry of the snapshot. Missing file -> empty result.
    // -------------------------------------------------------------------------
    std::vector<core::ChunkStateEntry> load() const
    {
        std::error_code ec;
        if (!std::filesystem::exists(m_path, ec)) {
            if (ec) {
                throw SnapshotError("[SnapshotStore] cannot stat " + m_path + ": " + ec.message());
            }
            util::logger::info("[SnapshotStore] No snapshot at " + m_path + ", starting empty.");
            return {};
        }

        DbHandle db = openDatabase(m_path, SQLITE_OPEN_READONLY);
        StmtHandle stmt = prepare(db.get(),
            "SELECT id, dataset_id, block_start, block_end, files, status FROM chunks;");

        std::vector<core::ChunkStateEntry> entries;
        while (true) {
            int rc = sqlite3_step(stmt.get());
            if (rc == SQLITE_DONE) {
                break;
            }
            if (rc != SQLITE_ROW) {
                throw SnapshotError("[SnapshotStore] read failed: " +
                                    std::string(sqlite3_errmsg(db.get())));
            }
            entries.push_back(readRow(stmt.get()));
        }

        util::logger::info("[SnapshotStore] Loaded " + std::to_string(entries.size()) +
                           " entries from " + m_path);
        return entries;
    }

private:
    struct DbCloser {
        void operator()(sqlite3* db) const { sqlite3_close(db); }
    };
    struct StmtFinalizer {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using DbHandle = std::unique_ptr<sqlite3, DbCloser>;
    using StmtHandle = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

    static DbHandle openDatabase(const std::string& path, int flags)
    {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
        DbHandle db(raw);
        if (rc != SQLITE_OK || !db) {
            std::string msg = db ? sqlite3_errmsg(db.get()) : sqlite3_errstr(rc);
            throw SnapshotError("[SnapshotStore] Could not open database " + path + ": " + msg);
        }
        return db;
    }

    static void exec(sqlite3* db, const char* sql)
    {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            std::string msg = errMsg ? errMsg : sqlite3_errmsg(db);
            sqlite3_free(errMsg);
            throw SnapshotError("[SnapshotStore] '" + std::string(sql) + "' failed: " + msg);
        }
    }

    static StmtHandle prepare(sqlite3* db, const char* sql)
    {
        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
        StmtHandle stmt(raw);
        if (rc != SQLITE_OK || !stmt) {
            throw SnapshotError("[SnapshotStore] prepare failed: " + std::string(sqlite3_errmsg(db)));
        }
        return stmt;
    }

    static void insertEntry(sqlite3* db, sqlite3_stmt* stmt, const core::ChunkStateEntry& entry)
    {
        const std::string id = core::toHex(entry.chunk.id);
        const std::string dataset = core::toHex(entry.chunk.datasetId);
        const std::string files = util::json::encodeStringMap(entry.chunk.files);
        const std::string status = core::chunkStateName(entry.state);

        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        bool ok = sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK &&
                  sqlite3_bind_text(stmt, 2, dataset.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK &&
                  sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(entry.chunk.blockRange.start)) == SQLITE_OK &&
                  sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(entry.chunk.blockRange.end)) == SQLITE_OK &&
                  sqlite3_bind_text(stmt, 5, files.c_str(), static_cast<int>(files.size()), SQLITE_TRANSIENT) == SQLITE_OK &&
                  sqlite3_bind_text(stmt, 6, status.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK;
        if (!ok) {
            throw SnapshotError("[SnapshotStore] bind failed for " + id + ": " + sqlite3_errmsg(db));
        }

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            throw SnapshotError("[SnapshotStore] insert failed for " + id + ": " + sqlite3_errmsg(db));
        }
    }

    static std::string columnText(sqlite3_stmt* stmt, int col)
    {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        if (text == nullptr) {
            throw SnapshotError("[SnapshotStore] NULL in column " + std::to_string(col));
        }
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
    }

    static core::ChunkStateEntry readRow(sqlite3_stmt* stmt)
    {
        const std::string idHex = columnText(stmt, 0);
        core::ChunkStateEntry entry;
        try {
            entry.chunk.id = core::chunkIdFromHex(idHex);
            entry.chunk.datasetId = core::datasetIdFromHex(columnText(stmt, 1));
            entry.chunk.blockRange.start = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
            entry.chunk.blockRange.end = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
            entry.chunk.files = util::json::decodeStringMap(columnText(stmt, 4));
        } catch (const SnapshotError&) {
            throw;
        } catch (const std::exception& ex) {
            throw SnapshotError("[SnapshotStore] malformed row " + idHex + ": " + ex.what());
        }

        const std::string status = columnText(stmt, 5);
        auto state = core::parseChunkState(status);
        if (!state) {
            throw SnapshotError("[SnapshotStore] unrecognized status '" + status +
                                "' for chunk " + idHex);
        }
        entry.state = *state;

        if (core::deriveChunkId(entry.chunk.datasetId, entry.chunk.blockRange) != entry.chunk.id) {
            throw SnapshotError("[SnapshotStore] chunk id " + idHex +
                                " does not match its dataset and block range");
        }
        return entry;
    }

    std::string m_path;
};

} // namespace storage
} // namespace chunkworker

#endif // CHUNKWORKER_STORAGE_SNAPSHOT_STORE_HPP
