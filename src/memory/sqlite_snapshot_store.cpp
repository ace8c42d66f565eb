#include "sqlite_snapshot_store.hpp"
#include "entry_json.hpp"
#include "vector.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace kairos {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static std::string column_string(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

SqliteSnapshotStore::SqliteSnapshotStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteSnapshotStore: failed to open database: " + err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteSnapshotStore::~SqliteSnapshotStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteSnapshotStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[store] sqlite: " << (err ? err : "unknown error") << "\n";
        sqlite3_free(err);
        return false;
    }
    return true;
}

void SqliteSnapshotStore::init_schema() {
    // seq keeps insertion order, which eviction ties depend on
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS memories ("
        "  owner_id         TEXT NOT NULL,"
        "  id               TEXT NOT NULL,"
        "  seq              INTEGER NOT NULL,"
        "  kind             TEXT NOT NULL,"
        "  created_at       INTEGER NOT NULL,"
        "  last_accessed_at INTEGER NOT NULL,"
        "  access_count     INTEGER NOT NULL,"
        "  salience         REAL NOT NULL,"
        "  emotion_score    REAL NOT NULL,"
        "  payload          TEXT NOT NULL,"
        "  embedding        BLOB,"
        "  PRIMARY KEY (owner_id, id)"
        ");";
    if (!exec(create_table)) {
        throw std::runtime_error("SqliteSnapshotStore: failed to create schema in " + path_);
    }
    exec("CREATE INDEX IF NOT EXISTS memories_owner_seq ON memories(owner_id, seq);");
}

std::optional<StoreSnapshot> SqliteSnapshotStore::load(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "SELECT id, kind, created_at, last_accessed_at, access_count, salience,"
        " emotion_score, payload, embedding"
        " FROM memories WHERE owner_id = ? ORDER BY seq;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[store] sqlite: " << sqlite3_errmsg(db_) << "\n";
        return std::nullopt;
    }
    sqlite3_bind_text(g.stmt, 1, owner_id.c_str(), -1, SQLITE_STATIC);

    StoreSnapshot snapshot;
    snapshot.owner_id = owner_id;
    uint32_t skipped = 0;

    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        auto kind = kind_from_string(column_string(g.stmt, 1));
        nlohmann::json payload = nlohmann::json::parse(column_string(g.stmt, 7), nullptr, false);
        if (!kind || payload.is_discarded() || !payload.is_object()) {
            skipped++;
            rc = sqlite3_step(g.stmt);
            continue;
        }

        Memory m;
        m.id = column_string(g.stmt, 0);
        m.owner_id = owner_id;
        m.kind = *kind;
        m.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 2));
        m.last_accessed_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 3));
        m.access_count = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 4));
        m.salience = sqlite3_column_double(g.stmt, 5);
        m.emotion_score = sqlite3_column_double(g.stmt, 6);

        const void* blob = sqlite3_column_blob(g.stmt, 8);
        int bytes = sqlite3_column_bytes(g.stmt, 8);
        if (blob && bytes > 0) {
            m.embedding = deserialize_vector(
                std::string(static_cast<const char*>(blob), static_cast<size_t>(bytes)));
        }

        try {
            snapshot.memories.push_back(memory_payload_from_json(std::move(m), payload));
        } catch (const nlohmann::json::exception&) {
            skipped++;
        }
        rc = sqlite3_step(g.stmt);
    }

    if (rc != SQLITE_DONE) {
        std::cerr << "[store] sqlite load failed for " << owner_id << ": "
                  << sqlite3_errmsg(db_) << "\n";
        return std::nullopt;
    }
    if (skipped > 0) {
        std::cerr << "[store] Skipped " << skipped << " unreadable rows for " << owner_id << "\n";
    }
    if (snapshot.memories.empty() && skipped == 0) return std::nullopt;
    return snapshot;
}

bool SqliteSnapshotStore::save(const std::string& owner_id, const StoreSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!exec("BEGIN IMMEDIATE;")) return false;

    bool ok = true;
    {
        StmtGuard del;
        const char* del_sql = "DELETE FROM memories WHERE owner_id = ?;";
        ok = sqlite3_prepare_v2(db_, del_sql, -1, &del.stmt, nullptr) == SQLITE_OK;
        if (ok) {
            sqlite3_bind_text(del.stmt, 1, owner_id.c_str(), -1, SQLITE_STATIC);
            ok = sqlite3_step(del.stmt) == SQLITE_DONE;
        }
    }

    if (ok) {
        StmtGuard ins;
        const char* ins_sql =
            "INSERT INTO memories (owner_id, id, seq, kind, created_at, last_accessed_at,"
            " access_count, salience, emotion_score, payload, embedding)"
            " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
        ok = sqlite3_prepare_v2(db_, ins_sql, -1, &ins.stmt, nullptr) == SQLITE_OK;

        int64_t seq = 0;
        for (size_t i = 0; ok && i < snapshot.memories.size(); ++i) {
            const Memory& m = snapshot.memories[i];
            std::string kind = kind_to_string(m.kind);
            std::string payload = memory_payload_to_json(m).dump();
            std::string blob = serialize_vector(m.embedding);

            sqlite3_reset(ins.stmt);
            sqlite3_clear_bindings(ins.stmt);
            sqlite3_bind_text(ins.stmt, 1, owner_id.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(ins.stmt, 2, m.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(ins.stmt, 3, seq++);
            sqlite3_bind_text(ins.stmt, 4, kind.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(ins.stmt, 5, static_cast<sqlite3_int64>(m.created_at));
            sqlite3_bind_int64(ins.stmt, 6, static_cast<sqlite3_int64>(m.last_accessed_at));
            sqlite3_bind_int64(ins.stmt, 7, static_cast<sqlite3_int64>(m.access_count));
            sqlite3_bind_double(ins.stmt, 8, m.salience);
            sqlite3_bind_double(ins.stmt, 9, m.emotion_score);
            sqlite3_bind_text(ins.stmt, 10, payload.c_str(), -1, SQLITE_TRANSIENT);
            if (blob.empty()) {
                sqlite3_bind_null(ins.stmt, 11);
            } else {
                sqlite3_bind_blob(ins.stmt, 11, blob.data(), static_cast<int>(blob.size()),
                                  SQLITE_TRANSIENT);
            }
            ok = sqlite3_step(ins.stmt) == SQLITE_DONE;
        }
    }

    if (!ok) {
        std::cerr << "[store] sqlite save failed for " << owner_id << ": "
                  << sqlite3_errmsg(db_) << "\n";
        exec("ROLLBACK;");
        return false;
    }
    return exec("COMMIT;");
}

bool SqliteSnapshotStore::remove(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "DELETE FROM memories WHERE owner_id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(g.stmt, 1, owner_id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(db_) > 0;
}

} // namespace kairos
