#pragma once
#include "snapshot_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace kairos {

// All owners in one SQLite database, one row per memory.
class SqliteSnapshotStore : public SnapshotStore {
public:
    // Throws std::runtime_error if the database cannot be opened.
    explicit SqliteSnapshotStore(const std::string& path);
    ~SqliteSnapshotStore() override;

    // Non-copyable
    SqliteSnapshotStore(const SqliteSnapshotStore&) = delete;
    SqliteSnapshotStore& operator=(const SqliteSnapshotStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::optional<StoreSnapshot> load(const std::string& owner_id) override;

    // Replaces the owner's rows inside one transaction.
    bool save(const std::string& owner_id, const StoreSnapshot& snapshot) override;

    bool remove(const std::string& owner_id) override;

private:
    void init_schema();
    bool exec(const char* sql);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::mutex mutex_; // one connection shared by every owner
};

} // namespace kairos
