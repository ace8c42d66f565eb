#pragma once
#include "owner_store.hpp"
#include <memory>
#include <optional>
#include <string>

namespace kairos {

struct Config;

// Load/save contract for whole-owner snapshots.
// Implementations are safe to call concurrently for different owners.
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual std::string backend_name() const = 0;

    // nullopt when the owner has never been saved (or its data is unreadable).
    virtual std::optional<StoreSnapshot> load(const std::string& owner_id) = 0;

    // Replace everything stored for the owner. Returns false on failure.
    virtual bool save(const std::string& owner_id, const StoreSnapshot& snapshot) = 0;

    // Drop the owner's persisted data. Returns true if anything was removed.
    virtual bool remove(const std::string& owner_id) = 0;
};

// Persistence disabled.
class NoneSnapshotStore : public SnapshotStore {
public:
    std::string backend_name() const override { return "none"; }
    std::optional<StoreSnapshot> load(const std::string&) override { return std::nullopt; }
    bool save(const std::string&, const StoreSnapshot&) override { return true; }
    bool remove(const std::string&) override { return false; }
};

// True if the id is non-empty and only uses [A-Za-z0-9_-].
bool valid_owner_id(const std::string& owner_id);

// Build the backend named by config.store.backend. Unknown names fall back to
// "none" with a warning. May throw std::runtime_error if the backend cannot
// open its storage.
std::unique_ptr<SnapshotStore> create_snapshot_store(const Config& config);

} // namespace kairos
