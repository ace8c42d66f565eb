#pragma once
#include "snapshot_store.hpp"
#include <string>

namespace kairos {

// One <owner_id>.json file per owner inside a directory.
class JsonSnapshotStore : public SnapshotStore {
public:
    explicit JsonSnapshotStore(const std::string& directory);

    std::string backend_name() const override { return "json"; }

    std::optional<StoreSnapshot> load(const std::string& owner_id) override;
    bool save(const std::string& owner_id, const StoreSnapshot& snapshot) override;
    bool remove(const std::string& owner_id) override;

    const std::string& directory() const { return directory_; }

private:
    std::string path_for(const std::string& owner_id) const;

    std::string directory_;
};

} // namespace kairos
