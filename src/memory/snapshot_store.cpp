#include "snapshot_store.hpp"
#include "json_snapshot_store.hpp"
#include "sqlite_snapshot_store.hpp"
#include "../config.hpp"
#include "../util.hpp"
#include <cctype>
#include <iostream>

namespace kairos {

bool valid_owner_id(const std::string& owner_id) {
    if (owner_id.empty()) return false;
    for (char c : owner_id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
    }
    return true;
}

std::unique_ptr<SnapshotStore> create_snapshot_store(const Config& config) {
    const auto& store = config.store;

    if (store.backend == "json") {
        std::string dir = store.path.empty() ? "~/.kairos/memories" : store.path;
        return std::make_unique<JsonSnapshotStore>(expand_home(dir));
    }
    if (store.backend == "sqlite") {
        std::string path = store.path.empty() ? "~/.kairos/memories.db" : store.path;
        return std::make_unique<SqliteSnapshotStore>(expand_home(path));
    }
    if (store.backend != "none") {
        std::cerr << "[store] Unknown backend '" << store.backend
                  << "', persistence disabled\n";
    }
    return std::make_unique<NoneSnapshotStore>();
}

} // namespace kairos
