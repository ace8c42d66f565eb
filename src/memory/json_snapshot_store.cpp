#include "json_snapshot_store.hpp"
#include "entry_json.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace kairos {

JsonSnapshotStore::JsonSnapshotStore(const std::string& directory)
    : directory_(directory) {
    if (!directory_.empty() && directory_.back() == '/') directory_.pop_back();
}

std::string JsonSnapshotStore::path_for(const std::string& owner_id) const {
    return directory_ + "/" + owner_id + ".json";
}

std::optional<StoreSnapshot> JsonSnapshotStore::load(const std::string& owner_id) {
    if (!valid_owner_id(owner_id)) return std::nullopt;

    std::string path = path_for(owner_id);
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            std::cerr << "[store] Ignoring malformed snapshot " << path << "\n";
            return std::nullopt;
        }
        uint32_t skipped = 0;
        StoreSnapshot snapshot = snapshot_from_json(j, &skipped);
        snapshot.owner_id = owner_id;
        if (skipped > 0) {
            std::cerr << "[store] Skipped " << skipped << " unreadable records in " << path << "\n";
        }
        return snapshot;
    } catch (const nlohmann::json::exception& e) {
        // Corrupt file: the owner starts fresh and the next save overwrites it
        std::cerr << "[store] Corrupt snapshot " << path << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

bool JsonSnapshotStore::save(const std::string& owner_id, const StoreSnapshot& snapshot) {
    if (!valid_owner_id(owner_id)) {
        std::cerr << "[store] Refusing to save invalid owner id '" << owner_id << "'\n";
        return false;
    }
    std::string path = path_for(owner_id);
    if (!atomic_write_file(path, snapshot_to_json(snapshot).dump(2))) {
        std::cerr << "[store] Failed to write " << path << "\n";
        return false;
    }
    return true;
}

bool JsonSnapshotStore::remove(const std::string& owner_id) {
    if (!valid_owner_id(owner_id)) return false;
    std::error_code ec;
    return std::filesystem::remove(path_for(owner_id), ec);
}

} // namespace kairos
