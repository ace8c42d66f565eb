#pragma once
#include "../memory.hpp"
#include "owner_store.hpp"
#include <nlohmann/json.hpp>

namespace kairos {

// Shared JSON <-> Memory conversion used by both snapshot backends.
// Payload fields are written only when set so files stay readable.

inline std::vector<std::string> string_array(const nlohmann::json& item, const char* name) {
    std::vector<std::string> out;
    if (item.contains(name) && item[name].is_array()) {
        for (const auto& v : item[name]) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
    }
    return out;
}

inline Memory memory_payload_from_json(Memory memory, const nlohmann::json& item) {
    memory.content = item.value("content", "");
    memory.category = item.value("category", "");
    memory.key = item.value("key", "");
    memory.value = item.value("value", "");
    memory.status = item.value("status", "");
    memory.level = level_from_string(item.value("level", "medium"));
    memory.emotion = item.value("emotion", "");
    memory.secondary_emotions = string_array(item, "secondary_emotions");
    memory.topics = string_array(item, "topics");
    memory.frequency = item.value("frequency", uint32_t{0});
    memory.related_conversations = string_array(item, "related_conversations");
    memory.conversation_id = item.value("conversation_id", "");
    return memory;
}

// Returns nullopt for records without an id or with an unknown kind.
// Throws nlohmann::json::type_error when a field has the wrong JSON type.
inline std::optional<Memory> memory_from_json(const nlohmann::json& item) {
    if (!item.is_object()) return std::nullopt;
    auto kind = kind_from_string(item.value("kind", ""));
    std::string id = item.value("id", "");
    if (!kind || id.empty()) return std::nullopt;

    Memory memory;
    memory.id = id;
    memory.owner_id = item.value("owner_id", "");
    memory.kind = *kind;
    memory.created_at = item.value("created_at", uint64_t{0});
    memory.last_accessed_at = item.value("last_accessed_at", uint64_t{0});
    memory.access_count = item.value("access_count", uint32_t{0});
    memory.salience = item.value("salience", kDefaultSalience);
    memory.emotion_score = item.value("emotion_score", 0.0);
    if (item.contains("embedding") && item["embedding"].is_array()) {
        for (const auto& v : item["embedding"]) {
            if (v.is_number()) memory.embedding.push_back(v.get<float>());
        }
    }
    return memory_payload_from_json(std::move(memory), item);
}

inline nlohmann::json memory_payload_to_json(const Memory& memory) {
    nlohmann::json item = nlohmann::json::object();
    if (!memory.content.empty()) item["content"] = memory.content;
    if (!memory.category.empty()) item["category"] = memory.category;
    if (!memory.key.empty()) item["key"] = memory.key;
    if (!memory.value.empty()) item["value"] = memory.value;
    if (!memory.status.empty()) item["status"] = memory.status;
    item["level"] = level_to_string(memory.level);
    if (!memory.emotion.empty()) item["emotion"] = memory.emotion;
    if (!memory.secondary_emotions.empty()) item["secondary_emotions"] = memory.secondary_emotions;
    if (!memory.topics.empty()) item["topics"] = memory.topics;
    if (memory.frequency > 0) item["frequency"] = memory.frequency;
    if (!memory.related_conversations.empty())
        item["related_conversations"] = memory.related_conversations;
    if (!memory.conversation_id.empty()) item["conversation_id"] = memory.conversation_id;
    return item;
}

inline nlohmann::json memory_to_json(const Memory& memory, bool with_embedding = true) {
    nlohmann::json item = {
        {"id", memory.id},
        {"owner_id", memory.owner_id},
        {"kind", kind_to_string(memory.kind)},
        {"created_at", memory.created_at},
        {"last_accessed_at", memory.last_accessed_at},
        {"access_count", memory.access_count},
        {"salience", memory.salience},
        {"emotion_score", memory.emotion_score}
    };
    if (with_embedding && !memory.embedding.empty()) {
        item["embedding"] = memory.embedding;
    }
    item.update(memory_payload_to_json(memory));
    return item;
}

inline nlohmann::json snapshot_to_json(const StoreSnapshot& snapshot) {
    nlohmann::json memories = nlohmann::json::array();
    for (const auto& m : snapshot.memories) {
        memories.push_back(memory_to_json(m));
    }
    return {{"owner_id", snapshot.owner_id}, {"memories", memories}};
}

// Records without an id, with an unknown kind or with a mistyped field are
// skipped one by one; `skipped` (if given) receives their count.
inline StoreSnapshot snapshot_from_json(const nlohmann::json& j, uint32_t* skipped = nullptr) {
    StoreSnapshot snapshot;
    if (j.contains("owner_id") && j["owner_id"].is_string()) {
        snapshot.owner_id = j["owner_id"].get<std::string>();
    }
    uint32_t dropped = 0;
    if (j.contains("memories") && j["memories"].is_array()) {
        for (const auto& item : j["memories"]) {
            try {
                auto memory = memory_from_json(item);
                if (memory) {
                    snapshot.memories.push_back(std::move(*memory));
                } else {
                    dropped++;
                }
            } catch (const nlohmann::json::exception&) {
                dropped++;
            }
        }
    }
    if (skipped) *skipped = dropped;
    return snapshot;
}

} // namespace kairos
