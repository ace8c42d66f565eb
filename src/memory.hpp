#pragma once
#include "embedder.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace kairos {

enum class MemoryKind {
    Conversation,
    Fact,
    Preference,
    LifeEvent,
    EmotionalState,
    TopicPattern,
    LongTerm,
    Relationship,
    Goal,
    Interest
};

// Three-step scale shared by emotional intensity and event importance.
enum class Level { Low, Medium, High };

constexpr double kDefaultSalience = 0.5;

// One stored unit of user-specific information.
// Common fields first; the payload fields below are interpreted per kind:
//
//   Conversation    content = summary, topics, emotion = primary emotion
//   Fact            content = text, category
//   Preference      key = preference, value
//   LifeEvent       category, content = description, level = importance,
//                   emotion = emotional impact, conversation_id
//   EmotionalState  emotion = primary, secondary_emotions, level = intensity,
//                   content = context summary, conversation_id
//   TopicPattern    topics, emotion = dominant emotion, frequency,
//                   related_conversations
//   LongTerm        content, category, level = importance
//   Relationship    key = person, value = relation
//   Goal            content, category, status ("active" / "completed")
//   Interest        content, category
struct Memory {
    std::string id;
    std::string owner_id;
    MemoryKind kind = MemoryKind::LongTerm;
    Embedding embedding;           // empty when absent
    uint64_t created_at = 0;       // epoch seconds
    uint64_t last_accessed_at = 0; // epoch seconds, >= created_at
    uint32_t access_count = 0;
    double salience = kDefaultSalience; // [0, 1]
    double emotion_score = 0.0;         // [-1, 1]

    std::string content;
    std::string category;
    std::string key;
    std::string value;
    std::string status;
    Level level = Level::Medium;
    std::string emotion;
    std::vector<std::string> secondary_emotions;
    std::vector<std::string> topics;
    uint32_t frequency = 0;
    std::vector<std::string> related_conversations;
    std::string conversation_id;
};

// Kind string conversions
std::string kind_to_string(MemoryKind kind);
std::optional<MemoryKind> kind_from_string(const std::string& s);

// Short prefix used for generated ids ("conv", "fact", ...)
std::string kind_id_prefix(MemoryKind kind);

std::string level_to_string(Level level);
Level level_from_string(const std::string& s);

double clamp01(double v);

// Enforce write-time invariants in place: salience and emotion_score are
// clamped (non-finite values fall back to defaults) and last_accessed_at is
// raised to created_at when it lags behind. Goals without a status are active.
void normalize_memory(Memory& memory);

} // namespace kairos
