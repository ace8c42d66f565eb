#include "memory.hpp"
#include <algorithm>
#include <cmath>

namespace kairos {

std::string kind_to_string(MemoryKind kind) {
    switch (kind) {
        case MemoryKind::Conversation:   return "conversation";
        case MemoryKind::Fact:           return "fact";
        case MemoryKind::Preference:     return "preference";
        case MemoryKind::LifeEvent:      return "life_event";
        case MemoryKind::EmotionalState: return "emotional_state";
        case MemoryKind::TopicPattern:   return "topic_pattern";
        case MemoryKind::LongTerm:       return "long_term";
        case MemoryKind::Relationship:   return "relationship";
        case MemoryKind::Goal:           return "goal";
        case MemoryKind::Interest:       return "interest";
    }
    return "long_term";
}

std::optional<MemoryKind> kind_from_string(const std::string& s) {
    if (s == "conversation")    return MemoryKind::Conversation;
    if (s == "fact")            return MemoryKind::Fact;
    if (s == "preference")      return MemoryKind::Preference;
    if (s == "life_event")      return MemoryKind::LifeEvent;
    if (s == "emotional_state") return MemoryKind::EmotionalState;
    if (s == "topic_pattern")   return MemoryKind::TopicPattern;
    if (s == "long_term")       return MemoryKind::LongTerm;
    if (s == "relationship")    return MemoryKind::Relationship;
    if (s == "goal")            return MemoryKind::Goal;
    if (s == "interest")        return MemoryKind::Interest;
    return std::nullopt;
}

std::string kind_id_prefix(MemoryKind kind) {
    switch (kind) {
        case MemoryKind::Conversation:   return "conv";
        case MemoryKind::Fact:           return "fact";
        case MemoryKind::Preference:     return "pref";
        case MemoryKind::LifeEvent:      return "event";
        case MemoryKind::EmotionalState: return "emotion";
        case MemoryKind::TopicPattern:   return "pattern";
        case MemoryKind::LongTerm:       return "ltm";
        case MemoryKind::Relationship:   return "rel";
        case MemoryKind::Goal:           return "goal";
        case MemoryKind::Interest:       return "interest";
    }
    return "mem";
}

std::string level_to_string(Level level) {
    switch (level) {
        case Level::Low:    return "low";
        case Level::Medium: return "medium";
        case Level::High:   return "high";
    }
    return "medium";
}

Level level_from_string(const std::string& s) {
    if (s == "low")  return Level::Low;
    if (s == "high") return Level::High;
    return Level::Medium;
}

double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

void normalize_memory(Memory& memory) {
    if (!std::isfinite(memory.salience)) memory.salience = kDefaultSalience;
    memory.salience = clamp01(memory.salience);

    if (!std::isfinite(memory.emotion_score)) memory.emotion_score = 0.0;
    memory.emotion_score = std::min(1.0, std::max(-1.0, memory.emotion_score));

    if (memory.last_accessed_at < memory.created_at) {
        memory.last_accessed_at = memory.created_at;
    }

    if (memory.kind == MemoryKind::Goal && memory.status.empty()) {
        memory.status = "active";
    }
}

} // namespace kairos
