#pragma once
#include "memory.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kairos {

constexpr uint64_t kLifeEventDedupWindowSeconds = 24 * 60 * 60;
constexpr size_t kLifeEventDescriptionMax = 200;
constexpr size_t kSummaryQuoteMax = 100;

struct Turn {
    std::string owner_id;
    std::string user_message;
    std::string assistant_message;
};

struct EmotionalState {
    std::string primary = "neutral";
    std::vector<std::string> secondary;
    Level intensity = Level::Medium;
};

struct LifeEventCandidate {
    std::string category;
    std::string description;
    Level importance = Level::Medium;
};

struct TopicPatternCandidate {
    std::vector<std::string> topics;
    std::string emotion;
    // Existing TopicPattern this one must merge into, if any.
    std::optional<std::string> merge_into;
};

struct ExtractedMemories {
    std::optional<EmotionalState> emotional_state;
    std::optional<LifeEventCandidate> life_event;
    std::optional<TopicPatternCandidate> topic_pattern;
    std::vector<std::string> topics;

    bool empty() const {
        return !emotional_state && !life_event && !topic_pattern && topics.empty();
    }
};

// Read-only view of the owner's derived records used for dedup decisions.
struct ExtractionHistory {
    std::vector<const Memory*> life_events;
    std::vector<const Memory*> topic_patterns;
};

// Classifies the emotional state of a turn.
class EmotionClassifier {
public:
    virtual ~EmotionClassifier() = default;
    virtual EmotionalState classify(const std::string& user_message,
                                    const std::string& assistant_message) const = 0;
};

// Detects at most one life event in a user message.
class LifeEventClassifier {
public:
    virtual ~LifeEventClassifier() = default;
    virtual std::optional<LifeEventCandidate> detect(const std::string& user_message) const = 0;
};

// Keyword lexicon over six emotions in fixed priority order
// (happy, sad, angry, anxious, excited, calm). Intensity comes from the user
// message only and defaults to Medium.
class KeywordEmotionClassifier : public EmotionClassifier {
public:
    EmotionalState classify(const std::string& user_message,
                            const std::string& assistant_message) const override;
};

// Ordered category table (education, career, relationship, family,
// residence, travel, health, loss, achievement, challenge); first match wins.
class KeywordLifeEventClassifier : public LifeEventClassifier {
public:
    std::optional<LifeEventCandidate> detect(const std::string& user_message) const override;
};

// Topic categories found in text, in fixed category order.
std::vector<std::string> detect_topics(const std::string& text);

// Intensity marker in text: High/Medium/Low, Medium when none.
Level classify_intensity(const std::string& text);

// Importance marker in text: High/Medium/Low, Medium when none.
Level classify_importance(const std::string& text);

// Signed polarity of an emotion name scaled by intensity, in [-1, 1].
double emotion_score_for(const std::string& emotion, Level intensity);

// Salience assigned to a life event of the given importance.
double salience_for_importance(Level importance);

// User: "<user>" | Assistant: "<assistant>", each side cut to
// kSummaryQuoteMax bytes with "..." appended when cut.
std::string summarize_turn(const std::string& user_message, const std::string& assistant_message);

// True if `phrase` occurs as whole consecutive words in `words`.
bool contains_phrase(const std::vector<std::string>& words, const std::string& phrase);

// Derives emotional-state, life-event and topic-pattern candidates from one
// turn. Stateless apart from its classifiers; the owner's history is read,
// never written.
class MemoryExtractor {
public:
    MemoryExtractor();
    MemoryExtractor(std::unique_ptr<EmotionClassifier> emotions,
                    std::unique_ptr<LifeEventClassifier> life_events);

    // Empty user_message yields an empty result.
    ExtractedMemories extract(const Turn& turn, const ExtractionHistory& history,
                              uint64_t now) const;

private:
    std::unique_ptr<EmotionClassifier> emotions_;
    std::unique_ptr<LifeEventClassifier> life_events_;
};

} // namespace kairos
