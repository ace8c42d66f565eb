#include "extractor.hpp"
#include "util.hpp"
#include <algorithm>

namespace kairos {

namespace {

struct LexiconEntry {
    const char* name;
    std::vector<const char*> phrases;
};

// Order matters in every table below: the first matching entry wins.

const std::vector<LexiconEntry>& emotion_lexicon() {
    static const std::vector<LexiconEntry> table = {
        {"happy",   {"happy", "glad", "joy", "joyful", "delighted", "pleased", "grateful",
                     "thankful", "satisfied", "cheerful", "feel good"}},
        {"sad",     {"sad", "unhappy", "depressed", "lonely", "disappointed", "heartbroken",
                     "miserable", "crying", "tears", "grief"}},
        {"angry",   {"angry", "mad", "furious", "annoyed", "irritated", "frustrated",
                     "outraged", "pissed off"}},
        {"anxious", {"anxious", "worried", "worry", "nervous", "stressed", "stress",
                     "afraid", "scared", "tense", "panic", "overwhelmed"}},
        {"excited", {"excited", "thrilled", "eager", "pumped", "motivated",
                     "looking forward", "can't wait"}},
        {"calm",    {"calm", "relaxed", "peaceful", "serene", "tranquil", "at ease"}},
    };
    return table;
}

const std::vector<LexiconEntry>& intensity_lexicon() {
    static const std::vector<LexiconEntry> table = {
        {"high",   {"very", "really", "extremely", "incredibly", "totally", "completely",
                    "terribly", "super"}},
        {"medium", {"quite", "fairly", "moderately", "somewhat", "to some extent"}},
        {"low",    {"a little", "slightly", "a bit", "mildly", "barely"}},
    };
    return table;
}

const std::vector<LexiconEntry>& importance_lexicon() {
    static const std::vector<LexiconEntry> table = {
        {"high",   {"important", "major", "big", "huge", "milestone", "turning point",
                    "life changing", "significant"}},
        {"medium", {"normal", "ordinary", "usual", "regular", "typical"}},
        {"low",    {"small", "minor", "little", "trivial", "tiny"}},
    };
    return table;
}

const std::vector<LexiconEntry>& life_event_lexicon() {
    static const std::vector<LexiconEntry> table = {
        {"education",    {"graduate", "graduated", "graduation", "school", "university",
                          "college", "exam", "exams", "degree", "semester", "enrolled"}},
        {"career",       {"job", "jobs", "career", "work", "office", "company", "hired",
                          "promotion", "promoted", "employer", "interview", "fired",
                          "resigned"}},
        {"relationship", {"married", "marriage", "wedding", "divorce", "divorced", "dating",
                          "engaged", "breakup", "broke up", "relationship"}},
        {"family",       {"born", "birth", "birthday", "anniversary", "family", "baby",
                          "pregnant"}},
        {"residence",    {"moved", "moving", "relocated", "new house", "new apartment",
                          "home"}},
        {"travel",       {"trip", "travel", "traveling", "travelling", "vacation", "holiday",
                          "visit", "visited", "visiting", "journey"}},
        {"health",       {"sick", "ill", "illness", "hospital", "doctor", "surgery",
                          "treatment", "diagnosed", "health", "injury"}},
        {"loss",         {"died", "death", "passed away", "funeral", "lost", "loss"}},
        {"achievement",  {"achieved", "achievement", "accomplished", "goal", "succeeded",
                          "success", "won", "award"}},
        {"challenge",    {"failed", "failure", "struggling", "struggle", "setback",
                          "difficult", "difficulty", "rejected"}},
    };
    return table;
}

const std::vector<LexiconEntry>& topic_lexicon() {
    static const std::vector<LexiconEntry> table = {
        {"work",          {"work", "job", "office", "company", "project", "boss", "career",
                           "colleague", "coworker", "deadline", "meeting"}},
        {"family",        {"family", "parent", "parents", "mother", "mom", "father", "dad",
                           "sister", "brother", "son", "daughter", "children", "kids"}},
        {"health",        {"health", "sick", "doctor", "hospital", "exercise", "workout",
                           "diet", "sleep", "medicine"}},
        {"education",     {"study", "studying", "learn", "learning", "school", "class",
                           "course", "education", "exam", "university"}},
        {"relationships", {"friend", "friends", "partner", "girlfriend", "boyfriend", "wife",
                           "husband", "relationship", "dating"}},
        {"hobbies",       {"hobby", "hobbies", "game", "games", "gaming", "reading", "book",
                           "books", "music", "movie", "movies", "painting", "hiking",
                           "cooking"}},
        {"emotions",      {"feel", "feeling", "feelings", "mood", "emotional", "stress",
                           "stressed", "mind"}},
        {"goals",         {"goal", "goals", "plan", "plans", "future", "dream", "dreams",
                           "hope", "ambition"}},
    };
    return table;
}

bool entry_matches(const LexiconEntry& entry, const std::vector<std::string>& words) {
    for (const char* phrase : entry.phrases) {
        if (contains_phrase(words, phrase)) return true;
    }
    return false;
}

// Name of the first entry matching `words`, or nullptr.
const char* first_match(const std::vector<LexiconEntry>& table,
                        const std::vector<std::string>& words) {
    for (const auto& entry : table) {
        if (entry_matches(entry, words)) return entry.name;
    }
    return nullptr;
}

bool shares_topic(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    for (const auto& t : a) {
        if (std::find(b.begin(), b.end(), t) != b.end()) return true;
    }
    return false;
}

} // namespace

bool contains_phrase(const std::vector<std::string>& words, const std::string& phrase) {
    auto needle = tokenize_words(phrase);
    if (needle.empty() || needle.size() > words.size()) return false;

    return std::search(words.begin(), words.end(), needle.begin(), needle.end()) != words.end();
}

static std::string quote_prefix(const std::string& text) {
    std::string cut = truncate_utf8(text, kSummaryQuoteMax);
    if (cut.size() < text.size()) cut += "...";
    return cut;
}

std::string summarize_turn(const std::string& user_message, const std::string& assistant_message) {
    return "User: \"" + quote_prefix(user_message) + "\" | Assistant: \"" +
           quote_prefix(assistant_message) + "\"";
}

Level classify_intensity(const std::string& text) {
    const char* level = first_match(intensity_lexicon(), tokenize_words(text));
    return level ? level_from_string(level) : Level::Medium;
}

Level classify_importance(const std::string& text) {
    const char* level = first_match(importance_lexicon(), tokenize_words(text));
    return level ? level_from_string(level) : Level::Medium;
}

std::vector<std::string> detect_topics(const std::string& text) {
    auto words = tokenize_words(text);
    std::vector<std::string> topics;
    for (const auto& entry : topic_lexicon()) {
        if (entry_matches(entry, words)) topics.emplace_back(entry.name);
    }
    return topics;
}

double emotion_score_for(const std::string& emotion, Level intensity) {
    double polarity = 0.0;
    if (emotion == "happy")        polarity = 0.8;
    else if (emotion == "excited") polarity = 0.7;
    else if (emotion == "calm")    polarity = 0.4;
    else if (emotion == "anxious") polarity = -0.5;
    else if (emotion == "angry")   polarity = -0.6;
    else if (emotion == "sad")     polarity = -0.7;

    double scale = 0.75;
    if (intensity == Level::High) scale = 1.0;
    else if (intensity == Level::Low) scale = 0.5;
    return polarity * scale;
}

double salience_for_importance(Level importance) {
    switch (importance) {
        case Level::High:   return 0.9;
        case Level::Medium: return 0.6;
        case Level::Low:    return 0.3;
    }
    return kDefaultSalience;
}

EmotionalState KeywordEmotionClassifier::classify(const std::string& user_message,
                                                  const std::string& assistant_message) const {
    auto words = tokenize_words(user_message + " " + assistant_message);

    EmotionalState state;
    std::vector<std::string> detected;
    for (const auto& entry : emotion_lexicon()) {
        if (entry_matches(entry, words)) detected.emplace_back(entry.name);
    }
    if (!detected.empty()) {
        state.primary = detected.front();
        state.secondary.assign(detected.begin() + 1, detected.end());
    }
    state.intensity = classify_intensity(user_message);
    return state;
}

std::optional<LifeEventCandidate> KeywordLifeEventClassifier::detect(
        const std::string& user_message) const {
    const char* category = first_match(life_event_lexicon(), tokenize_words(user_message));
    if (!category) return std::nullopt;

    LifeEventCandidate event;
    event.category = category;
    event.description = truncate_utf8(trim(user_message), kLifeEventDescriptionMax);
    event.importance = classify_importance(user_message);
    return event;
}

MemoryExtractor::MemoryExtractor()
    : MemoryExtractor(std::make_unique<KeywordEmotionClassifier>(),
                      std::make_unique<KeywordLifeEventClassifier>()) {}

MemoryExtractor::MemoryExtractor(std::unique_ptr<EmotionClassifier> emotions,
                                 std::unique_ptr<LifeEventClassifier> life_events)
    : emotions_(std::move(emotions)), life_events_(std::move(life_events)) {}

ExtractedMemories MemoryExtractor::extract(const Turn& turn, const ExtractionHistory& history,
                                           uint64_t now) const {
    ExtractedMemories out;
    if (trim(turn.user_message).empty()) return out;

    EmotionalState state = emotions_ ? emotions_->classify(turn.user_message, turn.assistant_message)
                                     : EmotionalState{};

    if (life_events_) {
        auto event = life_events_->detect(turn.user_message);
        if (event) {
            // Time window only: description content is not compared.
            bool duplicate = std::any_of(history.life_events.begin(), history.life_events.end(),
                [&](const Memory* m) {
                    if (!m || m->category != event->category) return false;
                    uint64_t delta = m->created_at > now ? m->created_at - now
                                                         : now - m->created_at;
                    return delta < kLifeEventDedupWindowSeconds;
                });
            if (!duplicate) out.life_event = std::move(event);
        }
    }

    out.topics = detect_topics(turn.user_message + " " + turn.assistant_message);
    if (!out.topics.empty()) {
        TopicPatternCandidate pattern;
        pattern.topics = out.topics;
        pattern.emotion = state.primary;
        for (const Memory* existing : history.topic_patterns) {
            if (existing && existing->emotion == pattern.emotion &&
                shares_topic(existing->topics, pattern.topics)) {
                pattern.merge_into = existing->id;
                break;
            }
        }
        out.topic_pattern = std::move(pattern);
    }

    out.emotional_state = std::move(state);
    return out;
}

} // namespace kairos
