#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace kairos {

constexpr uint64_t kSecondsPerDay = 86400;

// Unix epoch seconds
uint64_t epoch_seconds();

// Format epoch seconds as "YYYY-MM-DD HH:MM" (UTC)
std::string format_utc(uint64_t epoch);

// Trim whitespace
std::string trim(const std::string& s);

// Join strings with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Lowercased alphanumeric words. Apostrophes inside a word are dropped
// ("don't" -> "dont"), every other non-alphanumeric byte separates words.
std::vector<std::string> tokenize_words(const std::string& s);

// First max_bytes of s without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& s, size_t max_bytes);

// Generate a simple unique ID (hex), optionally prefixed ("conv_1a2b...")
std::string generate_id(const std::string& prefix = "");

// Write to path.tmp then rename over path. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace kairos
