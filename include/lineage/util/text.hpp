// =============================================================================
// text.hpp - String helpers shared by the extractors and the index
// =============================================================================

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lineage::util {

std::string to_lower(std::string s);

std::string trim(const std::string& s);

// Split on sep, trim each piece and drop empty ones
std::vector<std::string> split_list(const std::string& s, char sep = ',');

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// [A-Za-z0-9_]
inline bool is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

// Literal search for needle with a regex-style \b on both ends
bool contains_word(const std::string& haystack, const std::string& needle);

// UTF-8 file contents, Latin-1 transcoded when the bytes are not valid UTF-8.
// Returns nullopt (after logging a warning) when the file cannot be read.
std::optional<std::string> read_text(const std::filesystem::path& path);

} // namespace lineage::util
