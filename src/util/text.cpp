#include "lineage/util/text.hpp"
#include "lineage/util/utf8.hpp"
#include "lineage/logging.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace lineage::util {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        item = trim(item);
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains_word(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;

    const bool word_start = is_word_char(needle.front());
    const bool word_end = is_word_char(needle.back());

    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        size_t after = pos + needle.size();
        // \b only constrains the side where the needle itself is a word char
        bool left_ok = !word_start || pos == 0 || !is_word_char(haystack[pos - 1]);
        bool right_ok = !word_end || after >= haystack.size() || !is_word_char(haystack[after]);
        if (left_ok && right_ok) return true;
        pos = haystack.find(needle, pos + 1);
    }
    return false;
}

std::optional<std::string> read_text(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_WARN("Failed to read ", path.string(), ": cannot open file");
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        LOG_WARN("Failed to read ", path.string(), ": I/O error");
        return std::nullopt;
    }

    std::string bytes = buffer.str();
    if (is_valid_utf8(bytes)) {
        return bytes;
    }

    LOG_DEBUG("Not valid UTF-8, decoding as latin-1: ", path.string());
    return latin1_to_utf8(bytes);
}

} // namespace lineage::util
