#include "lineage/table_name.hpp"
#include "lineage/util/text.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace lineage {

namespace {

const std::regex& fq_pattern() {
    static const std::regex re(R"(^([A-Za-z0-9_]+)\.([A-Za-z0-9_]+)$)");
    return re;
}

const std::regex& simple_pattern() {
    static const std::regex re(R"(^[A-Za-z0-9_]+$)");
    return re;
}

std::string strip_quotes(std::string s) {
    while (!s.empty() && (s.front() == '\'' || s.front() == '"')) s.erase(s.begin());
    while (!s.empty() && (s.back() == '\'' || s.back() == '"')) s.pop_back();
    return s;
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

bool is_reserved_word(const std::string& word) {
    static const std::unordered_set<std::string> kReserved = {
        "a", "b", "by", "case", "connect", "connection", "create", "data", "delete",
        "do", "else", "end", "false", "format", "from", "group", "having", "if", "in",
        "index", "inner", "into", "join", "label", "keep", "left", "length", "libname",
        "missing", "not", "null", "on", "options", "or", "order", "outer", "proc", "put",
        "quit", "rename", "right", "run", "select", "set", "table", "then", "to", "true",
        "update", "values", "view", "where", "while", "with", "work", "hadoop",
        "regexp_replace", "eof", "out", "input", "output", "name", "type", "noprint",
    };
    return kReserved.count(word) > 0;
}

std::optional<std::string> canonical_table_name(const std::string& token) {
    std::string cleaned = util::trim(token);
    while (!cleaned.empty() && (cleaned.back() == ';' || cleaned.back() == ',')) {
        cleaned.pop_back();
    }

    // Dataset options: "lib.tbl(drop=x)" or "tbl / view=v"
    cleaned = cleaned.substr(0, cleaned.find('/'));
    cleaned = cleaned.substr(0, cleaned.find('('));
    cleaned = util::trim(strip_quotes(util::trim(cleaned)));
    while (!cleaned.empty() && cleaned.back() == '.') cleaned.pop_back();

    if (cleaned.empty()) return std::nullopt;
    if (cleaned.find('&') != std::string::npos || cleaned.find('%') != std::string::npos) {
        return std::nullopt;
    }

    std::string lower = util::to_lower(cleaned);
    if (lower == "_null_") return std::nullopt;

    std::smatch match;
    if (std::regex_match(cleaned, match, fq_pattern())) {
        return to_fqtn(match[1].str(), match[2].str());
    }

    if (std::regex_match(cleaned, simple_pattern())) {
        if (all_digits(lower) || lower.size() == 1 || is_reserved_word(lower)) {
            return std::nullopt;
        }
        return lower;
    }

    return std::nullopt;
}

std::string to_fqtn(const std::string& schema, const std::string& table) {
    return util::to_lower(schema) + "." + util::to_lower(table);
}

std::string normalize_name(const std::string& name) {
    return util::to_lower(util::trim(name));
}

bool is_qualified(const std::string& name) {
    return name.find('.') != std::string::npos;
}

std::string table_part(const std::string& name) {
    size_t dot = name.find('.');
    return dot == std::string::npos ? name : name.substr(dot + 1);
}

std::string schema_part(const std::string& name) {
    size_t dot = name.find('.');
    return dot == std::string::npos ? std::string() : name.substr(0, dot);
}

} // namespace lineage
