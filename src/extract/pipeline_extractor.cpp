#include "lineage/extract/pipeline_extractor.hpp"
#include "lineage/table_name.hpp"
#include "lineage/util/text.hpp"
#include "lineage/util/utf8.hpp"

#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace lineage {

namespace {

const std::regex& comment_or_blank_re() {
    static const std::regex re(R"(^\s*(#|//|/\*|\*|--))");
    return re;
}

const std::regex& output_header_re() {
    static const std::regex re(R"(^output\s+tables?\b)");
    return re;
}

const std::regex& banner_re() {
    static const std::regex re(R"(^#{5,}\s*$)");
    return re;
}

const std::regex& label_keyword_re() {
    static const std::regex re(
        R"(^(input|job|jobs|user|used|usage|purpose|revision|revisions|history|company|author|date|data|datastage|sas|view)\b)");
    return re;
}

// "Some label:" on a line of its own (ASCII or full-width colon, dashes)
const std::regex& generic_label_re() {
    static const std::regex re(R"(^[a-z][a-z0-9 _/\-\(\)]*\s*(?::|：|-|–|—)\s*$)");
    return re;
}

const std::regex& inline_fqtn_re() {
    static const std::regex re(R"(\b([a-z0-9_]+)\.([a-z0-9_]+)(?=[\s,;)\]#\-]|$))");
    return re;
}

const std::regex& insert_into_re() {
    static const std::regex re(R"(\.insertinto\(\s*['"]([a-z0-9_]+)\.([a-z0-9_]+)['"]\s*[,)])");
    return re;
}

const std::regex& save_as_table_re() {
    static const std::regex re(R"(\.saveastable\(\s*['"]([a-z0-9_]+)\.([a-z0-9_]+)['"])");
    return re;
}

const std::regex& spark_table_re() {
    static const std::regex re(R"(spark\.(?:read\.)?table\(\s*['"]([a-z0-9_]+)\.([a-z0-9_]+)['"]\s*\))");
    return re;
}

void collect_fqtns(const std::string& text, const std::regex& re, TableSet& out) {
    for (std::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it) {
        out.insert(to_fqtn((*it)[1].str(), (*it)[2].str()));
    }
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

bool is_comment_or_blank(const std::string& raw) {
    std::string line = util::strip_invisible(raw);
    return util::trim(line).empty() || std::regex_search(line, comment_or_blank_re());
}

// Lower-case, right-trimmed, with comment leaders and bullets removed
std::string normalize_line(const std::string& raw) {
    std::string line = util::to_lower(util::strip_invisible(raw));
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
        line.pop_back();
    }

    size_t start = 0;
    while (start < line.size()) {
        char c = line[start];
        if (std::isspace(static_cast<unsigned char>(c)) || c == '#' || c == '/' ||
            c == '*' || c == '-' || c == '|' || c == '>') {
            ++start;
        } else {
            break;
        }
    }
    return line.substr(start);
}

bool is_output_header(const std::string& norm) {
    return std::regex_search(norm, output_header_re());
}

bool is_section_break(const std::string& raw, const std::string& norm) {
    return std::regex_search(util::trim(raw), banner_re()) ||
           std::regex_search(norm, label_keyword_re()) ||
           std::regex_search(norm, generic_label_re());
}

} // namespace

TableSet parse_output_header(const std::string& text) {
    std::vector<std::string> lines = split_lines(text);

    // Only the leading comment block is a header
    size_t header_end = 0;
    while (header_end < lines.size() && is_comment_or_blank(lines[header_end])) {
        ++header_end;
    }

    TableSet tables;
    size_t i = 0;
    while (i < header_end) {
        std::string norm = normalize_line(lines[i]);
        ++i;
        if (!is_output_header(norm)) continue;

        // "Output tables: db.a, db.b" on the header line itself
        collect_fqtns(norm, inline_fqtn_re(), tables);

        while (i < header_end) {
            std::string entry = normalize_line(lines[i]);
            if (is_section_break(lines[i], entry) && !is_output_header(entry)) break;
            collect_fqtns(entry, inline_fqtn_re(), tables);
            ++i;
        }
    }
    return tables;
}

TableSet parse_insert_targets(const std::string& text) {
    std::string lower = util::to_lower(text);
    TableSet tables;
    collect_fqtns(lower, insert_into_re(), tables);
    collect_fqtns(lower, save_as_table_re(), tables);
    return tables;
}

TableSet PipelineExtractor::written_tables(const std::string& text) const {
    TableSet tables = parse_output_header(text);
    TableSet inserts = parse_insert_targets(text);
    tables.insert(inserts.begin(), inserts.end());
    return tables;
}

TableSet PipelineExtractor::read_tables(const std::string& text) const {
    TableSet tables;
    collect_fqtns(util::to_lower(text), spark_table_re(), tables);
    return tables;
}

} // namespace lineage
