#include "lineage/extract/sas_extractor.hpp"
#include "lineage/table_name.hpp"
#include "lineage/util/text.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <iterator>
#include <regex>

namespace lineage {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

const std::regex& create_table_re() {
    static const std::regex re(R"(\bcreate\s+table\s+([A-Za-z0-9_.&]+))", kIcase);
    return re;
}

const std::regex& insert_into_re() {
    static const std::regex re(R"(\binsert\s+into\s+([A-Za-z0-9_.&]+))", kIcase);
    return re;
}

const std::regex& from_re() {
    static const std::regex re(R"(\bfrom\s+([A-Za-z0-9_.&]+))", kIcase);
    return re;
}

const std::regex& join_re() {
    static const std::regex re(R"(\bjoin\s+([A-Za-z0-9_.&]+))", kIcase);
    return re;
}

// PROC SQL pass-through style statements
const std::regex& execute_re() {
    static const std::regex re(R"(\b(insert\s+into|update|delete\s+from)\s+([A-Za-z0-9_.]+))", kIcase);
    return re;
}

const std::regex& out_option_re() {
    static const std::regex re(R"(\bout\s*=\s*([A-Za-z0-9_.&]+))", kIcase);
    return re;
}

const std::regex& base_option_re() {
    static const std::regex re(R"(\bbase\s*=\s*([A-Za-z0-9_.&]+))", kIcase);
    return re;
}

const std::regex& data_option_re() {
    static const std::regex re(R"(\bdata\s*=\s*([A-Za-z0-9_.&]+))", kIcase);
    return re;
}

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Case-insensitive keyword at pos with a word boundary after it
bool keyword_at(const std::string& text, size_t pos, const char* word) {
    size_t len = std::char_traits<char>::length(word);
    if (pos + len > text.size()) return false;
    for (size_t k = 0; k < len; ++k) {
        if (std::tolower(static_cast<unsigned char>(text[pos + k])) != word[k]) return false;
    }
    return pos + len == text.size() || !util::is_word_char(text[pos + len]);
}

size_t skip_blanks(const std::string& text, size_t pos) {
    while (pos < text.size() && is_blank(text[pos])) ++pos;
    return pos;
}

// A block keyword only counts where a statement can begin
bool at_statement_start(const std::string& text, size_t pos, size_t from) {
    size_t k = pos;
    while (k > from && (text[k - 1] == ' ' || text[k - 1] == '\t' || text[k - 1] == '\r')) --k;
    return k == from || text[k - 1] == '\n' || text[k - 1] == ';';
}

// Offset just past the block header's terminating ';'
std::optional<size_t> match_block_header(const std::string& text, size_t pos, SasBlock::Type type) {
    size_t cursor = pos;
    if (type == SasBlock::Type::Sql) {
        if (!keyword_at(text, cursor, "proc")) return std::nullopt;
        cursor += 4;
        size_t after = skip_blanks(text, cursor);
        if (after == cursor || !keyword_at(text, after, "sql")) return std::nullopt;
        cursor = after + 3;
    } else {
        if (!keyword_at(text, cursor, "data")) return std::nullopt;
        cursor += 4;
        // "data=" is a procedure option, not a step
        size_t after = skip_blanks(text, cursor);
        if (after < text.size() && text[after] == '=') return std::nullopt;
    }

    size_t semi = text.find(';', cursor);
    if (semi == std::string::npos) return std::nullopt;
    return semi + 1;
}

// Offset just past "<word> ;" and any trailing blanks, or npos
size_t find_block_end(const std::string& text, size_t from, const char* word) {
    size_t len = std::char_traits<char>::length(word);
    for (size_t pos = from; pos + len <= text.size(); ++pos) {
        if (pos > 0 && util::is_word_char(text[pos - 1])) continue;
        if (!keyword_at(text, pos, word)) continue;

        size_t after = skip_blanks(text, pos + len);
        if (after < text.size() && text[after] == ';') {
            return skip_blanks(text, after + 1);
        }
    }
    return std::string::npos;
}

// Calls fn(clause, statement_start) for every "<keyword> <clause>;" statement.
// Statements begin at the start of the text, of a line, or after a ';'.
// Assignments such as "set = 1;" are skipped.
void for_each_statement(const std::string& text, const char* keyword,
                        const std::function<void(const std::string&, size_t)>& fn) {
    size_t len = std::char_traits<char>::length(keyword);
    size_t last_keyword = std::string::npos;
    size_t start = 0;

    while (start <= text.size()) {
        size_t pos = start;
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\r')) ++pos;

        if (pos != last_keyword && keyword_at(text, pos, keyword)) {
            last_keyword = pos;
            size_t after_kw = pos + len;
            size_t clause_start = skip_blanks(text, after_kw);
            bool has_gap = clause_start > after_kw;
            if (has_gap && clause_start < text.size() && text[clause_start] != '=') {
                size_t semi = text.find(';', clause_start);
                if (semi != std::string::npos && semi > clause_start) {
                    fn(text.substr(clause_start, semi - clause_start), start);
                }
            }
        }

        size_t next = text.find_first_of("\n;", start);
        if (next == std::string::npos) break;
        start = next + 1;
    }
}

std::optional<std::string> normalize_identifier(const std::string& token, const MacroEnv& env) {
    std::string cleaned = util::trim(token);
    while (!cleaned.empty() && (cleaned.back() == ';' || cleaned.back() == ',')) cleaned.pop_back();
    cleaned = cleaned.substr(0, cleaned.find('/'));
    cleaned = util::trim(cleaned.substr(0, cleaned.find('(')));
    if (cleaned.empty()) return std::nullopt;

    return canonical_table_name(env.expand(cleaned));
}

void collect_matches(const std::string& text, const std::regex& re, const MacroEnv& env, TableSet& out) {
    for (std::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it) {
        if (auto table = normalize_identifier((*it)[1].str(), env)) {
            out.insert(*table);
        }
    }
}

// "_input", "_input3", ... but not "_inputs"
bool is_io_macro(const std::string& name, const std::string& prefix) {
    if (!util::starts_with(name, prefix)) return false;
    return std::all_of(name.begin() + static_cast<std::ptrdiff_t>(prefix.size()), name.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

void analyze_block(const std::string& block_text, const MacroEnv& env, SasTableUsage& usage) {
    collect_matches(block_text, create_table_re(), env, usage.writes);
    collect_matches(block_text, insert_into_re(), env, usage.writes);
    collect_matches(block_text, from_re(), env, usage.reads);
    collect_matches(block_text, join_re(), env, usage.reads);

    for_each_statement(block_text, "data", [&](const std::string& clause, size_t) {
        TableSet tables = extract_clause_tables(clause, env);
        usage.writes.insert(tables.begin(), tables.end());
    });

    for_each_statement(block_text, "set", [&](const std::string& clause, size_t start) {
        // SQL "update t\n set col = ..." assigns columns, it reads no dataset
        size_t prev = start == 0 ? std::string::npos : block_text.rfind(';', start - 1);
        size_t snippet_start = prev == std::string::npos ? 0 : prev + 1;
        std::string snippet = util::to_lower(block_text.substr(snippet_start, start - snippet_start));
        if (snippet.find("update") != std::string::npos) return;

        TableSet tables = extract_clause_tables(clause, env);
        usage.reads.insert(tables.begin(), tables.end());
    });

    for (std::sregex_iterator it(block_text.begin(), block_text.end(), execute_re()), end; it != end; ++it) {
        auto table = normalize_identifier((*it)[2].str(), env);
        if (!table) continue;

        std::string head = util::to_lower((*it)[1].str());
        if (util::starts_with(head, "delete")) {
            usage.reads.insert(*table);
        } else {
            usage.writes.insert(*table);
        }
    }

    collect_matches(block_text, out_option_re(), env, usage.writes);
    collect_matches(block_text, base_option_re(), env, usage.writes);
    collect_matches(block_text, data_option_re(), env, usage.reads);

    for (const auto& [name, value] : env.bindings()) {
        auto table = normalize_identifier(value, env);
        if (!table) continue;

        if (name == "syslast" || is_io_macro(name, "_input")) {
            usage.reads.insert(*table);
        }
        if (is_io_macro(name, "_output")) {
            usage.writes.insert(*table);
        }
    }
}

std::optional<std::string> pick_preferred(const TableSet& candidates, const std::string& prefix) {
    for (const auto& table : candidates) {
        if (util::starts_with(table, prefix)) return table;
    }
    if (candidates.empty()) return std::nullopt;
    return *candidates.begin();
}

} // namespace

// =============================================================================
// SasTableUsage
// =============================================================================

TableSet SasTableUsage::inputs() const {
    TableSet result;
    std::set_difference(reads.begin(), reads.end(), writes.begin(), writes.end(),
                        std::inserter(result, result.end()));
    return result;
}

TableSet SasTableUsage::intermediates() const {
    TableSet result;
    std::set_intersection(reads.begin(), reads.end(), writes.begin(), writes.end(),
                          std::inserter(result, result.end()));
    return result;
}

TableSet SasTableUsage::outputs() const {
    TableSet result;
    std::set_difference(writes.begin(), writes.end(), reads.begin(), reads.end(),
                        std::inserter(result, result.end()));
    return result;
}

// =============================================================================
// Lexical passes
// =============================================================================

std::string strip_sas_comments(const std::string& text) {
    std::string without_blocks;
    without_blocks.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("/*", pos);
        if (open == std::string::npos) {
            without_blocks.append(text, pos, std::string::npos);
            break;
        }
        without_blocks.append(text, pos, open - pos);
        size_t close = text.find("*/", open + 2);
        if (close == std::string::npos) {
            // Unterminated comment: keep the text as written
            without_blocks.append(text, open, std::string::npos);
            break;
        }
        without_blocks += ' ';
        pos = close + 2;
    }

    // "* remark ;" statements occupying a whole line
    std::string result;
    result.reserve(without_blocks.size());
    size_t line_start = 0;
    while (line_start <= without_blocks.size()) {
        size_t newline = without_blocks.find('\n', line_start);
        size_t line_end = newline == std::string::npos ? without_blocks.size() : newline;
        std::string line = without_blocks.substr(line_start, line_end - line_start);

        std::string trimmed = util::trim(line);
        bool remark = !trimmed.empty() && trimmed.front() == '*' && trimmed.back() == ';';
        if (!remark) result += line;

        if (newline == std::string::npos) break;
        result += '\n';
        line_start = newline + 1;
    }
    return result;
}

std::string blank_string_literals(const std::string& text) {
    std::string out = text;
    size_t i = 0;
    while (i < out.size()) {
        char quote = out[i];
        if (quote != '\'' && quote != '"') {
            ++i;
            continue;
        }

        size_t j = i + 1;
        while (j < out.size()) {
            if (out[j] == quote) {
                if (j + 1 < out.size() && out[j + 1] == quote) {
                    j += 2;
                    continue;
                }
                ++j;
                break;
            }
            ++j;
        }
        std::fill(out.begin() + static_cast<std::ptrdiff_t>(i),
                  out.begin() + static_cast<std::ptrdiff_t>(j), ' ');
        i = j;
    }
    return out;
}

std::vector<SasBlock> split_sas_blocks(const std::string& text) {
    std::vector<SasBlock> blocks;
    size_t cursor = 0;

    while (cursor < text.size()) {
        std::optional<SasBlock> next;
        size_t header_end = 0;

        for (size_t pos = cursor; pos < text.size() && !next; ++pos) {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos])));
            if (c != 'p' && c != 'd') continue;
            if (!at_statement_start(text, pos, cursor)) continue;

            SasBlock::Type type = c == 'p' ? SasBlock::Type::Sql : SasBlock::Type::Data;
            if (auto end = match_block_header(text, pos, type)) {
                next = SasBlock{type, pos, 0};
                header_end = *end;
            }
        }
        if (!next) break;

        const char* terminator = next->type == SasBlock::Type::Sql ? "quit" : "run";
        size_t end = find_block_end(text, header_end, terminator);
        next->end = end == std::string::npos ? text.size() : end;

        blocks.push_back(*next);
        cursor = next->end;
    }
    return blocks;
}

TableSet extract_clause_tables(const std::string& clause, const MacroEnv& env) {
    TableSet tables;
    std::string stripped = util::trim(clause);
    if (stripped.empty() || stripped.front() == '=') return tables;

    // Split on blanks, ',' and '/', skipping parenthesised dataset options
    std::vector<std::string> tokens;
    std::string current;
    int depth = 0;
    for (char c : clause) {
        if (c == '(') { ++depth; continue; }
        if (c == ')') { depth = std::max(0, depth - 1); continue; }
        if (depth > 0) continue;

        if (is_blank(c) || c == ',' || c == '/' || c == ';') {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
            if (c == ';') break;
            continue;
        }
        current += c;
    }
    if (!current.empty()) tokens.push_back(current);

    for (const auto& token : tokens) {
        if (is_reserved_word(util::to_lower(token))) continue;
        if (auto table = normalize_identifier(token, env)) {
            tables.insert(*table);
        }
    }
    return tables;
}

// =============================================================================
// Program analysis
// =============================================================================

SasTableUsage analyze_sas_program(const std::string& text) {
    std::string source = strip_sas_comments(text);
    std::vector<SasBlock> blocks = split_sas_blocks(source);

    SasTableUsage usage;
    MacroEnv env;
    size_t cursor = 0;

    for (const auto& block : blocks) {
        // %LET statements between the previous block and this one
        env = env.merged(env.evaluate_assignments(source.substr(cursor, block.start - cursor)));

        std::string raw_block = source.substr(block.start, block.end - block.start);
        MacroEnv::Bindings block_updates = env.evaluate_assignments(raw_block);
        MacroEnv local = env.merged(block_updates);

        std::string block_text = blank_string_literals(local.expand(raw_block));
        analyze_block(block_text, local, usage);

        env = local;
        cursor = block.end;
    }
    return usage;
}

SasMainChain infer_main_chain(const SasTableUsage& usage) {
    TableSet inputs = usage.inputs();
    TableSet intermediates = usage.intermediates();
    TableSet outputs = usage.outputs();

    SasMainChain chain;
    chain.source = pick_preferred(inputs, "udp_src.");
    chain.intermediate = pick_preferred(intermediates, "udpadms.");
    chain.target = pick_preferred(outputs.empty() ? intermediates : outputs, "ads_stg.");

    // A staging table that is read back is still the better target
    bool target_is_output = chain.target && outputs.count(*chain.target) > 0;
    if (!target_is_output) {
        TableSet staged;
        for (const auto& table : intermediates) {
            if (util::starts_with(table, "ads_stg.")) staged.insert(table);
        }
        if (!staged.empty()) chain.target = *staged.begin();
    }
    return chain;
}

// =============================================================================
// SasExtractor
// =============================================================================

TableSet SasExtractor::written_tables(const std::string& text) const {
    return analyze_sas_program(text).writes;
}

TableSet SasExtractor::read_tables(const std::string& text) const {
    return analyze_sas_program(text).inputs();
}

} // namespace lineage
