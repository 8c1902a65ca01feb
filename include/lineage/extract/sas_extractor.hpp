// =============================================================================
// sas_extractor.hpp - SAS programs
// =============================================================================
// A program is split into PROC SQL ... QUIT; and DATA ... RUN; blocks. %LET
// statements between and inside blocks are evaluated in program order, macro
// references are expanded per block, and table references are collected from
// CREATE TABLE / INSERT INTO / DATA (writes), FROM / JOIN / SET / DELETE FROM
// (reads), OUT= / BASE= / DATA= options and the SYSLAST / _INPUTn / _OUTPUTn
// macro variables.
// =============================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "lineage/extract/extractor.hpp"
#include "lineage/extract/macro_env.hpp"

namespace lineage {

// Every table one SAS program reads and writes
struct SasTableUsage {
    TableSet reads;
    TableSet writes;

    // Read but never written: the program's true upstreams
    TableSet inputs() const;
    // Both read and written
    TableSet intermediates() const;
    // Written but never read back
    TableSet outputs() const;
};

// Source / intermediate / target guess for the program's primary flow
struct SasMainChain {
    std::optional<std::string> source;
    std::optional<std::string> intermediate;
    std::optional<std::string> target;
};

struct SasBlock {
    enum class Type { Sql, Data };

    Type type = Type::Sql;
    size_t start = 0;   // offset of the block keyword
    size_t end = 0;     // one past QUIT; / RUN; (or end of text)
};

class SasExtractor : public TableExtractor {
public:
    WriterKind kind() const override { return WriterKind::SasProgram; }
    std::string name() const override { return "sas"; }

    // Every table written anywhere in the program
    TableSet written_tables(const std::string& text) const override;
    // Tables read and never written by the same program
    TableSet read_tables(const std::string& text) const override;
};

SasTableUsage analyze_sas_program(const std::string& text);

// Prefers udp_src. inputs, udpadms. intermediates and ads_stg. outputs
SasMainChain infer_main_chain(const SasTableUsage& usage);

// Block comments and "* ... ;" comment statements replaced by blanks
std::string strip_sas_comments(const std::string& text);

// Quoted literals blanked ('' and "" inside a literal are escapes)
std::string blank_string_literals(const std::string& text);

std::vector<SasBlock> split_sas_blocks(const std::string& text);

// Table names from a DATA / SET clause, ignoring dataset options
TableSet extract_clause_tables(const std::string& clause, const MacroEnv& env);

} // namespace lineage
