// =============================================================================
// table_name.hpp - Canonical table identities (FQTN keys)
// =============================================================================
// Every table name used as an index key, a graph node or a set member goes
// through these helpers first. Qualified names become "schema.table" in lower
// case; bare names stay bare and are never merged with a qualified name.
// =============================================================================

#pragma once

#include <optional>
#include <string>

namespace lineage {

// Canonical key for a table token taken from source text, or nullopt when the
// token cannot be confidently read as a table (keyword, single letter, numeral,
// unresolved &macro / %func placeholder, _NULL_). Dataset options such as
// "(drop=x)" or "/ view=v" and trailing ';' ',' '.' are stripped first.
std::optional<std::string> canonical_table_name(const std::string& token);

// Lower-cased "schema.table"
std::string to_fqtn(const std::string& schema, const std::string& table);

// Trim and lower-case a user supplied name without rejecting anything
std::string normalize_name(const std::string& name);

bool is_qualified(const std::string& name);

// "schema.table" -> "table", bare names unchanged
std::string table_part(const std::string& name);

// "schema.table" -> "schema", bare names -> ""
std::string schema_part(const std::string& name);

// SQL / SAS words that are never table names (expects lower case)
bool is_reserved_word(const std::string& word);

} // namespace lineage
