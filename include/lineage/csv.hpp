// =============================================================================
// csv.hpp - RFC 4180 CSV for lineage tables and reports
// =============================================================================
// Fields containing a comma, a quote or a line break are quoted, quotes are
// doubled and records end with CRLF. Unset cells are written as empty
// fields. The reader accepts CRLF or LF and quoted line breaks.
// =============================================================================

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "lineage/row_shaper.hpp"

namespace lineage {

using CsvRecord = std::vector<std::string>;

std::string csv_escape(const std::string& field);

void write_csv_record(std::ostream& out, const std::vector<std::string>& fields);
void write_csv_record(std::ostream& out, const std::vector<std::optional<std::string>>& fields);

std::vector<CsvRecord> parse_csv(std::istream& in);

void write_lineage_csv(const LineageTable& table, std::ostream& out);

// Creates missing parent directories. Throws IOError(OUTPUT_FAILED) when the
// file cannot be written
void write_lineage_csv(const LineageTable& table, const std::filesystem::path& path);

// Throws IOError(FILE_NOT_FOUND) or LineageException(MALFORMED_INPUT) when
// the header lacks "Target Table" or "Source Table"
LineageTable read_lineage_csv(std::istream& in);
LineageTable read_lineage_csv(const std::filesystem::path& path);

} // namespace lineage
