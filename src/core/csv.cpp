#include "lineage/csv.hpp"
#include "lineage/error.hpp"
#include "lineage/logging.hpp"
#include "lineage/util/text.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <map>
#include <regex>
#include <system_error>

namespace lineage {

namespace {

constexpr const char* kRecordEnd = "\r\n";

const std::regex& layer_column_re() {
    static const std::regex re(R"(^Layer\s+(\d+)$)");
    return re;
}

} // namespace

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void write_csv_record(std::ostream& out, const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out << ',';
        out << csv_escape(fields[i]);
    }
    out << kRecordEnd;
}

void write_csv_record(std::ostream& out, const std::vector<std::optional<std::string>>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out << ',';
        if (fields[i]) out << csv_escape(*fields[i]);
    }
    out << kRecordEnd;
}

std::vector<CsvRecord> parse_csv(std::istream& in) {
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (data.size() >= 3 && data.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        data.erase(0, 3);
    }

    std::vector<CsvRecord> records;
    CsvRecord record;
    std::string field;
    bool in_quotes = false;
    bool record_started = false;

    auto end_record = [&]() {
        record.push_back(std::move(field));
        field.clear();
        records.push_back(std::move(record));
        record.clear();
        record_started = false;
    };

    for (size_t i = 0; i < data.size(); ++i) {
        char c = data[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < data.size() && data[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                record_started = true;
                break;
            case ',':
                record.push_back(std::move(field));
                field.clear();
                record_started = true;
                break;
            case '\r':
                if (i + 1 < data.size() && data[i + 1] == '\n') ++i;
                end_record();
                break;
            case '\n':
                end_record();
                break;
            default:
                field += c;
                record_started = true;
                break;
        }
    }
    if (record_started || !field.empty()) {
        end_record();
    }
    return records;
}

void write_lineage_csv(const LineageTable& table, std::ostream& out) {
    write_csv_record(out, table.column_names());
    for (size_t i = 0; i < table.size(); ++i) {
        write_csv_record(out, table.record(i));
    }
}

void write_lineage_csv(const LineageTable& table, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError(ErrorCode::OUTPUT_FAILED, "Cannot create directory " +
                          path.parent_path().string() + ": " + ec.message(), __func__);
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError(ErrorCode::OUTPUT_FAILED, "Cannot open output file " + path.string(), __func__);
    }

    write_lineage_csv(table, out);
    out.flush();
    if (!out) {
        throw IOError(ErrorCode::OUTPUT_FAILED, "Failed writing output file " + path.string(), __func__);
    }
    LOG_INFO("Wrote ", table.size(), " rows (", table.layer_count(), " layer columns) to ", path.string());
}

LineageTable read_lineage_csv(std::istream& in) {
    std::vector<CsvRecord> records = parse_csv(in);
    if (records.empty()) {
        throw LineageException(ErrorCode::MALFORMED_INPUT, "Lineage CSV is empty", __func__);
    }

    const CsvRecord& header = records.front();
    std::optional<size_t> target_col;
    std::optional<size_t> source_col;
    std::map<int, size_t> layer_cols;   // layer number -> column

    for (size_t col = 0; col < header.size(); ++col) {
        std::string name = util::trim(header[col]);
        if (name == "Target Table") {
            target_col = col;
        } else if (name == "Source Table") {
            source_col = col;
        } else if (std::smatch match; std::regex_match(name, match, layer_column_re())) {
            try {
                layer_cols[std::stoi(match[1].str())] = col;
            } catch (const std::exception&) {
                LOG_WARN("Ignoring column '", name, "' in lineage CSV");
            }
        } else if (util::starts_with(name, "Layer")) {
            LOG_WARN("Ignoring column '", name, "' in lineage CSV");
        }
    }

    if (!target_col || !source_col) {
        throw LineageException(ErrorCode::MALFORMED_INPUT,
                               "Lineage CSV needs 'Target Table' and 'Source Table' columns",
                               __func__);
    }

    auto cell = [](const CsvRecord& record, size_t col) -> std::string {
        return col < record.size() ? util::trim(record[col]) : std::string();
    };

    LineageTable table;
    table.reserve_layers(layer_cols.size());
    for (size_t r = 1; r < records.size(); ++r) {
        const CsvRecord& record = records[r];
        if (record.size() == 1 && util::trim(record[0]).empty()) continue;

        LineageRow row;
        row.target = cell(record, *target_col);
        row.source = cell(record, *source_col);
        for (const auto& [number, col] : layer_cols) {
            std::string layer = cell(record, col);
            if (layer.empty()) continue;
            row.layers.push_back(std::move(layer));
        }
        table.append(row);
    }
    return table;
}

LineageTable read_lineage_csv(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError(ErrorCode::FILE_NOT_FOUND, "Cannot open lineage CSV " + path.string(), __func__);
    }
    return read_lineage_csv(in);
}

} // namespace lineage
