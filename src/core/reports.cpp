#include "lineage/reports.hpp"
#include "lineage/csv.hpp"
#include "lineage/error.hpp"
#include "lineage/logging.hpp"
#include "lineage/util/text.hpp"

#include <algorithm>
#include <fstream>
#include <map>
#include <ostream>
#include <set>
#include <tuple>

namespace lineage {

LineageTable promote_layers(const LineageTable& table) {
    // Rows grouped by target: input targets in input order, then promoted
    // layers in the order they were first reached
    std::vector<std::string> order;
    std::map<std::string, std::vector<LineageRow>> groups;

    // Only tables that were targets of the input are exempt from promotion
    std::set<std::string> input_targets;
    for (const auto& row : table.rows()) {
        if (row.target.empty()) continue;
        std::string key = util::to_lower(row.target);
        if (input_targets.insert(key).second) {
            order.push_back(key);
            groups.try_emplace(key);
        }
    }

    auto add_row = [&](LineageRow row) {
        std::string key = util::to_lower(row.target);
        auto [it, inserted] = groups.try_emplace(key);
        if (inserted) order.push_back(key);
        it->second.push_back(std::move(row));
    };

    size_t promoted = 0;
    for (const auto& row : table.rows()) {
        if (row.target.empty()) continue;
        add_row(row);

        for (size_t i = 0; i < row.layers.size(); ++i) {
            const std::string& layer = row.layers[i];
            if (layer.empty()) continue;
            if (input_targets.count(util::to_lower(layer)) > 0) {
                LOG_DEBUG("Layer '", layer, "' is already a target, not promoting");
                continue;
            }

            LineageRow promoted_row;
            promoted_row.target = layer;
            for (size_t j = i + 1; j < row.layers.size(); ++j) {
                if (!row.layers[j].empty()) promoted_row.layers.push_back(row.layers[j]);
            }
            promoted_row.source = row.source;

            add_row(std::move(promoted_row));
            ++promoted;
        }
    }

    LineageTable expanded;
    expanded.reserve_layers(table.layer_count());
    std::set<std::tuple<std::string, std::vector<std::string>, std::string>> seen;
    size_t duplicates = 0;
    for (const auto& key : order) {
        for (const auto& row : groups[key]) {
            if (!seen.emplace(row.target, row.layers, row.source).second) {
                ++duplicates;
                continue;
            }
            expanded.append(row);
        }
    }

    LOG_INFO("Layer promotion added ", promoted, " rows, dropped ", duplicates, " duplicates (",
             expanded.size(), " total)");
    return expanded;
}

std::vector<ScriptTarget> build_script_target_mapping(const Corpus& corpus,
                                                      const ExtractorRegistry& registry) {
    std::set<ScriptTarget> mapping;
    for (const auto& file : corpus.files()) {
        std::string script = corpus.relative_path(file.path);
        for (const TableExtractor* extractor : registry.for_file(file.path)) {
            for (const auto& table : extractor->declared_targets(file.text)) {
                mapping.insert(ScriptTarget{script, table});
            }
        }
    }
    return std::vector<ScriptTarget>(mapping.begin(), mapping.end());
}

void write_script_target_csv(const std::vector<ScriptTarget>& mapping, std::ostream& out) {
    write_csv_record(out, std::vector<std::string>{"script name", "target table"});
    for (const auto& entry : mapping) {
        write_csv_record(out, std::vector<std::string>{entry.script, entry.table});
    }
}

void write_script_target_csv(const std::vector<ScriptTarget>& mapping,
                             const std::filesystem::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError(ErrorCode::OUTPUT_FAILED, "Cannot open output file " + path.string(), __func__);
    }
    write_script_target_csv(mapping, out);
    out.flush();
    if (!out) {
        throw IOError(ErrorCode::OUTPUT_FAILED, "Failed writing output file " + path.string(), __func__);
    }
    LOG_INFO("Wrote ", mapping.size(), " script/target pairs to ", path.string());
}

std::vector<SasFileReport> build_sas_report(const Corpus& corpus) {
    std::vector<SasFileReport> reports;
    for (const auto& file : corpus.files()) {
        if (util::to_lower(file.path.extension().string()) != ".sas") continue;

        SasFileReport report;
        report.script = corpus.relative_path(file.path);
        report.usage = analyze_sas_program(file.text);
        report.chain = infer_main_chain(report.usage);
        reports.push_back(std::move(report));
    }
    std::sort(reports.begin(), reports.end(),
              [](const SasFileReport& a, const SasFileReport& b) { return a.script < b.script; });
    return reports;
}

namespace {

void print_table_list(std::ostream& out, const char* title, const TableSet& tables) {
    out << title << ":\n";
    if (tables.empty()) {
        out << "    (none)\n";
        return;
    }
    for (const auto& table : tables) {
        out << "    - " << table << "\n";
    }
}

} // namespace

void print_sas_report(const std::vector<SasFileReport>& reports, std::ostream& out) {
    if (reports.empty()) {
        out << "No SAS files found.\n";
        return;
    }

    for (const auto& report : reports) {
        out << "=== " << report.script << " ===\n";
        print_table_list(out, "Input Tables", report.usage.inputs());
        print_table_list(out, "Intermediate Tables", report.usage.intermediates());
        print_table_list(out, "Output Tables", report.usage.outputs());

        out << "Main Chain (best effort):\n";
        out << "    Source:       " << report.chain.source.value_or("(unknown)") << "\n";
        out << "    Intermediate: " << report.chain.intermediate.value_or("(unknown)") << "\n";
        out << "    Target:       " << report.chain.target.value_or("(unknown)") << "\n";
        out << "\n";
    }
}

} // namespace lineage
