// =============================================================================
// tablelineage CLI - Table lineage over a folder of pipeline scripts
// =============================================================================
//
// Usage:
//   tablelineage [global options] <command> [options]
//
// Commands:
//   trace       Resolve every upstream path of the target tables to a CSV
//   map         List which tables each script writes
//   expand      Promote intermediate layers of a lineage CSV to targets
//   sas         Per-file input / intermediate / output report for SAS code
//   version     Show version information
//
// Examples:
//   tablelineage trace --root ./jobs --targets rpt_udp.rpt_non_financials
//   tablelineage trace --root ./jobs --targets-file targets.txt --expand-layers
//   tablelineage map --root ./jobs --out mapping.csv
//   tablelineage sas ./sas_jobs
//
// =============================================================================

#include <iostream>
#include <string>
#include <vector>
#include <cstring>
#include <filesystem>

#include "lineage/config.hpp"
#include "lineage/corpus.hpp"
#include "lineage/csv.hpp"
#include "lineage/error.hpp"
#include "lineage/logging.hpp"
#include "lineage/reports.hpp"
#include "lineage/tracer.hpp"
#include "lineage/util/text.hpp"

namespace fs = std::filesystem;

namespace lineage::cli {
    int cmd_trace(int argc, char* argv[]);
    int cmd_map(int argc, char* argv[]);
    int cmd_expand(int argc, char* argv[]);
    int cmd_sas(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define LINEAGE_VERSION_MAJOR 1
#define LINEAGE_VERSION_MINOR 0
#define LINEAGE_VERSION_PATCH 0
#define LINEAGE_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"trace",   "Resolve table lineage and write it as CSV", lineage::cli::cmd_trace},
    {"map",     "Write the script -> target table mapping", lineage::cli::cmd_map},
    {"expand",  "Promote intermediate layers of a lineage CSV to targets", lineage::cli::cmd_expand},
    {"sas",     "Report SAS input / intermediate / output tables", lineage::cli::cmd_sas},
    {"version", "Show version information", lineage::cli::cmd_version},
    {"help",    "Show this help message", lineage::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace {

size_t parse_count(const std::string& option, const std::string& value) {
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used == value.size() && parsed >= 0) {
            return static_cast<size_t>(parsed);
        }
    } catch (const std::exception&) {
        // reported below
    }
    throw lineage::InvalidArgumentError("Option " + option + " expects a non-negative integer, got '" +
                                        value + "'");
}

// Value of "--name value"; throws when the value is missing
std::string take_value(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw lineage::InvalidArgumentError(std::string("Option ") + argv[i] + " expects a value");
    }
    return argv[++i];
}

void apply_verbosity() {
    if (g_options.verbose) {
        lineage::set_log_level(lineage::LogLevel::DEBUG);
    } else if (g_options.quiet) {
        lineage::set_log_level(lineage::LogLevel::WARN);
    }
}

} // namespace

// =============================================================================
// Help Command
// =============================================================================

namespace lineage::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "tablelineage - Table lineage for data-pipeline scripts\n";
    std::cout << "Version " << LINEAGE_VERSION_STRING << "\n\n";
    std::cout << "Usage: tablelineage [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     key=value configuration file\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Warnings and errors only\n";
    std::cout << "\nTrace Options:\n";
    std::cout << "  --root <dir>            Folder holding the scripts (required)\n";
    std::cout << "  --targets <a,b,...>     Target tables (schema.table or bare name)\n";
    std::cout << "  --targets-file <file>   One target per line\n";
    std::cout << "  --out <file>            Output CSV (default: lineage.csv)\n";
    std::cout << "  --max-paths <n>         Stop a target after n paths\n";
    std::cout << "  --max-depth <n>         Cut paths longer than n tables\n";
    std::cout << "  --time-budget-ms <n>    Stop a target after n milliseconds\n";
    std::cout << "  --threads <n>           Worker threads (0 = all cores)\n";
    std::cout << "  --policy <name>         union | intersection for multi-writer tables\n";
    std::cout << "  --expand-layers         Also emit rows for every intermediate layer\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  LINEAGE_EXTENSIONS      Comma-separated file extensions (.py,.sql,.sas)\n";
    std::cout << "  LINEAGE_MAX_PATHS       Default for --max-paths\n";
    std::cout << "  LINEAGE_MAX_DEPTH       Default for --max-depth\n";
    std::cout << "  LINEAGE_LOG_LEVEL       debug | info | warn | error | off\n";
    std::cout << "\nExamples:\n";
    std::cout << "  tablelineage trace --root ./jobs --targets rpt_udp.rpt_non_financials\n";
    std::cout << "  tablelineage expand --input lineage.csv\n";
    std::cout << "  tablelineage sas ./sas_jobs\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "tablelineage " << LINEAGE_VERSION_STRING << "\n";
    std::cout << "Dialects: pipeline (.py, .sql), view (.sql), sas (.sas)\n";
    return 0;
}

// =============================================================================
// Trace Command
// =============================================================================

int cmd_trace(int argc, char* argv[]) {
    Config& config = Config::getInstance();

    std::string root;
    std::vector<std::string> targets;
    std::string out = config.get<std::string>("output.path", "lineage.csv");
    bool expand_layers = false;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--root") {
            root = take_value(argc, argv, i);
        } else if (arg == "--targets") {
            for (auto& name : util::split_list(take_value(argc, argv, i))) targets.push_back(name);
        } else if (arg == "--targets-file") {
            for (auto& name : read_targets_file(take_value(argc, argv, i))) targets.push_back(name);
        } else if (arg == "--out") {
            out = take_value(argc, argv, i);
        } else if (arg == "--max-paths") {
            config.set("budget.max_paths", std::to_string(parse_count(arg, take_value(argc, argv, i))));
        } else if (arg == "--max-depth") {
            config.set("budget.max_depth", std::to_string(parse_count(arg, take_value(argc, argv, i))));
        } else if (arg == "--time-budget-ms") {
            config.set("budget.time_ms", std::to_string(parse_count(arg, take_value(argc, argv, i))));
        } else if (arg == "--threads") {
            config.set("perf.max_threads", std::to_string(parse_count(arg, take_value(argc, argv, i))));
        } else if (arg == "--policy") {
            config.set("writers.policy", take_value(argc, argv, i));
        } else if (arg == "--expand-layers") {
            expand_layers = true;
        } else {
            std::cerr << "Unknown trace option: " << arg << "\n";
            return 1;
        }
    }

    if (root.empty()) {
        std::cerr << "Usage: tablelineage trace --root <dir> --targets <a,b> [options]\n";
        std::cerr << "Run 'tablelineage help' for all options.\n";
        return 1;
    }

    TraceOptions options = TraceOptions::from_config(config);
    if (options.limits.max_paths == 0 || options.limits.max_depth == 0) {
        std::cerr << "--max-paths and --max-depth must be at least 1\n";
        return 1;
    }
    options.root = root;
    options.targets = targets;
    options.expand_layers = expand_layers;

    LineageTracer tracer(std::move(options));
    TraceReport report = tracer.run();
    write_lineage_csv(report.table, fs::path(out));

    if (!g_options.quiet) {
        std::cout << "Wrote " << report.table.size() << " rows for " << report.targets.size()
                  << " target(s) to " << out << "\n";
        if (size_t truncated = report.truncated_targets()) {
            std::cout << truncated << " target(s) truncated by the enumeration budget\n";
        }
    }
    return 0;
}

// =============================================================================
// Map Command
// =============================================================================

int cmd_map(int argc, char* argv[]) {
    Config& config = Config::getInstance();

    std::string root;
    std::string out = "script_target_mapping.csv";

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--root") {
            root = take_value(argc, argv, i);
        } else if (arg == "--out") {
            out = take_value(argc, argv, i);
        } else {
            std::cerr << "Unknown map option: " << arg << "\n";
            return 1;
        }
    }

    if (root.empty()) {
        std::cerr << "Usage: tablelineage map --root <dir> [--out script_target_mapping.csv]\n";
        return 1;
    }

    auto extensions = util::split_list(config.get<std::string>("corpus.extensions", ".py,.sql,.sas"));
    Corpus corpus = Corpus::load(root, extensions);
    ExtractorRegistry registry = ExtractorRegistry::with_default_dialects();

    auto mapping = build_script_target_mapping(corpus, registry);
    write_script_target_csv(mapping, fs::path(out));

    if (!g_options.quiet) {
        std::cout << "Wrote " << mapping.size() << " script/target pairs to " << out << "\n";
    }
    return 0;
}

// =============================================================================
// Expand Command
// =============================================================================

int cmd_expand(int argc, char* argv[]) {
    std::string input;
    std::string output;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" || arg == "-i") {
            input = take_value(argc, argv, i);
        } else if (arg == "--output" || arg == "-o") {
            output = take_value(argc, argv, i);
        } else if (arg[0] != '-' && input.empty()) {
            input = arg;
        } else {
            std::cerr << "Unknown expand option: " << arg << "\n";
            return 1;
        }
    }

    if (input.empty()) {
        std::cerr << "Usage: tablelineage expand --input <lineage.csv> [--output <file>]\n";
        return 1;
    }
    if (output.empty()) {
        fs::path in_path(input);
        output = (in_path.parent_path() / (in_path.stem().string() + "_expanded.csv")).string();
    }

    LineageTable table = read_lineage_csv(fs::path(input));
    LineageTable expanded = promote_layers(table);
    write_lineage_csv(expanded, fs::path(output));

    if (!g_options.quiet) {
        std::cout << "Expanded " << table.size() << " rows to " << expanded.size()
                  << " in " << output << "\n";
    }
    return 0;
}

// =============================================================================
// SAS Command
// =============================================================================

int cmd_sas(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: tablelineage sas <root>\n";
        return 1;
    }

    std::vector<SasFileReport> reports;
    try {
        reports = build_sas_report(Corpus::load(argv[0], {".sas"}));
    } catch (const CorpusError& e) {
        if (e.code() != ErrorCode::EMPTY_CORPUS) throw;
    }

    print_sas_report(reports, std::cout);
    return 0;
}

}  // namespace lineage::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    // Shift argv to point to command
    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        lineage::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    if (!lineage::init_config(g_options.config_file)) {
        std::cerr << "Invalid configuration, see the log above.\n";
        return 1;
    }
    apply_verbosity();

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) != 0) continue;

        try {
            return cmd->handler(argc, argv);
        } catch (const lineage::LineageException& e) {
            std::cerr << e.what() << "\n";
            return lineage::exit_status(e.code());
        } catch (const std::exception& e) {
            std::cerr << "Unexpected error: " << e.what() << "\n";
            return 2;
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'tablelineage help' for usage.\n";
    return 1;
}
