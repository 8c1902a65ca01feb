#include "lineage/writer_index.hpp"
#include "lineage/logging.hpp"
#include "lineage/table_name.hpp"
#include "lineage/thread_pool.hpp"
#include "lineage/util/text.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace lineage {

WriterIndex::WriterIndex(const Corpus& corpus, const ExtractorRegistry& registry)
    : corpus_(corpus), registry_(registry) {}

void WriterIndex::build(ThreadPool* pool) {
    auto start = std::chrono::steady_clock::now();
    const auto& files = corpus_.files();

    // One slot per file so workers never share a container
    std::vector<std::vector<std::pair<std::string, Writer>>> found(files.size());

    auto extract_file = [&](size_t i) {
        const Corpus::File& file = files[i];
        for (const TableExtractor* extractor : registry_.for_file(file.path)) {
            for (const auto& table : extractor->written_tables(file.text)) {
                found[i].emplace_back(table, Writer{file.path.string(), extractor->kind()});
            }
        }
    };

    if (pool) {
        pool->parallel_for(0, files.size(), extract_file);
    } else {
        for (size_t i = 0; i < files.size(); ++i) extract_file(i);
    }

    size_t entries = 0;
    for (const auto& slot : found) {
        for (const auto& [table, writer] : slot) {
            add(table, writer);
            ++entries;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    LOG_INFO("Indexed ", index_.size(), " tables (", entries, " writer entries) from ",
             files.size(), " files in ", elapsed, " ms");
}

void WriterIndex::add(const std::string& table, const Writer& writer) {
    index_[table].insert(writer);
}

std::vector<Writer> WriterIndex::indexed_writers(const std::string& table) const {
    auto it = index_.find(normalize_name(table));
    if (it == index_.end()) return {};
    return std::vector<Writer>(it->second.begin(), it->second.end());
}

std::vector<const Corpus::File*> WriterIndex::candidate_files(const std::string& table) const {
    std::vector<const Corpus::File*> candidates;
    for (const auto& file : corpus_.files()) {
        if (util::contains_word(file.lowered, table)) {
            candidates.push_back(&file);
        }
    }
    return candidates;
}

std::vector<Writer> WriterIndex::extract_writers(const Corpus::File& file, const std::string& table) const {
    std::vector<Writer> writers;
    for (const TableExtractor* extractor : registry_.for_file(file.path)) {
        if (extractor->written_tables(file.text).count(table) > 0) {
            writers.push_back(Writer{file.path.string(), extractor->kind()});
        }
    }
    return writers;
}

// SAS targets may be spelled through macro variables (data &lib..out;), so
// the raw text never names them. Re-extracting the file expands the macros.
bool WriterIndex::confirms_expanded(const Writer& writer, const std::string& table) const {
    if (writer.kind != WriterKind::SasProgram) return false;

    const Corpus::File* file = corpus_.find(writer.path);
    const TableExtractor* extractor = registry_.for_kind(writer.kind);
    if (!file || !extractor) return false;

    if (extractor->written_tables(file->text).count(table) == 0) return false;
    LOG_DEBUG("Table '", table, "': confirmed macro-expanded writer ", writer.path);
    return true;
}

std::vector<Writer> WriterIndex::writers_for(const std::string& table) const {
    const std::string key = normalize_name(table);
    std::vector<const Corpus::File*> candidates = candidate_files(key);
    LOG_DEBUG("Table '", key, "': ", candidates.size(), " candidate files");

    std::set<std::string> candidate_paths;
    for (const auto* file : candidates) {
        candidate_paths.insert(file->path.string());
    }

    std::set<Writer> confirmed;
    auto it = index_.find(key);
    if (it != index_.end()) {
        for (const auto& writer : it->second) {
            if (candidate_paths.count(writer.path) > 0 || confirms_expanded(writer, key)) {
                confirmed.insert(writer);
            }
        }
    }

    // Nothing indexed survives: parse the candidates directly
    if (confirmed.empty()) {
        for (const auto* file : candidates) {
            for (const auto& writer : extract_writers(*file, key)) {
                confirmed.insert(writer);
            }
        }
        if (!confirmed.empty()) {
            LOG_DEBUG("Table '", key, "': ", confirmed.size(), " writer(s) found by fallback scan");
        }
    }

    LOG_DEBUG("Table '", key, "': ", confirmed.size(), " confirmed writer(s)");
    return std::vector<Writer>(confirmed.begin(), confirmed.end());
}

std::vector<std::string> WriterIndex::keys() const {
    std::vector<std::string> result;
    result.reserve(index_.size());
    for (const auto& [table, writers] : index_) {
        result.push_back(table);
    }
    return result;
}

std::vector<std::string> WriterIndex::expand_bare_name(const std::string& bare) const {
    const std::string suffix = "." + normalize_name(bare);
    std::vector<std::string> matches;
    for (const auto& [table, writers] : index_) {
        if (util::ends_with(table, suffix)) {
            matches.push_back(table);
        }
    }
    return matches;
}

} // namespace lineage
