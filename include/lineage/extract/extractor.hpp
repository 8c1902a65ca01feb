/**
 * Dialect extractors
 * ==================
 *
 * An extractor reads the text of one script and reports which tables it
 * writes and which it reads. Extractors are stateless: the same text always
 * yields the same sets, so files can be processed on any thread.
 *
 * The registry decides which extractors see which files (by extension) and
 * which extractor computes the upstream set of a writer (by writer kind).
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "lineage/types.hpp"

namespace lineage {

class TableExtractor {
public:
    virtual ~TableExtractor() = default;

    virtual WriterKind kind() const = 0;
    virtual std::string name() const = 0;

    // Canonical names of tables this script produces (index keys)
    virtual TableSet written_tables(const std::string& text) const = 0;

    // Canonical names of tables this script consumes (upstreams)
    virtual TableSet read_tables(const std::string& text) const = 0;

    // Tables reported in the script -> target mapping; may include bare names
    virtual TableSet declared_targets(const std::string& text) const {
        return written_tables(text);
    }
};

class ExtractorRegistry {
public:
    ExtractorRegistry() = default;
    ExtractorRegistry(ExtractorRegistry&&) = default;
    ExtractorRegistry& operator=(ExtractorRegistry&&) = default;
    ExtractorRegistry(const ExtractorRegistry&) = delete;
    ExtractorRegistry& operator=(const ExtractorRegistry&) = delete;

    // .py -> pipeline; .sql -> pipeline + view; .sas -> SAS
    static ExtractorRegistry with_default_dialects();

    // Takes ownership; the first extractor registered for a kind answers
    // read_tables for writers of that kind.
    void register_extractor(std::unique_ptr<TableExtractor> extractor,
                            const std::vector<std::string>& extensions);

    // Extension match is case-insensitive, with or without the leading dot
    std::vector<const TableExtractor*> for_extension(const std::string& extension) const;
    std::vector<const TableExtractor*> for_file(const std::filesystem::path& path) const;

    const TableExtractor* for_kind(WriterKind kind) const;

    std::vector<std::string> extensions() const;

private:
    static std::string normalize_extension(const std::string& extension);

    std::vector<std::unique_ptr<TableExtractor>> owned_;
    std::map<std::string, std::vector<const TableExtractor*>> by_extension_;
    std::map<WriterKind, const TableExtractor*> by_kind_;
};

} // namespace lineage
