// =============================================================================
// corpus.hpp - The set of script files a run analyses
// =============================================================================
// Files are discovered once, read once and kept in memory together with a
// lower-cased copy used for textual candidate filtering. The corpus is
// immutable after load() and safe to share between threads.
// =============================================================================

#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace lineage {

class ThreadPool;

// Regular files under root whose extension (case-insensitive) is in
// extensions, sorted by path. Hidden directories are skipped.
// Throws CorpusError(CORPUS_NOT_FOUND) when root is not a directory.
std::vector<std::filesystem::path> list_source_files(const std::filesystem::path& root,
                                                     const std::vector<std::string>& extensions);

class Corpus {
public:
    struct File {
        std::filesystem::path path;
        std::string text;
        std::string lowered;
    };

    Corpus() = default;
    explicit Corpus(std::filesystem::path root) : root_(std::move(root)) {}

    // Discover and read every source file. Unreadable files are skipped with
    // a warning. Throws CorpusError when the root is missing or yields no
    // readable files.
    static Corpus load(const std::filesystem::path& root,
                       const std::vector<std::string>& extensions,
                       ThreadPool* pool = nullptr);

    void add(const std::filesystem::path& path, std::string text);

    const std::vector<File>& files() const { return files_; }
    const File* find(const std::filesystem::path& path) const;

    const std::filesystem::path& root() const { return root_; }
    size_t size() const { return files_.size(); }
    bool empty() const { return files_.empty(); }
    size_t skipped() const { return skipped_; }

    // Path relative to the corpus root with '/' separators
    std::string relative_path(const std::filesystem::path& path) const;

private:
    std::filesystem::path root_;
    std::vector<File> files_;
    std::unordered_map<std::string, size_t> by_path_;
    size_t skipped_ = 0;
};

} // namespace lineage
